#ifndef __SOLVER_HPP__
#define __SOLVER_HPP__

#include <omp.h>

#include "../parameter.hpp"
#include "../problem.hpp"

class Solver {

protected:
  int             n_train;

  int             max_iter;

  int             n_threads;

public:
  Solver(int m_it, int n_th) : n_train(0), max_iter(m_it), n_threads(n_th > 0 ? n_th : omp_get_max_threads()) {}
  virtual ~Solver() {}

  // Runs max_iter epochs over prob.train, updating the tables in place.
  // Returns the training loss.
  virtual float solve(const Problem&, ModelData&) = 0;
};

#endif
