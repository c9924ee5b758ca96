#ifndef __HOGWILD_HPP__
#define __HOGWILD_HPP__

#include <random>
#include <omp.h>
#include <stdio.h>
#include <vector>

#include "../elements.hpp"
#include "../graph.hpp"
#include "../hyperparameters.hpp"
#include "../parameter.hpp"
#include "../problem.hpp"
#include "solver.hpp"

// Seed of the random stream used by training shard `partition`.
inline unsigned worker_seed(unsigned seed, int partition) {
  return seed + 1u + (unsigned)partition;
}

// Lock-free parallel SGD. The training data is cut into one contiguous shard
// per thread (the remainder past n_threads * shard size is dropped); every
// shard runs all epochs on its own and writes into the shared tables.
class SolverHogwild : public Solver {
  protected:
    int      minibatch_size;
    float    learning_rate;
    unsigned seed;
    bool     verbose;

    double solve_partition(const Problem&, ModelData&, int, size_t) const;

  public:
    SolverHogwild(const Hyperparameters& hyper, int m_it)
      : Solver(m_it, hyper.num_threads()), minibatch_size(hyper.minibatch_size()),
        learning_rate(hyper.learning_rate()), seed(hyper.seed()), verbose(hyper.verbose()) {}

    float solve(const Problem&, ModelData&);
};

// Sum over the minibatches of one shard, divided by max_iter * shard size.
// A trailing window shorter than minibatch_size is skipped.
inline double SolverHogwild::solve_partition(const Problem& prob, ModelData& data, int partition, size_t chunk_size) const {
  PairwiseLoss loss(data.user_embedding, data.item_embedding, data.item_biases, minibatch_size);
  SGD optimizer(learning_rate);

  std::mt19937 gen(worker_seed(seed, partition));
  std::uniform_int_distribution<int> negative_item(0, prob.n_items-1);

  size_t start = partition * chunk_size;
  size_t stop  = start + chunk_size;

  double loss_value = 0.;

  for(int iter=0; iter<max_iter; ++iter) {
    for(size_t i=start; i+(size_t)minibatch_size<=stop; i+=minibatch_size) {
      for(int b=0; b<minibatch_size; ++b) {
        const UnweightedInteraction& datum = prob.train[i+b];
        loss.user_idx[b]     = datum.user_id();
        loss.positive_idx[b] = datum.item_id();
        // may coincide with a positive of this user
        loss.negative_idx[b] = negative_item(gen);
      }

      loss_value += loss.forward();
      loss.backward(1.f);

      optimizer.step(loss);
      loss.zero_gradient();
    }
  }

  return loss_value / ((double)max_iter * (double)chunk_size);
}

// Shard losses are summed, not averaged, so the result grows with n_threads.
inline float SolverHogwild::solve(const Problem& prob, ModelData& data) {
  n_train = (int)prob.train.size();

  size_t chunk_size = prob.train.size() / n_threads;

  if (verbose) printf("Hogwild SGD with %d threads, %d of %d interactions per shard.. \n", n_threads, (int)chunk_size, n_train);

  double time = omp_get_wtime();
  double loss = 0.;

  #pragma omp parallel for num_threads(n_threads) schedule(static,1) reduction(+ : loss)
  for(int partition=0; partition<n_threads; ++partition) {
    if (chunk_size == 0) continue;
    loss += solve_partition(prob, data, partition, chunk_size);
  }

  time = omp_get_wtime() - time;
  if (verbose) printf("%d epochs, %f sec, loss %f\n", max_iter, time, loss);

  return (float)loss;
}

#endif
