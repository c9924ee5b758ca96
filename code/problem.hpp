#ifndef __PROBLEM_HPP__
#define __PROBLEM_HPP__

#include <stdio.h>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "elements.hpp"
#include "errors.hpp"
#include "interactions.hpp"

// Training slice handed to a solver: the interactions in input order plus the
// dimensions they span.
class Problem {
  public:
    int n_users, n_items;
    std::vector<UnweightedInteraction> train;

    Problem() : n_users(0), n_items(0) {}

    template <typename T>
    void set_interactions(const std::vector<T>&);
    void read_data(const std::string&);
};

template <typename T>
void Problem::set_interactions(const std::vector<T>& interactions) {
  std::pair<int,int> dims = get_dimensions(interactions);
  n_users = dims.first;
  n_items = dims.second;

  train.clear();
  train.reserve(interactions.size());
  for(size_t i=0; i<interactions.size(); ++i)
    train.push_back(UnweightedInteraction(interactions[i].user_id(), interactions[i].item_id()));
}

// Whitespace separated "user item" pairs, ids starting from 0.
inline void Problem::read_data(const std::string& train_file) {

  std::ifstream f(train_file);
  if (!f.is_open()) throw ImplicitError("Error in opening the training file " + train_file);

  std::vector<UnweightedInteraction> interactions;
  int uid, iid;
  while (f >> uid >> iid) interactions.push_back(UnweightedInteraction(uid, iid));
  f.close();

  set_interactions(interactions);

  printf("%d users, %d items, %d interactions\n", n_users, n_items, (int)train.size());
}

#endif
