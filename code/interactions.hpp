#ifndef __INTERACTIONS_HPP__
#define __INTERACTIONS_HPP__

#include <algorithm>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "elements.hpp"
#include "errors.hpp"

// Per-user sorted, duplicate-free lists of item ids.
class InteractionMatrix {
  int                               n_users, n_items;
  std::vector<std::vector<ItemId> > row_items;

  void check_user(UserId) const;

  public:
    InteractionMatrix() : n_users(0), n_items(0) {}
    InteractionMatrix(int nu, int ni);

    template <typename T>
    static InteractionMatrix from_interactions(int nu, int ni, const std::vector<T>& interactions);

    void add(UserId, ItemId);
    const std::vector<ItemId>& get(UserId) const;
    const std::vector<std::vector<ItemId> >& rows() const { return row_items; }

    int num_users() const { return n_users; }
    int num_items() const { return n_items; }
    long long nnz() const;
};

inline InteractionMatrix::InteractionMatrix(int nu, int ni) : n_users(nu), n_items(ni) {
  if ((nu < 0) || (ni < 0)) throw InvalidIndex("Negative interaction matrix dimensions.");
  row_items.resize(nu);
}

template <typename T>
InteractionMatrix InteractionMatrix::from_interactions(int nu, int ni, const std::vector<T>& interactions) {
  InteractionMatrix mat(nu, ni);
  for(size_t i=0; i<interactions.size(); ++i) mat.add(interactions[i].user_id(), interactions[i].item_id());
  return mat;
}

inline void InteractionMatrix::check_user(UserId uid) const {
  if ((uid < 0) || (uid >= n_users)) {
    std::ostringstream msg;
    msg << "User id " << uid << " out of range [0, " << n_users << ")";
    throw InvalidIndex(msg.str());
  }
}

inline void InteractionMatrix::add(UserId uid, ItemId iid) {
  check_user(uid);
  if ((iid < 0) || (iid >= n_items)) {
    std::ostringstream msg;
    msg << "Item id " << iid << " out of range [0, " << n_items << ")";
    throw InvalidIndex(msg.str());
  }

  std::vector<ItemId>& row = row_items[uid];
  std::vector<ItemId>::iterator pos = std::lower_bound(row.begin(), row.end(), iid);
  if ((pos == row.end()) || (*pos != iid)) row.insert(pos, iid);
}

inline const std::vector<ItemId>& InteractionMatrix::get(UserId uid) const {
  check_user(uid);
  return row_items[uid];
}

inline long long InteractionMatrix::nnz() const {
  long long n = 0;
  for(int uid=0; uid<n_users; ++uid) n += row_items[uid].size();
  return n;
}

// (max user id + 1, max item id + 1) over a non-empty interaction sequence
template <typename T>
std::pair<int,int> get_dimensions(const std::vector<T>& data) {
  if (data.empty()) throw EmptyInput("Cannot infer dimensions from an empty interaction set.");

  int max_user = -1, max_item = -1;
  for(size_t i=0; i<data.size(); ++i) {
    if ((data[i].user_id() < 0) || (data[i].item_id() < 0)) throw InvalidIndex("Negative user or item id.");
    if ((data[i].user_id() == std::numeric_limits<int>::max()) || (data[i].item_id() == std::numeric_limits<int>::max()))
      throw InvalidIndex("User or item id too large to size a table.");
    max_user = std::max(max_user, (int)data[i].user_id());
    max_item = std::max(max_item, (int)data[i].item_id());
  }

  return std::pair<int,int>(max_user+1, max_item+1);
}

// Shuffles a copy of the interactions; the first test_fraction of it becomes
// the test set. Returns (train, test).
template <typename T, typename RNG>
std::pair<std::vector<T>, std::vector<T> > train_test_split(const std::vector<T>& interactions, RNG& rng, float test_fraction) {
  if (!(test_fraction >= 0.f && test_fraction <= 1.f)) throw InvalidConfiguration("test_fraction must lie in [0, 1].");

  std::vector<T> test(interactions);
  std::shuffle(test.begin(), test.end(), rng);

  size_t n_test = (size_t)(test_fraction * (float)interactions.size());
  std::vector<T> train(test.begin() + n_test, test.end());
  test.resize(n_test);

  return std::make_pair(train, test);
}

#endif
