#ifndef __PARAMETER_HPP__
#define __PARAMETER_HPP__

#define EIGEN_DONT_PARALLELIZE

#include <math.h>
#include <memory>
#include <random>
#include <Eigen/Core>

typedef Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Arr;
typedef Eigen::Matrix<float, Eigen::Dynamic, 1> Vec;

// Dense table shared by the model and every training worker. Workers read
// and write `value` without any locking (Hogwild); the table is never
// resized once allocated.
struct HogwildParameter {
  Arr value;

  explicit HogwildParameter(const Arr& init) : value(init) {}

  int rows() const { return (int)value.rows(); }
  int cols() const { return (int)value.cols(); }
};

// Uniform [0,1) entries scaled by 1/sqrt(cols).
template <typename RNG>
Arr embedding_init(int rows, int cols, RNG& gen) {
  std::uniform_real_distribution<float> unif(0.f, 1.f);
  float scale = 1.f / sqrt((float)cols);

  Arr arr(rows, cols);
  for(int i=0; i<rows; ++i)
    for(int k=0; k<cols; ++k) arr(i,k) = unif(gen) * scale;
  return arr;
}

struct ModelData {
  int n_users, n_items;
  std::shared_ptr<HogwildParameter> user_embedding;   // n_users x latent_dim
  std::shared_ptr<HogwildParameter> item_embedding;   // n_items x latent_dim
  std::shared_ptr<HogwildParameter> item_biases;      // n_items x 1
};

template <typename RNG>
ModelData build_model_data(int n_users, int n_items, int latent_dim, RNG& gen) {
  ModelData data;
  data.n_users = n_users;
  data.n_items = n_items;
  data.user_embedding = std::make_shared<HogwildParameter>(embedding_init(n_users, latent_dim, gen));
  data.item_embedding = std::make_shared<HogwildParameter>(embedding_init(n_items, latent_dim, gen));
  data.item_biases    = std::make_shared<HogwildParameter>(embedding_init(n_items, 1, gen));
  return data;
}

#endif
