#ifndef __HYPERPARAMETERS_HPP__
#define __HYPERPARAMETERS_HPP__

#include <cmath>
#include <random>

#include "errors.hpp"

class HyperparametersBuilder;

// Immutable once built. Use HyperparametersBuilder to construct.
class Hyperparameters {
  int      latent_dim_;        // embedding width
  int      minibatch_size_;    // examples per gradient step
  float    learning_rate_;     // SGD step scale
  int      num_threads_;       // worker pool size, 0 = all hardware threads
  unsigned seed_;
  bool     verbose_;

  friend class HyperparametersBuilder;
  Hyperparameters() {}

  public:
    int      latent_dim() const { return latent_dim_; }
    int      minibatch_size() const { return minibatch_size_; }
    float    learning_rate() const { return learning_rate_; }
    int      num_threads() const { return num_threads_; }
    unsigned seed() const { return seed_; }
    bool     verbose() const { return verbose_; }
};

// Named-option builder; omitted options keep their defaults
// (latent_dim 16, minibatch_size 10, learning_rate 0.01).
class HyperparametersBuilder {
  Hyperparameters hyper;

  public:
    HyperparametersBuilder() {
      hyper.latent_dim_     = 16;
      hyper.minibatch_size_ = 10;
      hyper.learning_rate_  = 0.01f;
      hyper.num_threads_    = 0;
      hyper.seed_           = std::random_device()();
      hyper.verbose_        = false;
    }

    HyperparametersBuilder& latent_dim(int d)       { hyper.latent_dim_ = d;     return *this; }
    HyperparametersBuilder& minibatch_size(int m)   { hyper.minibatch_size_ = m; return *this; }
    HyperparametersBuilder& learning_rate(float lr) { hyper.learning_rate_ = lr; return *this; }
    HyperparametersBuilder& num_threads(int n)      { hyper.num_threads_ = n;    return *this; }
    HyperparametersBuilder& seed(unsigned s)        { hyper.seed_ = s;           return *this; }
    HyperparametersBuilder& verbose(bool v)         { hyper.verbose_ = v;        return *this; }

    Hyperparameters build() const;
};

inline Hyperparameters HyperparametersBuilder::build() const {
  if (hyper.latent_dim_ <= 0) throw InvalidConfiguration("latent_dim must be positive.");
  if (hyper.minibatch_size_ <= 0) throw InvalidConfiguration("minibatch_size must be positive.");
  if (!std::isfinite(hyper.learning_rate_)) throw InvalidConfiguration("learning_rate must be finite.");
  if (hyper.num_threads_ < 0) throw InvalidConfiguration("num_threads must be non-negative.");
  return hyper;
}

#endif
