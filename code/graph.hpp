#ifndef __GRAPH_HPP__
#define __GRAPH_HPP__

#include <math.h>
#include <memory>
#include <vector>

#include "parameter.hpp"

// Forward/backward pairs of the pairwise loss. Activations are row-major
// (minibatch x width) arrays; scalar-per-example values have width 1.
// Every backward accumulates into its gradient outputs.

// out.row(b) = table.row(idx[b])
inline void gather_forward(const Arr& table, const std::vector<int>& idx, Arr& out) {
  for(size_t b=0; b<idx.size(); ++b) out.row(b) = table.row(idx[b]);
}

// target.row(idx[b]) += scale * grad.row(b); repeated indices accumulate.
inline void gather_backward(const Arr& grad, const std::vector<int>& idx, float scale, Arr& target) {
  for(size_t b=0; b<idx.size(); ++b) target.row(idx[b]) += scale * grad.row(b);
}

inline void dot_forward(const Arr& a, const Arr& b, Arr& out) {
  for(int r=0; r<a.rows(); ++r) out(r,0) = a.row(r).dot(b.row(r));
}

inline void dot_backward(const Arr& a, const Arr& b, const Arr& grad, Arr& grad_a, Arr& grad_b) {
  for(int r=0; r<a.rows(); ++r) {
    grad_a.row(r) += grad(r,0) * b.row(r);
    grad_b.row(r) += grad(r,0) * a.row(r);
  }
}

inline void add_forward(const Arr& a, const Arr& b, Arr& out) {
  out = a + b;
}

inline void add_backward(const Arr& grad, Arr& grad_a, Arr& grad_b) {
  grad_a += grad;
  grad_b += grad;
}

inline void sub_forward(const Arr& a, const Arr& b, Arr& out) {
  out = a - b;
}

inline void sub_backward(const Arr& grad, Arr& grad_a, Arr& grad_b) {
  grad_a += grad;
  grad_b -= grad;
}

inline float sigmoid(float x) {
  return 1.f / (1.f + exp(-x));
}

inline void sigmoid_forward(const Arr& x, Arr& out) {
  for(int r=0; r<x.rows(); ++r)
    for(int c=0; c<x.cols(); ++c) out(r,c) = sigmoid(x(r,c));
}

// takes the forward output, d sigmoid(x)/dx = s(1-s)
inline void sigmoid_backward(const Arr& out, const Arr& grad, Arr& grad_x) {
  grad_x.array() += grad.array() * out.array() * (1.f - out.array());
}

// Per-worker graph for
//   loss = -sigmoid((u.p + b_p) - (u.n + b_n))
// over one minibatch. Index buffers are overwritten before every forward().
class PairwiseLoss {
  public:
    std::shared_ptr<HogwildParameter> user_embedding, item_embedding, item_biases;

    std::vector<int> user_idx, positive_idx, negative_idx;

    Arr user_vec, positive_vec, negative_vec, positive_bias, negative_bias;
    Arr positive_dot, negative_dot, positive_score, negative_score, score_diff, prob;

    Arr grad_user_vec, grad_positive_vec, grad_negative_vec, grad_positive_bias, grad_negative_bias;
    Arr grad_positive_dot, grad_negative_dot, grad_positive_score, grad_negative_score, grad_score_diff;

    PairwiseLoss(const std::shared_ptr<HogwildParameter>& users,
                 const std::shared_ptr<HogwildParameter>& items,
                 const std::shared_ptr<HogwildParameter>& biases, int minibatch_size);

    float forward();
    void backward(float seed);
    void zero_gradient();
};

inline PairwiseLoss::PairwiseLoss(const std::shared_ptr<HogwildParameter>& users,
                                  const std::shared_ptr<HogwildParameter>& items,
                                  const std::shared_ptr<HogwildParameter>& biases, int minibatch_size)
  : user_embedding(users), item_embedding(items), item_biases(biases),
    user_idx(minibatch_size, 0), positive_idx(minibatch_size, 0), negative_idx(minibatch_size, 0) {

  int rank = users->cols();

  user_vec.resize(minibatch_size, rank);
  positive_vec.resize(minibatch_size, rank);
  negative_vec.resize(minibatch_size, rank);
  positive_bias.resize(minibatch_size, 1);
  negative_bias.resize(minibatch_size, 1);
  positive_dot.resize(minibatch_size, 1);
  negative_dot.resize(minibatch_size, 1);
  positive_score.resize(minibatch_size, 1);
  negative_score.resize(minibatch_size, 1);
  score_diff.resize(minibatch_size, 1);
  prob.resize(minibatch_size, 1);

  grad_user_vec.resize(minibatch_size, rank);
  grad_positive_vec.resize(minibatch_size, rank);
  grad_negative_vec.resize(minibatch_size, rank);
  grad_positive_bias.resize(minibatch_size, 1);
  grad_negative_bias.resize(minibatch_size, 1);
  grad_positive_dot.resize(minibatch_size, 1);
  grad_negative_dot.resize(minibatch_size, 1);
  grad_positive_score.resize(minibatch_size, 1);
  grad_negative_score.resize(minibatch_size, 1);
  grad_score_diff.resize(minibatch_size, 1);

  zero_gradient();
}

// Returns the loss summed over the minibatch.
inline float PairwiseLoss::forward() {
  gather_forward(user_embedding->value, user_idx, user_vec);
  gather_forward(item_embedding->value, positive_idx, positive_vec);
  gather_forward(item_embedding->value, negative_idx, negative_vec);
  gather_forward(item_biases->value, positive_idx, positive_bias);
  gather_forward(item_biases->value, negative_idx, negative_bias);

  dot_forward(user_vec, positive_vec, positive_dot);
  dot_forward(user_vec, negative_vec, negative_dot);
  add_forward(positive_dot, positive_bias, positive_score);
  add_forward(negative_dot, negative_bias, negative_score);
  sub_forward(positive_score, negative_score, score_diff);
  sigmoid_forward(score_diff, prob);

  return -prob.sum();
}

inline void PairwiseLoss::backward(float seed) {
  Arr grad_prob = Arr::Constant(prob.rows(), 1, -seed);

  sigmoid_backward(prob, grad_prob, grad_score_diff);
  sub_backward(grad_score_diff, grad_positive_score, grad_negative_score);
  add_backward(grad_positive_score, grad_positive_dot, grad_positive_bias);
  add_backward(grad_negative_score, grad_negative_dot, grad_negative_bias);
  dot_backward(user_vec, positive_vec, grad_positive_dot, grad_user_vec, grad_positive_vec);
  dot_backward(user_vec, negative_vec, grad_negative_dot, grad_user_vec, grad_negative_vec);
}

inline void PairwiseLoss::zero_gradient() {
  grad_user_vec.setZero();
  grad_positive_vec.setZero();
  grad_negative_vec.setZero();
  grad_positive_bias.setZero();
  grad_negative_bias.setZero();
  grad_positive_dot.setZero();
  grad_negative_dot.setZero();
  grad_positive_score.setZero();
  grad_negative_score.setZero();
  grad_score_diff.setZero();
}

// Plain SGD. Writes straight into the shared tables without locking.
class SGD {
  float learning_rate;

  public:
    explicit SGD(float lr) : learning_rate(lr) {}

    void step(PairwiseLoss& loss);
};

inline void SGD::step(PairwiseLoss& loss) {
  gather_backward(loss.grad_user_vec, loss.user_idx, -learning_rate, loss.user_embedding->value);
  gather_backward(loss.grad_positive_vec, loss.positive_idx, -learning_rate, loss.item_embedding->value);
  gather_backward(loss.grad_negative_vec, loss.negative_idx, -learning_rate, loss.item_embedding->value);
  gather_backward(loss.grad_positive_bias, loss.positive_idx, -learning_rate, loss.item_biases->value);
  gather_backward(loss.grad_negative_bias, loss.negative_idx, -learning_rate, loss.item_biases->value);
}

#endif
