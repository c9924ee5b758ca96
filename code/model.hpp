#ifndef __MODEL_HPP__
#define __MODEL_HPP__

#include <memory>
#include <random>
#include <sstream>
#include <vector>

#include "elements.hpp"
#include "errors.hpp"
#include "hyperparameters.hpp"
#include "parameter.hpp"
#include "problem.hpp"
#include "solver/hogwild.hpp"

// Latent factor model for implicit feedback, trained with a pairwise
// ranking loss. The parameter tables are allocated by the first fit() (or
// initialize()) and keep their dimensions for the lifetime of the model.
class ImplicitFactorizationModel {
  Hyperparameters            hyper;
  std::unique_ptr<ModelData> model;

  void allocate(int nu, int ni);

  public:
    ImplicitFactorizationModel() : hyper(HyperparametersBuilder().build()) {}
    explicit ImplicitFactorizationModel(const Hyperparameters& h) : hyper(h) {}

    bool is_fitted() const { return (bool)model; }
    int num_users() const { return data().n_users; }
    int num_items() const { return data().n_items; }
    const ModelData& data() const;

    void initialize(int nu, int ni);

    template <typename T>
    float fit(const std::vector<T>& interactions, int num_epochs);

    std::vector<float> predict(UserId) const;

    // Unchecked scoring of every item for uid into scores.
    void compute_scores(UserId uid, std::vector<float>& scores) const;
};

inline const ModelData& ImplicitFactorizationModel::data() const {
  if (!model) throw NotFitted();
  return *model;
}

inline void ImplicitFactorizationModel::allocate(int nu, int ni) {
  std::mt19937 gen(hyper.seed());
  model.reset(new ModelData(build_model_data(nu, ni, hyper.latent_dim(), gen)));
}

inline void ImplicitFactorizationModel::initialize(int nu, int ni) {
  if (model) throw InvalidConfiguration("Model parameters are already allocated.");
  if ((nu <= 0) || (ni <= 0)) throw InvalidConfiguration("Model dimensions must be positive.");
  allocate(nu, ni);
}

template <typename T>
float ImplicitFactorizationModel::fit(const std::vector<T>& interactions, int num_epochs) {
  if (num_epochs <= 0) throw InvalidConfiguration("num_epochs must be positive.");

  Problem prob;
  prob.set_interactions(interactions);

  if (!model) {
    allocate(prob.n_users, prob.n_items);
  } else if ((prob.n_users > model->n_users) || (prob.n_items > model->n_items)) {
    std::ostringstream msg;
    msg << "Interactions span " << prob.n_users << " users and " << prob.n_items
        << " items but the model was built for " << model->n_users << " users and "
        << model->n_items << " items";
    throw InvalidIndex(msg.str());
  }

  SolverHogwild solver(hyper, num_epochs);
  return solver.solve(prob, *model);
}

inline void ImplicitFactorizationModel::compute_scores(UserId uid, std::vector<float>& scores) const {
  const Arr& user_embeddings = model->user_embedding->value;
  const Arr& item_embeddings = model->item_embedding->value;
  const Arr& item_biases     = model->item_biases->value;

  scores.resize(model->n_items);
  Eigen::Map<Vec> s(scores.data(), model->n_items);
  s.noalias() = item_embeddings * user_embeddings.row(uid).transpose();
  s += item_biases.col(0);
}

inline std::vector<float> ImplicitFactorizationModel::predict(UserId uid) const {
  const ModelData& d = data();
  if ((uid < 0) || (uid >= d.n_users)) {
    std::ostringstream msg;
    msg << "User id " << uid << " out of range [0, " << d.n_users << ")";
    throw InvalidIndex(msg.str());
  }

  std::vector<float> scores;
  compute_scores(uid, scores);
  return scores;
}

#endif
