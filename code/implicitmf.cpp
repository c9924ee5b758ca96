// Trains an implicit feedback factorization model with Hogwild SGD on a
// pairwise ranking loss, then reports MRR and AUC on a held-out split.
//
// Run: ./implicitmf_train [config_file]

#include <omp.h>
#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "interactions.hpp"
#include "model.hpp"
#include "problem.hpp"

int main (int argc, char* argv[]) {
  configuration conf;
  std::string config_file = "config/default.cfg";

  if (argc > 2) {
    std::cerr << "Usage : " << std::string(argv[0]) << " [config_file]" << std::endl;
    return -1;
  }

  if (argc == 2) {
    config_file = std::string(argv[1]);
  }

  try {
    read_config(conf, config_file);
    Hyperparameters hyper = to_hyperparameters(conf);

    std::cout << "Loading interactions file : " << conf.train_file << std::endl;
    Problem prob;
    prob.read_data(conf.train_file);

    std::mt19937 gen(hyper.seed());
    std::pair<std::vector<UnweightedInteraction>, std::vector<UnweightedInteraction> > split =
      train_test_split(prob.train, gen, conf.test_fraction);

    printf("Train: %d, test: %d\n", (int)split.first.size(), (int)split.second.size());

    ImplicitFactorizationModel model(hyper);

    printf("Hogwild SGD with %d threads.. \n", hyper.num_threads() > 0 ? hyper.num_threads() : omp_get_max_threads());
    double time = omp_get_wtime();
    float loss = model.fit(split.first, conf.num_epochs);
    time = omp_get_wtime() - time;
    printf("%d epochs, %f sec, loss %f\n", conf.num_epochs, time, loss);

    InteractionMatrix train_mat = InteractionMatrix::from_interactions(model.num_users(), model.num_items(), split.first);
    InteractionMatrix test_mat(model.num_users(), model.num_items());
    for (size_t i = 0; i < split.second.size(); ++i) {
      const UnweightedInteraction& x = split.second[i];
      // users or items never seen in training have no embedding to score
      if ((x.user_id() < model.num_users()) && (x.item_id() < model.num_items())) test_mat.add(x.user_id(), x.item_id());
    }

    printf("MRR %f\n", mrr_score(model, test_mat, train_mat));
    printf("AUC %f\n", auc_score(model, test_mat, train_mat));

  } catch (const ImplicitError& e) {
    std::cerr << "ERROR : " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
