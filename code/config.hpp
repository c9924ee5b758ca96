#ifndef __CONFIG_HPP__
#define __CONFIG_HPP__

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "hyperparameters.hpp"

struct configuration {
  std::string train_file;
  float test_fraction = .2f;
  int latent_dim = 16, minibatch_size = 10, num_epochs = 10, n_threads = 0;
  float learning_rate = .01f;
  unsigned seed = 0;
  bool has_seed = false;
  bool verbose = false;
};

// Reads "key = value" lines; lines starting with '#' or '[' are skipped.
inline void read_config(configuration& conf, const std::string& conFile) {

  std::ifstream infile(conFile);
  if (!infile.is_open()) throw InvalidConfiguration("Cannot open config file " + conFile);

  std::string line;
  while(std::getline(infile,line))
  {
    std::istringstream iss(line);
    if (line.empty() || (line[0] == '#') || (line[0] == '[')) {
      continue;
    }

    std::string key, equal, val;
    if (iss >> key >> equal >> val) {
      if (equal != "=") {
        continue;
      }
      try {
        if (key == "train_file") {
          conf.train_file = val;
        }
        if (key == "test_fraction") {
          conf.test_fraction = std::stof(val);
        }
        if (key == "latent_dim") {
          conf.latent_dim = std::stoi(val);
        }
        if (key == "minibatch_size") {
          conf.minibatch_size = std::stoi(val);
        }
        if (key == "learning_rate") {
          conf.learning_rate = std::stof(val);
        }
        if (key == "num_epochs") {
          conf.num_epochs = std::stoi(val);
        }
        if (key == "nthreads") {
          conf.n_threads = std::stoi(val);
        }
        if (key == "seed") {
          conf.seed = (unsigned)std::stoul(val);
          conf.has_seed = true;
        }
        if (key == "verbose") {
          if (val == "true") conf.verbose = true;
          if (val == "false") conf.verbose = false;
        }
      } catch (const std::logic_error&) {
        throw InvalidConfiguration("Bad value for " + key + ": " + val);
      }
    }
  }
}

inline Hyperparameters to_hyperparameters(const configuration& conf) {
  HyperparametersBuilder builder;
  builder.latent_dim(conf.latent_dim)
         .minibatch_size(conf.minibatch_size)
         .learning_rate(conf.learning_rate)
         .num_threads(conf.n_threads)
         .verbose(conf.verbose);
  if (conf.has_seed) builder.seed(conf.seed);
  return builder.build();
}

#endif
