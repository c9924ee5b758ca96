#include <cmath>
#include <fstream>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "hyperparameters.hpp"

TEST(HyperparametersTest, Defaults) {
  Hyperparameters hyper = HyperparametersBuilder().build();
  EXPECT_EQ(16, hyper.latent_dim());
  EXPECT_EQ(10, hyper.minibatch_size());
  EXPECT_FLOAT_EQ(.01f, hyper.learning_rate());
  EXPECT_EQ(0, hyper.num_threads());
  EXPECT_FALSE(hyper.verbose());
}

TEST(HyperparametersTest, NamedOptionsOverrideDefaults) {
  Hyperparameters hyper = HyperparametersBuilder().learning_rate(.1f).latent_dim(32).seed(9).build();
  EXPECT_EQ(32, hyper.latent_dim());
  EXPECT_EQ(10, hyper.minibatch_size());
  EXPECT_FLOAT_EQ(.1f, hyper.learning_rate());
  EXPECT_EQ(9u, hyper.seed());
}

TEST(HyperparametersTest, InvalidValuesThrow) {
  EXPECT_THROW(HyperparametersBuilder().latent_dim(0).build(), InvalidConfiguration);
  EXPECT_THROW(HyperparametersBuilder().latent_dim(-3).build(), InvalidConfiguration);
  EXPECT_THROW(HyperparametersBuilder().minibatch_size(0).build(), InvalidConfiguration);
  EXPECT_THROW(HyperparametersBuilder().learning_rate(std::numeric_limits<float>::quiet_NaN()).build(), InvalidConfiguration);
  EXPECT_THROW(HyperparametersBuilder().learning_rate(std::numeric_limits<float>::infinity()).build(), InvalidConfiguration);
  EXPECT_THROW(HyperparametersBuilder().num_threads(-1).build(), InvalidConfiguration);
}

TEST(HyperparametersTest, ZeroAndNegativeLearningRatesAreAccepted) {
  EXPECT_FLOAT_EQ(0.f, HyperparametersBuilder().learning_rate(0.f).build().learning_rate());
  EXPECT_FLOAT_EQ(-.5f, HyperparametersBuilder().learning_rate(-.5f).build().learning_rate());
}

namespace {

std::string write_config(const std::string& name, const std::string& contents) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream f(path.c_str());
  f << contents;
  return path;
}

}  // namespace

TEST(ConfigTest, ReadsKeyValueLines) {
  std::string path = write_config("implicitmf_config_test.cfg",
    "# comment\n"
    "[model]\n"
    "train_file = data/ml.txt\n"
    "latent_dim = 8\n"
    "minibatch_size = 4\n"
    "learning_rate = 0.05\n"
    "num_epochs = 3\n"
    "nthreads = 2\n"
    "seed = 123\n"
    "verbose = true\n"
    "test_fraction = 0.3\n"
    "bogus line\n");

  configuration conf;
  read_config(conf, path);

  EXPECT_EQ("data/ml.txt", conf.train_file);
  EXPECT_EQ(8, conf.latent_dim);
  EXPECT_EQ(4, conf.minibatch_size);
  EXPECT_FLOAT_EQ(.05f, conf.learning_rate);
  EXPECT_EQ(3, conf.num_epochs);
  EXPECT_EQ(2, conf.n_threads);
  EXPECT_TRUE(conf.has_seed);
  EXPECT_EQ(123u, conf.seed);
  EXPECT_TRUE(conf.verbose);
  EXPECT_FLOAT_EQ(.3f, conf.test_fraction);

  Hyperparameters hyper = to_hyperparameters(conf);
  EXPECT_EQ(8, hyper.latent_dim());
  EXPECT_EQ(4, hyper.minibatch_size());
  EXPECT_EQ(2, hyper.num_threads());
  EXPECT_EQ(123u, hyper.seed());
  EXPECT_TRUE(hyper.verbose());
}

TEST(ConfigTest, BadValueThrows) {
  std::string path = write_config("implicitmf_config_bad.cfg", "latent_dim = many\n");
  configuration conf;
  EXPECT_THROW(read_config(conf, path), InvalidConfiguration);
}

TEST(ConfigTest, MissingFileThrows) {
  configuration conf;
  EXPECT_THROW(read_config(conf, ::testing::TempDir() + "does_not_exist.cfg"), InvalidConfiguration);
}

TEST(ConfigTest, InvalidValuesRejectedByBuilder) {
  configuration conf;
  conf.minibatch_size = 0;
  EXPECT_THROW(to_hyperparameters(conf), InvalidConfiguration);
}
