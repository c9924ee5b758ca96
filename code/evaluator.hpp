#ifndef __EVALUATOR_HPP__
#define __EVALUATOR_HPP__

#include <omp.h>
#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "interactions.hpp"
#include "model.hpp"

class Evaluator {
  public:
    virtual ~Evaluator() {}
    virtual double evaluate(const ImplicitFactorizationModel&) = 0;
};

// Scores held-out items against the whole catalog. Items of the user's train
// row are pushed below every real score first.
class EvaluatorMRR : public Evaluator {
  public:
    const InteractionMatrix &test, &train;

    EvaluatorMRR(const InteractionMatrix& te, const InteractionMatrix& tr) : test(te), train(tr) {}

    double evaluate(const ImplicitFactorizationModel&);
};

class EvaluatorAUC : public Evaluator {
  public:
    const InteractionMatrix &test, &train;

    EvaluatorAUC(const InteractionMatrix& te, const InteractionMatrix& tr) : test(te), train(tr) {}

    double evaluate(const ImplicitFactorizationModel&);
};

inline void check_dimensions(const ImplicitFactorizationModel& model, const InteractionMatrix& test, const InteractionMatrix& train) {
  const ModelData& data = model.data();

  if ((test.num_users() != train.num_users()) || (test.num_items() != train.num_items())) {
    std::ostringstream msg;
    msg << "Test matrix is " << test.num_users() << "x" << test.num_items()
        << " but train matrix is " << train.num_users() << "x" << train.num_items();
    throw InvalidIndex(msg.str());
  }

  if ((test.num_users() > data.n_users) || (test.num_items() > data.n_items)) {
    std::ostringstream msg;
    msg << "Evaluation matrices are " << test.num_users() << "x" << test.num_items()
        << " but the model was built for " << data.n_users << "x" << data.n_items;
    throw InvalidIndex(msg.str());
  }
}

// Mean over users with a non-empty test row of the mean reciprocal rank of
// their test items. The rank of an item counts every item scoring at least
// as high, itself included, so ties push ranks down.
inline double EvaluatorMRR::evaluate(const ImplicitFactorizationModel& model) {
  check_dimensions(model, test, train);

  const float min_score = std::numeric_limits<float>::lowest();
  int n_users = test.num_users();

  double mrr = 0.;
  int n_evaluated = 0;

  #pragma omp parallel reduction(+ : mrr, n_evaluated)
  {
    std::vector<float> predictions, test_scores;
    std::vector<int> ranks;

    #pragma omp for schedule(dynamic)
    for (int uid = 0; uid < n_users; ++uid) {
      const std::vector<ItemId>& test_row  = test.rows()[uid];
      const std::vector<ItemId>& train_row = train.rows()[uid];
      if (test_row.empty()) continue;

      model.compute_scores(uid, predictions);
      for (size_t i = 0; i < train_row.size(); ++i) predictions[train_row[i]] = min_score;

      test_scores.resize(test_row.size());
      for (size_t t = 0; t < test_row.size(); ++t) test_scores[t] = predictions[test_row[t]];

      ranks.assign(test_row.size(), 0);
      for (size_t j = 0; j < predictions.size(); ++j) {
        for (size_t t = 0; t < test_scores.size(); ++t) {
          if (predictions[j] >= test_scores[t]) ++ranks[t];
        }
      }

      // a NaN score ranks nowhere and contributes nothing
      double rr = 0.;
      for (size_t t = 0; t < ranks.size(); ++t) {
        if (ranks[t] > 0) rr += 1. / (double)ranks[t];
      }

      mrr += rr / (double)ranks.size();
      ++n_evaluated;
    }
  }

  if (n_evaluated == 0) return 0.;
  return mrr / (double)n_evaluated;
}

struct vcomp {
	bool operator() (const std::pair<int, float>& i, const std::pair<int, float>& j) const {
		return i.second < j.second;
	}
};

// Fraction of (test item, non-test item) pairs ordered correctly, ties
// counting one half, train items left out, averaged over users that have
// both kinds of items.
inline double EvaluatorAUC::evaluate(const ImplicitFactorizationModel& model) {
  check_dimensions(model, test, train);

	double AUC = 0.;
	int num_users = 0;
	int n_users = test.num_users();

	#pragma omp parallel reduction(+ : AUC, num_users)
	{
		std::vector<float> predictions;
		std::vector<std::pair<int, float> > v;

		#pragma omp for schedule(dynamic)
		for (int i = 0; i < n_users; ++i) {
			const std::vector<ItemId>& test_row  = test.rows()[i];
			const std::vector<ItemId>& train_row = train.rows()[i];
			if (test_row.empty()) continue;

			model.compute_scores(i, predictions);

			v.clear();
			for (int j = 0; j < (int)predictions.size(); ++j) {
				if (std::binary_search(train_row.begin(), train_row.end(), j)) {
					continue;
				}
				v.push_back(std::pair<int, float>(j, predictions[j]));
			}
			std::sort(v.begin(), v.end(), vcomp());

			// equal scores form one group; a tied (test, non-test) pair counts half
			long long testNum = 0;
			long long nonTestNum = 0;
			long long accNumer = 0;
			for (size_t idx = 0; idx < v.size(); ) {
				size_t end = idx;
				long long groupTest = 0;
				long long groupNonTest = 0;
				for (; (end < v.size()) && ((end == idx) || (v[end].second == v[idx].second)); ++end) {
					if (std::binary_search(test_row.begin(), test_row.end(), v[end].first)) {
						++groupTest;
					} else {
						++groupNonTest;
					}
				}

				accNumer += 2 * groupTest * nonTestNum + groupTest * groupNonTest;
				testNum += groupTest;
				nonTestNum += groupNonTest;
				idx = end;
			}

			if (!testNum || !nonTestNum) {
				continue;
			}

			AUC += (double)accNumer / 2. / (double)testNum / (double)nonTestNum;
			++num_users;
		}
	}

	if (num_users == 0) return 0.;
	return AUC / num_users;
}

inline double mrr_score(const ImplicitFactorizationModel& model, const InteractionMatrix& test, const InteractionMatrix& train) {
  EvaluatorMRR eval(test, train);
  return eval.evaluate(model);
}

inline double auc_score(const ImplicitFactorizationModel& model, const InteractionMatrix& test, const InteractionMatrix& train) {
  EvaluatorAUC eval(test, train);
  return eval.evaluate(model);
}

#endif
