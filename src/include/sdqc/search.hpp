/* ──────────────────────────────────────────────────────────────
   search.hpp  –  StancePipeline (composer + SVM) and the
                  cross-validated hyper-parameter search around it
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "sdqc/feature_composer.hpp"
#include "sdqc/model_iface.hpp"
#include "sdqc/profiles.hpp"

namespace sdqc {

/* training view: bags are owned by the caller and outlive the search */
struct LabeledData {
    std::vector<const FeatureBag*> bags;
    std::vector<std::string>       labels;

    size_t size() const { return bags.size(); }
};

/*  fitted composer + fitted classifier.  Immutable after fit;
 *  predict() is const and may be shared between threads.           */
class StancePipeline {
public:
    StancePipeline(std::vector<ChannelSpec> channels, TrainOpt opt);

    void fit(const std::vector<const FeatureBag*>& bags,
             const std::vector<std::string>&       labels);

    std::vector<std::string> predict(const std::vector<const FeatureBag*>& bags) const;

    const TrainOpt&          options()  const { return opt_; }
    const FeatureComposer&   composer() const { return composer_; }
    std::map<std::string, double> weights() const { return composer_.weights(); }

private:
    FeatureComposer         composer_;
    TrainOpt                opt_;
    std::unique_ptr<IModel> model_;
};

struct Fold {
    std::vector<size_t> train;
    std::vector<size_t> val;
};

/*  sort by label (stable), then deal round-robin into k folds so every
 *  class is spread as evenly as possible.  k is clamped to [2, n];
 *  fewer than two labels give no folds at all.                         */
std::vector<Fold> stratified_folds(const std::vector<std::string>& labels, int k);

struct SearchResult {
    std::unique_ptr<StancePipeline> best_model;      // refit on all data
    Candidate                       best;
    double                          best_score = 0.0;
    std::vector<double>             scores;          // per candidate, expansion order
    std::vector<Candidate>          candidates;
};

struct ISearchStrategy {
    virtual ~ISearchStrategy() = default;

    virtual SearchResult search(const ClassifierProfile& profile,
                                const SearchSpace&       space,
                                const LabeledData&       data,
                                int                      fold_count) const = 0;
};

/* exhaustive grid, candidate × fold jobs over OpenMP; threads ≤ 0 ⇒ default */
std::unique_ptr<ISearchStrategy> make_grid_search(int threads = 0);

} // namespace sdqc
