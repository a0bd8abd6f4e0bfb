/**********************************************************************
 *  search.cpp  –  StancePipeline + GridSearch
 *
 *   candidates  = space.expand(profile.svm)
 *   jobs        = candidates × stratified folds        (OpenMP)
 *   score(c)    = mean held-out accuracy over the folds
 *   best        = argmax score, first in expansion order on ties
 *   best_model  = best candidate refit on the full training set
 *********************************************************************/
#include <algorithm>
#include <chrono>
#include <exception>
#include <numeric>
#include <omp.h>

#include "sdqc/common.hpp"
#include "sdqc/search.hpp"

namespace sdqc {

/* ───────────────────── pipeline ───────────────────── */
StancePipeline::StancePipeline(std::vector<ChannelSpec> channels, TrainOpt opt)
    : composer_(std::move(channels)), opt_(opt), model_(make_svc())
{}

void StancePipeline::fit(const std::vector<const FeatureBag*>& bags,
                         const std::vector<std::string>&       labels)
{
    if (bags.empty())
        throw std::runtime_error("cannot train a classifier on zero messages");
    if (bags.size() != labels.size())
        throw std::runtime_error("pipeline: " + std::to_string(bags.size()) + " messages but " +
                                 std::to_string(labels.size()) + " labels");
    SpMat X = composer_.fit_transform(bags);
    model_->fit(X, labels, opt_);
}

std::vector<std::string> StancePipeline::predict(const std::vector<const FeatureBag*>& bags) const
{
    if (bags.empty()) return {};
    return model_->predict(composer_.transform(bags));
}

/* ───────────────────── folds ───────────────────── */
std::vector<Fold> stratified_folds(const std::vector<std::string>& labels, int k)
{
    const size_t n = labels.size();
    if (n < 2) return {};
    const size_t K = size_t(std::max(2, std::min<int>(k, int(n))));

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b){ return labels[a] < labels[b]; });

    std::vector<size_t> fold_of(n);
    for (size_t r = 0; r < n; ++r) fold_of[order[r]] = r % K;      // round-robin

    std::vector<Fold> folds(K);
    for (size_t i = 0; i < n; ++i)
        for (size_t f = 0; f < K; ++f)
            (fold_of[i] == f ? folds[f].val : folds[f].train).push_back(i);
    return folds;
}

/* ───────────────────── grid search ───────────────────── */
namespace {

class GridSearch : public ISearchStrategy {
public:
    explicit GridSearch(int threads) : threads_(threads) {}

    SearchResult search(const ClassifierProfile& profile,
                        const SearchSpace&       space,
                        const LabeledData&       data,
                        int                      fold_count) const override
    {
        if (data.size() == 0)
            throw std::runtime_error("profile '" + profile.name + "': empty training set");
        if (data.bags.size() != data.labels.size())
            throw std::runtime_error("profile '" + profile.name + "': labels do not match messages");

        using clock = std::chrono::steady_clock;
        auto t0 = clock::now();

        SearchResult res;
        res.candidates = space.expand(profile.svm);
        const std::vector<Fold> folds = stratified_folds(data.labels, fold_count);

        const size_t C = res.candidates.size(), K = folds.size(), J = C * K;
        if (K == 0)
            logW(profile.name + ": too few messages to cross-validate, keeping the first candidate");
        logI(profile.name + ": " + std::to_string(C) + " candidate(s) × " +
             std::to_string(K) + " folds on " + std::to_string(data.size()) + " messages");

        std::vector<double> fold_acc(J, 0.0);
        std::exception_ptr  failure;
        size_t              done = 0;

        const int nthreads = threads_ > 0 ? threads_ : omp_get_max_threads();
        #pragma omp parallel for schedule(dynamic) num_threads(nthreads)
        for (int job = 0; job < int(J); ++job) {
            try {
                const Candidate& cand = res.candidates[size_t(job) / K];
                const Fold&      fold = folds[size_t(job) % K];
                fold_acc[size_t(job)] = score_fold(profile, cand, data, fold);
            } catch (...) {
                #pragma omp critical(sdqc_search_err)
                if (!failure) failure = std::current_exception();
            }
            #pragma omp critical(sdqc_search_progress)
            progress(profile.name + "-cv", ++done, J);
        }
        if (failure) std::rethrow_exception(failure);

        res.scores.assign(C, 0.0);
        size_t best = 0;
        for (size_t c = 0; c < C; ++c) {
            double s = 0.0;
            for (size_t f = 0; f < K; ++f) s += fold_acc[c * K + f];
            res.scores[c] = K ? s / double(K) : 0.0;
            if (res.scores[c] > res.scores[best]) best = c;
        }
        res.best       = res.candidates[best];
        res.best_score = res.scores[best];

        res.best_model = std::make_unique<StancePipeline>(profile.channels_for(res.best),
                                                          res.best.svm);
        res.best_model->fit(data.bags, data.labels);

        auto t1 = clock::now();
        logI(profile.name + " grid search took " +
             fmt_double(std::chrono::duration<double>(t1 - t0).count()) + " s, best CV accuracy " +
             fmt_double(res.best_score, 4));
        return res;
    }

private:
    static double score_fold(const ClassifierProfile& profile, const Candidate& cand,
                             const LabeledData& data, const Fold& fold)
    {
        std::vector<const FeatureBag*> tr_bags, va_bags;
        std::vector<std::string>       tr_y,    va_y;
        for (size_t i : fold.train) { tr_bags.push_back(data.bags[i]); tr_y.push_back(data.labels[i]); }
        for (size_t i : fold.val)   { va_bags.push_back(data.bags[i]); va_y.push_back(data.labels[i]); }
        if (va_y.empty()) return 0.0;

        StancePipeline p(profile.channels_for(cand), cand.svm);
        p.fit(tr_bags, tr_y);
        auto pred = p.predict(va_bags);

        size_t ok = 0;
        for (size_t i = 0; i < va_y.size(); ++i) ok += (pred[i] == va_y[i]);
        return double(ok) / double(va_y.size());
    }

    int threads_;
};

} // namespace

std::unique_ptr<ISearchStrategy> make_grid_search(int threads)
{
    return std::make_unique<GridSearch>(threads);
}

} // namespace sdqc
