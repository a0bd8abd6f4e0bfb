/* ──────────────────────────────────────────────────────────────
   profiles.hpp  –  run settings + the three named classifier profiles

   config/sdqc.json
   ┌─ run ──────────────────────────────────────────────────────┐
   │ filter_short, similarity_threshold, fold_count, threads,   │
   │ extractor { task, strip_hashtags, strip_mentions }         │
   ├─ profiles ─────────────────────────────────────────────────┤
   │ base | deny | query :                                      │
   │   target?  channels[]  svm{}  search{}                     │
   └────────────────────────────────────────────────────────────┘
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sdqc/common.hpp"
#include "sdqc/feature_composer.hpp"
#include "sdqc/features.hpp"
#include "sdqc/labels.hpp"
#include "sdqc/model_iface.hpp"

namespace sdqc {

/* one point of the grid */
struct Candidate {
    TrainOpt                      svm;
    std::map<std::string, double> weights;     // channel → weight override
};

/*  Cartesian product over whatever lists are non-empty.
 *  An empty space expands to the single profile-default candidate. */
struct SearchSpace {
    std::vector<double>                        C;
    std::vector<double>                        gamma;
    std::vector<Kernel>                        kernel;
    std::map<std::string, std::vector<double>> weights;

    bool empty() const;
    std::vector<Candidate> expand(const TrainOpt& base) const;
};

struct ClassifierProfile {
    std::string              name;
    std::optional<Stance>    target;     // set ⇒ one-vs-rest member
    std::vector<ChannelSpec> channels;
    TrainOpt                 svm;
    SearchSpace              search;

    /* channels with a candidate's weight overrides applied */
    std::vector<ChannelSpec> channels_for(const Candidate& c) const;
};

struct RunConfig {
    bool           filter_short         = false;
    double         similarity_threshold = 0.9;
    int            fold_count           = 3;
    int            threads              = 0;     // 0 ⇒ OpenMP default
    ExtractOptions extractor;
};

struct SdqcConfig {
    RunConfig         run;
    ClassifierProfile base;
    ClassifierProfile deny;
    ClassifierProfile query;
};

/* nlohmann hooks – validating, throw std::runtime_error on bad input */
void from_json(const json& j, ChannelSpec& c);
void from_json(const json& j, TrainOpt& o);
void from_json(const json& j, SearchSpace& s);
void from_json(const json& j, RunConfig& r);

void to_json(json& j, const TrainOpt& o);

/* threshold ≥ 0, fold_count ≥ 2, threads ≥ 0 ; also run after CLI overrides */
void validate(const RunConfig& r);

ClassifierProfile parse_profile(const std::string& name, const json& j);
SdqcConfig        parse_config(const json& j);
SdqcConfig        load_config(const std::string& path);

/* "C=100 gamma=0.001 kernel=rbf" */
std::string describe(const TrainOpt& o);

} // namespace sdqc
