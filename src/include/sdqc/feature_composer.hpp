/* ──────────────────────────────────────────────────────────────
   feature_composer.hpp  –  named channels → one weighted sparse row

   ┌─ ChannelSpec ──────────────────────────────────────────────┐
   │ name      "count_question_marks"                           │
   │ keys      {"question_mark_count"}                          │
   │ encoding  numeric | categorical | text                     │
   │ weight    ≥ 0, multiplies the whole sub-vector             │
   └────────────────────────────────────────────────────────────┘
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sdqc/features.hpp"
#include "sdqc/tfidf.hpp"

namespace sdqc {

enum class Encoding { Numeric, Categorical, Text };

const char* to_string(Encoding e);
Encoding    parse_encoding(const std::string& s);   // throws on unknown

struct ChannelSpec {
    std::string              name;
    std::vector<std::string> keys;
    Encoding                 encoding = Encoding::Numeric;
    double                   weight   = 1.0;
};

/* a selected key is absent from a message's bag */
class MissingFeatureError : public std::runtime_error {
public:
    MissingFeatureError(const std::string& channel, const std::string& key, size_t row)
        : std::runtime_error("feature '" + key + "' of channel '" + channel +
                             "' missing for message #" + std::to_string(row)),
          channel_(channel), key_(key) {}
    const std::string& channel() const { return channel_; }
    const std::string& key()     const { return key_; }
private:
    std::string channel_, key_;
};

/* one encoder per channel, fitted on the training bags */
class ChannelEncoder {
public:
    explicit ChannelEncoder(ChannelSpec spec) : spec_(std::move(spec)) {}
    virtual ~ChannelEncoder() = default;

    virtual void   fit(const std::vector<const FeatureBag*>& bags) = 0;
    /* append weighted entries of `row` starting at column `offset` */
    virtual void   encode(const FeatureBag& bag, int row, int offset,
                          std::vector<Eigen::Triplet<double>>& out) const = 0;
    virtual size_t dim() const = 0;

    const ChannelSpec& spec() const { return spec_; }

protected:
    const FeatureValue& lookup(const FeatureBag& bag, const std::string& key, int row) const;

    ChannelSpec spec_;
};

std::unique_ptr<ChannelEncoder> make_encoder(const ChannelSpec& spec);

class FeatureComposer {
public:
    explicit FeatureComposer(std::vector<ChannelSpec> channels);

    FeatureComposer(const FeatureComposer&)            = delete;
    FeatureComposer& operator=(const FeatureComposer&) = delete;
    FeatureComposer(FeatureComposer&&)                 = default;
    FeatureComposer& operator=(FeatureComposer&&)      = default;

    void  fit(const std::vector<const FeatureBag*>& bags);
    SpMat transform(const std::vector<const FeatureBag*>& bags) const;
    SpMat fit_transform(const std::vector<const FeatureBag*>& bags);

    /* column count after fit */
    size_t dim() const;

    std::vector<ChannelSpec> channels() const;
    std::map<std::string, double> weights() const;

private:
    std::vector<std::unique_ptr<ChannelEncoder>> enc_;
    bool fitted_ = false;
};

} // namespace sdqc
