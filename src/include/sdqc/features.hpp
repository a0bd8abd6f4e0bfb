/* ──────────────────────────────────────────────────────────────
   features.hpp  –  FeatureBag + extractor contract
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "sdqc/thread_store.hpp"

namespace sdqc {

/* number | flag | short text | word list */
using FeatureValue = std::variant<double, bool, std::string, std::vector<std::string>>;
using FeatureBag   = std::unordered_map<std::string, FeatureValue>;

FeatureValue feature_from_json(const json& v);   // throws on null, objects, nested arrays

struct ExtractOptions {
    std::string task           = "A";
    bool        strip_hashtags = false;
    bool        strip_mentions = false;
};

/*  The core only sees this interface: one bag per message and one
 *  normalised text per message.  Both must be pure.                 */
struct IFeatureExtractor {
    virtual ~IFeatureExtractor() = default;

    virtual FeatureBag  extract(const Message&        m,
                                const ThreadStore&    store,
                                const ExtractOptions& opt) const = 0;

    virtual std::string normalize_text(const Message& m) const = 0;
};

/*  Reads precomputed values from  fields["features"]  and fills
 *  is_root / depth / char_count from the thread when absent.        */
class JsonFeatureExtractor : public IFeatureExtractor {
public:
    explicit JsonFeatureExtractor(ExtractOptions opt = {}) : opt_(std::move(opt)) {}

    FeatureBag  extract(const Message&        m,
                        const ThreadStore&    store,
                        const ExtractOptions& opt) const override;

    std::string normalize_text(const Message& m) const override;

private:
    ExtractOptions opt_;     // strip flags used by normalize_text
};

std::unique_ptr<IFeatureExtractor> make_json_extractor(const ExtractOptions& opt = {});

} // namespace sdqc
