/* ──────────────────────────────────────────────────────────────
   test_util.hpp  –  small builders shared by the unit tests
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "sdqc/common.hpp"
#include "sdqc/features.hpp"
#include "sdqc/thread_store.hpp"

namespace sdqc::test {

/* every key the shipped profiles read, zeroed */
inline json full_features(const json& overrides = json::object())
{
    json f = {
        {"text_stemmed_stopped", ""}, {"text_minus_root", ""},
        {"verified", false}, {"is_news", false},
        {"period_count", 0}, {"question_mark_count", 0}, {"exclamation_count", 0},
        {"ellipsis_count", 0}, {"hashtags", 0}, {"user_mentions", 0}, {"retweet_count", 0},
        {"positive_words", json::array()}, {"negative_words", json::array()},
        {"denying_words", json::array()}, {"querying_words", json::array()},
        {"swear_words", json::array()}, {"personal_words", json::array()},
    };
    f.update(overrides);
    return f;
}

inline Message make_message(const std::string& id, const std::string& text,
                            const std::string& parent = "",
                            const json& features = json::object())
{
    Message m;
    m.id        = id;
    m.text      = text;
    m.parent_id = parent;
    m.fields    = json::object();
    if (!features.empty()) m.fields["features"] = features;
    return m;
}

inline FeatureBag bag(std::initializer_list<std::pair<const std::string, FeatureValue>> kv)
{
    return FeatureBag(kv);
}

inline std::vector<const FeatureBag*> ptrs(const std::vector<FeatureBag>& v)
{
    std::vector<const FeatureBag*> out;
    for (const auto& b : v) out.push_back(&b);
    return out;
}

} // namespace sdqc::test
