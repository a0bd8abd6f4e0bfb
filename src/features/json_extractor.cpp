/* -----------------------------------------------------------
 *  json_extractor.cpp – FeatureBag from precomputed metadata
 * ----------------------------------------------------------- */
#include <stdexcept>

#include "sdqc/common.hpp"
#include "sdqc/features.hpp"

namespace sdqc {

FeatureValue feature_from_json(const json& v)
{
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number())  return v.get<double>();
    if (v.is_string())  return v.get<std::string>();
    if (v.is_array()) {
        std::vector<std::string> words;
        words.reserve(v.size());
        for (const auto& e : v) {
            if (e.is_string())      words.push_back(e.get<std::string>());
            else if (e.is_number()) words.push_back(e.dump());
            else throw std::runtime_error("feature list must hold strings, got " + e.dump());
        }
        return words;
    }
    throw std::runtime_error("unsupported feature value " + v.dump());
}

FeatureBag JsonFeatureExtractor::extract(const Message&        m,
                                         const ThreadStore&    store,
                                         const ExtractOptions& /*opt*/) const
{
    FeatureBag bag;
    auto it = m.fields.find("features");
    if (it != m.fields.end()) {
        if (!it->is_object())
            throw std::runtime_error("features of " + m.id + " is not an object");
        for (auto kv = it->begin(); kv != it->end(); ++kv) {
            if (kv.value().is_null()) continue;     // null is absent, not zero
            bag.emplace(kv.key(), feature_from_json(kv.value()));
        }
    }

    /* structural keys the thread already knows */
    if (!bag.count("is_root"))    bag.emplace("is_root", store.is_root(m));
    if (!bag.count("depth"))      bag.emplace("depth", double(store.depth_of(m)));
    if (!bag.count("char_count")) bag.emplace("char_count", double(utf8_length(m.text)));
    return bag;
}

std::string JsonFeatureExtractor::normalize_text(const Message& m) const
{
    auto it = m.fields.find("parseable_text");
    if (it != m.fields.end() && it->is_string())
        return it->get<std::string>();

    /* lowercase, drop stripped #/@ tokens, collapse non-word runs to ' ' */
    std::string out;
    out.reserve(m.text.size());
    bool pending_space = false;
    bool skipping      = false;
    for (char32_t cp : decode_utf8(m.text)) {
        const bool word = is_word_char(cp);
        if (skipping) {
            if (word) continue;
            skipping = false;
        }
        if ((cp == '#' && opt_.strip_hashtags) || (cp == '@' && opt_.strip_mentions)) {
            skipping = true;
            pending_space = !out.empty();
            continue;
        }
        if (word) {
            if (pending_space) out.push_back(' ');
            pending_space = false;
            append_utf8(out, to_lower(cp));
        } else {
            pending_space = !out.empty();
        }
    }
    return out;
}

std::unique_ptr<IFeatureExtractor> make_json_extractor(const ExtractOptions& opt)
{
    return std::make_unique<JsonFeatureExtractor>(opt);
}

} // namespace sdqc
