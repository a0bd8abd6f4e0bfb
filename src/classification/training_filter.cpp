#include <unordered_map>

#include "sdqc/common.hpp"
#include "sdqc/tfidf.hpp"
#include "sdqc/training_filter.hpp"

namespace sdqc {

std::vector<const Message*> filter_training(const std::vector<const Message*>& messages,
                                            const ThreadStore&                 store,
                                            const IFeatureExtractor&           extractor,
                                            bool                               filter_short,
                                            double                             similarity_threshold,
                                            FilterStats*                       stats)
{
    FilterStats st;
    std::unordered_map<std::string, std::string> root_text;   // root id → normalised text

    std::vector<const Message*> out;
    out.reserve(messages.size());

    for (const Message* m : messages) {
        const Message& root = store.root_of(*m);
        if (&root == m) {                       // roots are never filtered
            out.push_back(m);
            continue;
        }

        auto it = root_text.find(root.id);
        if (it == root_text.end())
            it = root_text.emplace(root.id, extractor.normalize_text(root)).first;

        const std::string text = extractor.normalize_text(*m);

        if (filter_short && split_space(text).size() < 3) {
            ++st.too_short;
            continue;
        }

        if (pairwise_tfidf_similarity(it->second, text) >= similarity_threshold) {
            ++st.too_similar;
            continue;
        }
        out.push_back(m);
    }
    st.kept = out.size();

    logI("training filter: kept " + std::to_string(st.kept) + " of " +
         std::to_string(messages.size()) + " (" + std::to_string(st.too_short) +
         " too short, " + std::to_string(st.too_similar) + " too similar to root)");
    if (stats) *stats = st;
    return out;
}

} // namespace sdqc
