/* ──────────────────────────────────────────────────────────────
   training_filter.hpp  –  drop replies that only echo their root
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <vector>

#include "sdqc/features.hpp"
#include "sdqc/thread_store.hpp"

namespace sdqc {

struct FilterStats {
    size_t kept        = 0;
    size_t too_short   = 0;   // < 3 space-separated tokens
    size_t too_similar = 0;   // cosine(root, reply) ≥ threshold
};

/*  Roots are always kept, order is preserved.  A reply is dropped when
 *  filter_short and its normalised text has fewer than 3 tokens, or when
 *  its tf-idf cosine similarity to its root is ≥ similarity_threshold.  */
std::vector<const Message*> filter_training(const std::vector<const Message*>& messages,
                                            const ThreadStore&                 store,
                                            const IFeatureExtractor&           extractor,
                                            bool                               filter_short         = false,
                                            double                             similarity_threshold = 0.9,
                                            FilterStats*                       stats                = nullptr);

} // namespace sdqc
