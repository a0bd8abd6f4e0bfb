/* ──────────────────────────────────────────────────────────────
   sdqc.hpp  –  the stance-classification job

     train  ─► filter ─► extract ─► 3 × grid search (base/deny/query)
     eval   ─► extract ─► predict ─► ensemble ─► id → Stance
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <iostream>
#include <vector>

#include "sdqc/features.hpp"
#include "sdqc/labels.hpp"
#include "sdqc/profiles.hpp"
#include "sdqc/search.hpp"
#include "sdqc/thread_store.hpp"

namespace sdqc {

/*  Trains the three bank members on `train` (after filtering), predicts
 *  `eval`, prints accuracy / reports / confusion matrices / listings to
 *  `out` and returns the chosen ensemble's label for every eval message.
 *  Throws on missing annotations, empty training set, missing features. */
Annotations classify(const ThreadStore&                 store,
                     const std::vector<const Message*>& train,
                     const std::vector<const Message*>& eval,
                     const Annotations&                 train_annotations,
                     const Annotations&                 eval_annotations,
                     const IFeatureExtractor&           extractor,
                     const SdqcConfig&                  config,
                     const ISearchStrategy&             search,
                     std::ostream&                      out = std::cout);

} // namespace sdqc
