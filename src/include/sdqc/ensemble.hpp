/* ──────────────────────────────────────────────────────────────
   ensemble.hpp  –  merge base / deny / query predictions

   without-deny :  base==comment → comment | query==query → query | base
   with-deny    :  query==query  → query   | deny==deny   → deny  | base
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "sdqc/labels.hpp"

namespace sdqc {

enum class Strategy { WithoutDeny, WithDeny };

const char* to_string(Strategy s);

/* per-position priority rule; all three inputs must have the same length */
std::vector<Stance> combine(Strategy                        strategy,
                            const std::vector<Stance>&      base,
                            const std::vector<std::string>& deny,
                            const std::vector<std::string>& query);

struct EnsembleResult {
    std::vector<Stance> without_deny;
    std::vector<Stance> with_deny;
    double              acc_without_deny = 0.0;
    double              acc_with_deny    = 0.0;
    Strategy            chosen           = Strategy::WithoutDeny;

    const std::vector<Stance>& final_labels() const
    {
        return chosen == Strategy::WithDeny ? with_deny : without_deny;
    }
};

/*  builds both sequences, scores them against gold and keeps the
 *  strictly better one.  A tie keeps without-deny.                  */
EnsembleResult select_strategy(const std::vector<Stance>&      base,
                               const std::vector<std::string>& deny,
                               const std::vector<std::string>& query,
                               const std::vector<Stance>&      gold);

} // namespace sdqc
