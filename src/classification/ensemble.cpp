/* -----------------------------------------------------------
 *  ensemble.cpp – priority combiner + strategy selection
 * ----------------------------------------------------------- */
#include <stdexcept>

#include "sdqc/common.hpp"
#include "sdqc/ensemble.hpp"
#include "sdqc/evaluation.hpp"

namespace sdqc {

const char* to_string(Strategy s)
{
    return s == Strategy::WithDeny ? "with-deny" : "without-deny";
}

std::vector<Stance> combine(Strategy                        strategy,
                            const std::vector<Stance>&      base,
                            const std::vector<std::string>& deny,
                            const std::vector<std::string>& query)
{
    if (deny.size() != base.size() || query.size() != base.size())
        throw std::runtime_error("ensemble: prediction sequences differ in length");

    const std::string Q = to_string(Stance::Query);
    const std::string D = to_string(Stance::Deny);

    std::vector<Stance> out(base.size());
    for (size_t i = 0; i < base.size(); ++i) {
        if (strategy == Strategy::WithoutDeny) {
            if (base[i] == Stance::Comment) out[i] = Stance::Comment;
            else if (query[i] == Q)         out[i] = Stance::Query;
            else                            out[i] = base[i];
        } else {
            if (query[i] == Q)              out[i] = Stance::Query;
            else if (deny[i] == D)          out[i] = Stance::Deny;
            else                            out[i] = base[i];
        }
    }
    return out;
}

EnsembleResult select_strategy(const std::vector<Stance>&      base,
                               const std::vector<std::string>& deny,
                               const std::vector<std::string>& query,
                               const std::vector<Stance>&      gold)
{
    if (gold.size() != base.size())
        throw std::runtime_error("ensemble: gold labels differ in length from predictions");

    EnsembleResult r;
    r.without_deny     = combine(Strategy::WithoutDeny, base, deny, query);
    r.with_deny        = combine(Strategy::WithDeny,    base, deny, query);
    r.acc_without_deny = accuracy(gold, r.without_deny);
    r.acc_with_deny    = accuracy(gold, r.with_deny);
    r.chosen = r.acc_with_deny > r.acc_without_deny ? Strategy::WithDeny : Strategy::WithoutDeny;

    logI(std::string("ensemble: ") + to_string(r.chosen) + " (w/o deny " +
         fmt_double(r.acc_without_deny) + ", w/ deny " + fmt_double(r.acc_with_deny) + ")");
    return r;
}

} // namespace sdqc
