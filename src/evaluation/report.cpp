/* -----------------------------------------------------------
 *  report.cpp – banners, misclassification listing, search summary
 * ----------------------------------------------------------- */
#include <ostream>
#include <stdexcept>

#include "sdqc/common.hpp"
#include "sdqc/evaluation.hpp"
#include "sdqc/features.hpp"
#include "sdqc/search.hpp"

namespace sdqc {

std::vector<Misclassified> misclassified(Stance                              target,
                                         const std::vector<const Message*>&  eval,
                                         const std::vector<std::string>&     pred,
                                         const std::vector<Stance>&          gold,
                                         const ThreadStore&                  store,
                                         const IFeatureExtractor&            extractor)
{
    if (pred.size() != eval.size() || gold.size() != eval.size())
        throw std::runtime_error("misclassification listing: inputs differ in length");

    const std::string pos = to_string(target);
    const std::string neg = not_label(target);

    std::vector<Misclassified> out;
    for (size_t i = 0; i < eval.size(); ++i) {
        const bool hit = (pred[i] == pos && gold[i] != target) ||
                         (pred[i] == neg && gold[i] == target);
        if (!hit) continue;
        const Message& root = store.root_of(*eval[i]);
        out.push_back({ to_string(gold[i]), pred[i],
                        extractor.normalize_text(*eval[i]),
                        extractor.normalize_text(root) });
    }
    return out;
}

void print_banner(std::ostream& os, const std::string& title)
{
    const size_t W = 58;
    const std::string bar(W + 2, '=');
    const size_t pad  = title.size() < W ? W - title.size() : 0;
    const size_t left = pad / 2;
    os << bar << '\n'
       << '|' << std::string(W, ' ') << "|\n"
       << '|' << std::string(left, ' ') << title << std::string(pad - left, ' ') << "|\n"
       << '|' << std::string(W, ' ') << "|\n"
       << bar << '\n';
}

void print_misclassified(std::ostream& os, const std::string& title,
                         const std::vector<Misclassified>& rows)
{
    print_banner(os, title);
    for (const auto& r : rows)
        os << r.gold << '\t' << r.predicted << '\t' << r.text << "\n\t\t" << r.root_text << '\n';
}

void print_search_summary(std::ostream& os, const std::string& name, const SearchResult& r)
{
    print_banner(os, name + "_grid");
    os << "Best " << name << "_grid score: " << fmt_double(r.best_score, 4) << '\n';
    if (r.best_model) {
        os << "weights:\n";
        for (const auto& kv : r.best_model->weights())
            os << "  " << kv.first << ": " << kv.second << '\n';
    }
    const TrainOpt& o = r.best.svm;
    os << "C:\t"      << o.C << '\n';
    if (o.kernel != Kernel::Linear) os << "gamma:\t" << o.gamma << '\n';
    os << "kernel:\t" << to_string(o.kernel) << '\n';
    if (r.candidates.size() > 1) {
        os << "candidates:\n";
        for (size_t c = 0; c < r.candidates.size(); ++c) {
            os << "  [" << c << "] " << fmt_double(r.scores[c], 4) << "  "
               << describe(r.candidates[c].svm);
            for (const auto& kv : r.candidates[c].weights) os << ' ' << kv.first << '=' << kv.second;
            os << '\n';
        }
    }
}

} // namespace sdqc
