/* -----------------------------------------------------------
 *  metrics.cpp – accuracy, per-class P/R/F1, confusion matrix
 * ----------------------------------------------------------- */
#include <algorithm>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

#include "sdqc/evaluation.hpp"

namespace sdqc {

namespace {

void check_sizes(size_t a, size_t b)
{
    if (a != b)
        throw std::runtime_error("metrics: " + std::to_string(a) + " gold labels vs " +
                                 std::to_string(b) + " predictions");
}

std::vector<std::string> label_union(const std::vector<std::string>& gold,
                                     const std::vector<std::string>& pred)
{
    std::set<std::string> s(gold.begin(), gold.end());
    s.insert(pred.begin(), pred.end());
    return { s.begin(), s.end() };
}

} // namespace

double accuracy(const std::vector<std::string>& gold, const std::vector<std::string>& pred)
{
    check_sizes(gold.size(), pred.size());
    if (gold.empty()) return 0.0;
    size_t ok = 0;
    for (size_t i = 0; i < gold.size(); ++i) ok += (gold[i] == pred[i]);
    return double(ok) / double(gold.size());
}

double accuracy(const std::vector<Stance>& gold, const std::vector<Stance>& pred)
{
    check_sizes(gold.size(), pred.size());
    if (gold.empty()) return 0.0;
    size_t ok = 0;
    for (size_t i = 0; i < gold.size(); ++i) ok += (gold[i] == pred[i]);
    return double(ok) / double(gold.size());
}

std::vector<std::string> to_strings(const std::vector<Stance>& v)
{
    std::vector<std::string> out;
    out.reserve(v.size());
    for (Stance s : v) out.emplace_back(to_string(s));
    return out;
}

ConfusionMatrix confusion_matrix(const std::vector<std::string>& gold,
                                 const std::vector<std::string>& pred)
{
    check_sizes(gold.size(), pred.size());
    ConfusionMatrix m;
    m.labels = label_union(gold, pred);

    std::map<std::string, size_t> idx;
    for (size_t i = 0; i < m.labels.size(); ++i) idx[m.labels[i]] = i;

    m.counts.assign(m.labels.size(), std::vector<size_t>(m.labels.size(), 0));
    for (size_t i = 0; i < gold.size(); ++i) ++m.counts[idx[gold[i]]][idx[pred[i]]];
    return m;
}

ClassificationReport classification_report(const std::vector<std::string>& gold,
                                           const std::vector<std::string>& pred)
{
    ConfusionMatrix m = confusion_matrix(gold, pred);
    const size_t L = m.labels.size();

    ClassificationReport r;
    r.total    = gold.size();
    r.accuracy = accuracy(gold, pred);
    r.macro.label    = "macro avg";
    r.weighted.label = "weighted avg";

    for (size_t c = 0; c < L; ++c) {
        size_t tp = m.counts[c][c], pred_c = 0, gold_c = 0;
        for (size_t k = 0; k < L; ++k) { pred_c += m.counts[k][c]; gold_c += m.counts[c][k]; }

        ClassStats s;
        s.label     = m.labels[c];
        s.support   = gold_c;
        s.precision = pred_c ? double(tp) / double(pred_c) : 0.0;
        s.recall    = gold_c ? double(tp) / double(gold_c) : 0.0;
        s.f1        = (s.precision + s.recall) > 0
                          ? 2.0 * s.precision * s.recall / (s.precision + s.recall) : 0.0;
        r.per_class.push_back(s);

        r.macro.precision += s.precision;
        r.macro.recall    += s.recall;
        r.macro.f1        += s.f1;
        r.weighted.precision += s.precision * double(s.support);
        r.weighted.recall    += s.recall    * double(s.support);
        r.weighted.f1        += s.f1        * double(s.support);
    }
    if (L) {
        r.macro.precision /= double(L);
        r.macro.recall    /= double(L);
        r.macro.f1        /= double(L);
    }
    if (r.total) {
        r.weighted.precision /= double(r.total);
        r.weighted.recall    /= double(r.total);
        r.weighted.f1        /= double(r.total);
    }
    r.macro.support = r.weighted.support = r.total;
    return r;
}

std::string format_report(const ClassificationReport& r)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << std::setw(14) << "" << std::setw(10) << "precision" << std::setw(10) << "recall"
       << std::setw(10) << "f1-score"  << std::setw(10) << "support" << '\n';

    auto row = [&os](const ClassStats& s) {
        os << std::setw(14) << s.label << std::setw(10) << s.precision << std::setw(10) << s.recall
           << std::setw(10) << s.f1 << std::setw(10) << s.support << '\n';
    };
    for (const auto& s : r.per_class) row(s);
    os << '\n';
    os << std::setw(14) << "accuracy" << std::setw(30) << r.accuracy
       << std::setw(10) << r.total << '\n';
    row(r.macro);
    row(r.weighted);
    return os.str();
}

std::string format_confusion(const ConfusionMatrix& m)
{
    size_t w = 6;
    for (const auto& l : m.labels) w = std::max(w, l.size() + 2);

    std::ostringstream os;
    os << std::setw(int(w)) << "gold\\pred";
    for (const auto& l : m.labels) os << std::setw(int(w)) << l;
    os << '\n';
    for (size_t r = 0; r < m.labels.size(); ++r) {
        os << std::setw(int(w)) << m.labels[r];
        for (size_t c = 0; c < m.labels.size(); ++c) os << std::setw(int(w)) << m.counts[r][c];
        os << '\n';
    }
    return os.str();
}

} // namespace sdqc
