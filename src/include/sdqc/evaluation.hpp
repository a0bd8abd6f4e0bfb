/* ──────────────────────────────────────────────────────────────
   evaluation.hpp  –  accuracy / per-class report / confusion matrix
                      + the printed run report
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include "sdqc/labels.hpp"
#include "sdqc/thread_store.hpp"

namespace sdqc {

struct IFeatureExtractor;
struct SearchResult;

double accuracy(const std::vector<std::string>& gold, const std::vector<std::string>& pred);
double accuracy(const std::vector<Stance>& gold, const std::vector<Stance>& pred);

std::vector<std::string> to_strings(const std::vector<Stance>& v);

struct ClassStats {
    std::string label;
    double      precision = 0, recall = 0, f1 = 0;
    size_t      support   = 0;
};

struct ClassificationReport {
    std::vector<ClassStats> per_class;     // sorted label order
    ClassStats              macro;
    ClassStats              weighted;
    double                  accuracy = 0;
    size_t                  total    = 0;
};

/* labels = sorted union of gold and predicted */
ClassificationReport classification_report(const std::vector<std::string>& gold,
                                           const std::vector<std::string>& pred);

struct ConfusionMatrix {
    std::vector<std::string>         labels;   // rows = gold, cols = predicted
    std::vector<std::vector<size_t>> counts;
};

ConfusionMatrix confusion_matrix(const std::vector<std::string>& gold,
                                 const std::vector<std::string>& pred);

std::string format_report(const ClassificationReport& r);
std::string format_confusion(const ConfusionMatrix& m);

/* ────────── misclassification listing ────────── */
struct Misclassified {
    std::string gold;          // four-class gold label
    std::string predicted;     // target | not_<target>
    std::string text;          // normalised message text
    std::string root_text;     // normalised root text
};

/*  (pred == target ∧ gold ≠ target)  ∨  (pred == not_target ∧ gold == target) */
std::vector<Misclassified> misclassified(Stance                              target,
                                         const std::vector<const Message*>&  eval,
                                         const std::vector<std::string>&     pred,
                                         const std::vector<Stance>&          gold,
                                         const ThreadStore&                  store,
                                         const IFeatureExtractor&            extractor);

void print_banner(std::ostream& os, const std::string& title);
void print_misclassified(std::ostream& os, const std::string& title,
                         const std::vector<Misclassified>& rows);

/* best CV score, chosen hyper-parameters and channel weights */
void print_search_summary(std::ostream& os, const std::string& name, const SearchResult& r);

} // namespace sdqc
