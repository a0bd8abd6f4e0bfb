/**********************************************************************
 *  sdqc.cpp  –  support / deny / query / comment for Task A
 *
 *  1. filter training replies that only echo their root
 *  2. one FeatureBag per message (extractor runs once)
 *  3. base (4-class), deny and query (one-vs-rest) grid searches
 *  4. predict eval, print listings, reports, confusion matrices
 *  5. combine with / without the deny member, keep the better one
 *********************************************************************/
#include <chrono>

#include "sdqc/common.hpp"
#include "sdqc/dataset.hpp"
#include "sdqc/ensemble.hpp"
#include "sdqc/evaluation.hpp"
#include "sdqc/sdqc.hpp"
#include "sdqc/training_filter.hpp"

namespace sdqc {

namespace {

std::vector<FeatureBag> extract_all(const std::vector<const Message*>& msgs,
                                    const ThreadStore&                 store,
                                    const IFeatureExtractor&           extractor,
                                    const ExtractOptions&              opt)
{
    std::vector<FeatureBag> bags;
    bags.reserve(msgs.size());
    for (const Message* m : msgs) bags.push_back(extractor.extract(*m, store, opt));
    return bags;
}

std::vector<const FeatureBag*> pointers(const std::vector<FeatureBag>& bags)
{
    std::vector<const FeatureBag*> out;
    out.reserve(bags.size());
    for (const auto& b : bags) out.push_back(&b);
    return out;
}

std::vector<std::string> one_vs_rest_labels(const std::vector<const Message*>& msgs,
                                            const Annotations& ann, Stance target)
{
    OneVsRest ovr = relabel_one_vs_rest(ann, target);
    std::vector<std::string> y;
    y.reserve(msgs.size());
    for (const Message* m : msgs) y.push_back(ovr.at(m->id));
    return y;
}

std::vector<Stance> gold_of(const std::vector<const Message*>& msgs, const Annotations& ann)
{
    std::vector<Stance> y;
    y.reserve(msgs.size());
    for (const Message* m : msgs) y.push_back(ann.at(m->id));
    return y;
}

void print_member(std::ostream& out, const std::string& title,
                  const std::vector<std::string>& gold, const std::vector<std::string>& pred)
{
    out << "classification report (" << title << "):\n"
        << format_report(classification_report(gold, pred))
        << "confusion matrix (" << title << "):\n"
        << format_confusion(confusion_matrix(gold, pred)) << '\n';
}

} // namespace

Annotations classify(const ThreadStore&                 store,
                     const std::vector<const Message*>& train,
                     const std::vector<const Message*>& eval,
                     const Annotations&                 train_annotations,
                     const Annotations&                 eval_annotations,
                     const IFeatureExtractor&           extractor,
                     const SdqcConfig&                  config,
                     const ISearchStrategy&             search,
                     std::ostream&                      out)
{
    logI("Beginning SDQC task (" + config.run.extractor.task + ")");
    require_annotations(train, train_annotations, "training");
    require_annotations(eval,  eval_annotations,  "evaluation");

    /* ---------- 1. filter ---------- */
    const std::vector<const Message*> kept =
        filter_training(train, store, extractor,
                        config.run.filter_short, config.run.similarity_threshold);
    if (kept.empty())
        throw std::runtime_error("training set is empty after filtering");

    /* ---------- 2. features + labels ---------- */
    const std::vector<FeatureBag> train_bags = extract_all(kept, store, extractor, config.run.extractor);
    const std::vector<FeatureBag> eval_bags  = extract_all(eval, store, extractor, config.run.extractor);

    const std::vector<Stance> y_train = gold_of(kept, train_annotations);
    const std::vector<Stance> y_eval  = gold_of(eval, eval_annotations);

    LabeledData base_data{ pointers(train_bags), to_strings(y_train) };
    LabeledData deny_data{ base_data.bags, one_vs_rest_labels(kept, train_annotations, Stance::Deny) };
    LabeledData query_data{ base_data.bags, one_vs_rest_labels(kept, train_annotations, Stance::Query) };

    const std::vector<std::string> y_eval_base  = to_strings(y_eval);
    const std::vector<std::string> y_eval_deny  = one_vs_rest_labels(eval, eval_annotations, Stance::Deny);
    const std::vector<std::string> y_eval_query = one_vs_rest_labels(eval, eval_annotations, Stance::Query);

    /* ---------- 3. bank ---------- */
    logI("Beginning training");
    const int k = config.run.fold_count;
    SearchResult base_res  = search.search(config.base,  config.base.search,  base_data,  k);
    print_search_summary(out, config.base.name, base_res);
    SearchResult deny_res  = search.search(config.deny,  config.deny.search,  deny_data,  k);
    print_search_summary(out, config.deny.name, deny_res);
    SearchResult query_res = search.search(config.query, config.query.search, query_data, k);
    print_search_summary(out, config.query.name, query_res);

    /* ---------- 4. predict ---------- */
    logI("Beginning evaluation");
    using clock = std::chrono::steady_clock;
    auto t0 = clock::now();

    const auto eval_ptrs = pointers(eval_bags);
    const std::vector<std::string> base_raw   = base_res.best_model->predict(eval_ptrs);
    const std::vector<std::string> deny_pred  = deny_res.best_model->predict(eval_ptrs);
    const std::vector<std::string> query_pred = query_res.best_model->predict(eval_ptrs);

    std::vector<Stance> base_pred;
    base_pred.reserve(base_raw.size());
    for (const auto& s : base_raw) base_pred.push_back(parse_stance(s));

    logI("eval time: " + fmt_double(std::chrono::duration<double>(clock::now() - t0).count()) + " s");

    print_misclassified(out, "Misclassified - query",
                        misclassified(Stance::Query, eval, query_pred, y_eval, store, extractor));
    print_misclassified(out, "Misclassified - deny",
                        misclassified(Stance::Deny,  eval, deny_pred,  y_eval, store, extractor));

    /* ---------- 5. ensemble ---------- */
    EnsembleResult ens = select_strategy(base_pred, deny_pred, query_pred, y_eval);
    const std::vector<std::string> wo_deny = to_strings(ens.without_deny);
    const std::vector<std::string> w_deny  = to_strings(ens.with_deny);

    logI("Completed SDQC task, printing results");
    logI("deny accuracy:    " + fmt_double(accuracy(y_eval_deny,  deny_pred)));
    logI("query accuracy:   " + fmt_double(accuracy(y_eval_query, query_pred)));
    logI("base accuracy:    " + fmt_double(accuracy(y_eval, base_pred)));
    logI("accuracy w/o d:   " + fmt_double(ens.acc_without_deny));
    logI("accuracy w/ d:    " + fmt_double(ens.acc_with_deny));

    print_member(out, "deny",                  y_eval_deny,  deny_pred);
    print_member(out, "query",                 y_eval_query, query_pred);
    print_member(out, "base",                  y_eval_base,  base_raw);
    print_member(out, "combined w/o deny",     y_eval_base,  wo_deny);
    print_member(out, "combined w deny",       y_eval_base,  w_deny);

    const std::vector<Stance>& final_labels = ens.final_labels();
    Annotations result;
    result.reserve(eval.size());
    for (size_t i = 0; i < eval.size(); ++i) result[eval[i]->id] = final_labels[i];
    return result;
}

} // namespace sdqc
