/* -----------------------------------------------------------
 *  main.cpp – driver for the SDQC stance classifier
 * ----------------------------------------------------------- */
#include <fstream>
#include <iostream>
#include <optional>

#include "sdqc/common.hpp"
#include "sdqc/dataset.hpp"
#include "sdqc/features.hpp"
#include "sdqc/profiles.hpp"
#include "sdqc/sdqc.hpp"
#include "sdqc/search.hpp"

#ifndef SDQC_DEFAULT_CONFIG
#define SDQC_DEFAULT_CONFIG "config/sdqc.json"
#endif

using namespace sdqc;

static void usage()
{
    std::cerr <<
        "usage: sdqc --train=<threads.json> --eval=<threads.json>\n"
        "            --train_labels=<labels.json> --eval_labels=<labels.json>\n"
        "            [--config=<sdqc.json>] [--filter_short] [--threshold=<x>]\n"
        "            [--folds=<k>] [--threads=<n>] [--output=<predictions.json>]\n";
}

int main(int argc, char* argv[])
{
    /* ========== 1. CLI and defaults ========================= */
    std::string train_path, eval_path, train_labels, eval_labels, output;
    std::string config_path = SDQC_DEFAULT_CONFIG;

    /* unset ⇒ keep the config value */
    bool                  filter_short = false;
    std::optional<double> threshold;
    std::optional<int>    folds;
    std::optional<int>    threads;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if      (a.rfind("--train=",0)==0)        train_path   = a.substr(8);
            else if (a.rfind("--eval=",0)==0)         eval_path    = a.substr(7);
            else if (a.rfind("--train_labels=",0)==0) train_labels = a.substr(15);
            else if (a.rfind("--eval_labels=",0)==0)  eval_labels  = a.substr(14);
            else if (a.rfind("--config=",0)==0)       config_path  = a.substr(9);
            else if (a.rfind("--output=",0)==0)       output       = a.substr(9);
            else if (a.rfind("--threshold=",0)==0)    threshold    = std::stod(a.substr(12));
            else if (a.rfind("--folds=",0)==0)        folds        = std::stoi(a.substr(8));
            else if (a.rfind("--threads=",0)==0)      threads      = std::stoi(a.substr(10));
            else if (a == "--filter_short")           filter_short = true;
            else if (a == "--help" || a == "-h")    { usage(); return 0; }
            else                                      logW("ignored arg: "+a);
        }
    } catch (const std::exception& e) {
        logE(std::string("bad numeric argument: ") + e.what());
        return 1;
    }

    if (train_path.empty() || eval_path.empty() || train_labels.empty() || eval_labels.empty()) {
        logE("--train, --eval, --train_labels and --eval_labels are required");
        usage();
        return 1;
    }

    try {
        /* ========== 2. config, CLI overrides ================ */
        SdqcConfig cfg = load_config(config_path);
        if (filter_short) cfg.run.filter_short         = true;
        if (threshold)    cfg.run.similarity_threshold = *threshold;
        if (folds)        cfg.run.fold_count           = *folds;
        if (threads)      cfg.run.threads              = *threads;
        validate(cfg.run);

        /* ========== 3. data ================================= */
        ThreadStore store;
        auto train = load_threads(train_path, store);
        auto eval  = load_threads(eval_path,  store);
        Annotations train_ann = load_annotations(train_labels);
        Annotations eval_ann  = load_annotations(eval_labels);

        /* ========== 4. run ================================== */
        auto extractor = make_json_extractor(cfg.run.extractor);
        auto search    = make_grid_search(cfg.run.threads);

        Annotations pred = classify(store, train, eval, train_ann, eval_ann,
                                    *extractor, cfg, *search, std::cout);

        /* ========== 5. predictions ========================= */
        json j = json::object();
        for (const Message* m : eval) j[m->id] = to_string(pred.at(m->id));

        if (output.empty()) {
            std::cout << j.dump(2) << '\n';
        } else {
            std::ofstream f(output);
            if (!f) throw std::runtime_error("cannot write " + output);
            f << j.dump(2) << '\n';
            logI("predictions written to " + output);
        }
    } catch (const std::exception& e) {
        logE(e.what());
        return 1;
    }
    return 0;
}
