/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the abstraction layer
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "sdqc/tfidf.hpp"     // SpMat

namespace sdqc {

enum class Kernel { Linear, Rbf, Poly };

const char* to_string(Kernel k);
Kernel      parse_kernel(const std::string& s);   // throws on unknown

struct TrainOpt {
    /* C-SVC hyper-params – the linear kernel ignores gamma / degree / coef0 */
    Kernel  kernel    = Kernel::Rbf;
    double  C         = 1.0;
    double  gamma     = 0.0;      // ≤ 0 ⇒ 1 / n_features
    int     degree    = 3;
    double  coef0     = 0.0;
    bool    balanced  = false;    // C_c = C · n / (k · n_c)
    double  tol       = 1e-3;     // KKT stopping tolerance
    size_t  cache_mb  = 200;      // kernel-row cache per binary problem
    long    max_iter  = -1;       // ≤ 0 ⇒ max(1e7, 100·n)
};

struct IModel {
    virtual ~IModel() = default;

    /*  train on rows of X with string labels y (any label set ≥ 1 class) */
    virtual void fit(const SpMat&                    X,
                     const std::vector<std::string>& y,
                     const TrainOpt&                 opt) = 0;

    /*  hard label per row; const and safe to call concurrently      */
    virtual std::vector<std::string> predict(const SpMat& X) const = 0;

    /*  sorted distinct training labels                              */
    virtual const std::vector<std::string>& classes() const = 0;

    /*  helper so the search can rank folds with plain accuracy      */
    double score(const SpMat& X, const std::vector<std::string>& y) const
    {
        if (y.empty()) return 0.0;
        auto pred = predict(X);
        size_t ok = 0;
        for (size_t i = 0; i < y.size(); ++i) ok += (pred[i] == y[i]);
        return double(ok) / double(y.size());
    }
};

/* factory – support-vector classifier (SMO, one-vs-one for k > 2) */
std::unique_ptr<IModel> make_svc();

} // namespace sdqc
