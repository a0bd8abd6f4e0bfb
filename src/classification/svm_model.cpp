/**********************************************************************
 *  svm_model.cpp  –  C-SVC behind the generic IModel interface
 *
 *  • dual solved with SMO, second-order working-set selection
 *  • kernel rows computed on demand, kept in an LRU cache
 *  • k > 2 classes  ⇒  one-vs-one, majority vote
 *  • class_weight=balanced  ⇒  C_c = C · n / (k · n_c)
 *
 *  ┌─ IModel ───────────────────────────────────────────────────┐
 *  │ fit     (X, y, TrainOpt)                                   │
 *  │ predict (X) const                                          │
 *  │ classes () const                                           │
 *  └────────────────────────────────────────────────────────────┘
 *********************************************************************/
#include <algorithm>
#include <cmath>
#include <limits>
#include <list>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include <Eigen/Dense>

#include "sdqc/common.hpp"
#include "sdqc/model_iface.hpp"

namespace sdqc {

const char* to_string(Kernel k)
{
    switch (k) {
        case Kernel::Linear: return "linear";
        case Kernel::Rbf:    return "rbf";
        case Kernel::Poly:   return "poly";
    }
    return "rbf";
}

Kernel parse_kernel(const std::string& s)
{
    if (s == "linear") return Kernel::Linear;
    if (s == "rbf")    return Kernel::Rbf;
    if (s == "poly")   return Kernel::Poly;
    throw std::runtime_error("unknown kernel '" + s + "'");
}

namespace {

constexpr double TAU = 1e-12;
constexpr double INF = std::numeric_limits<double>::infinity();

/* ──────────────────────────────────────────────────────────── */
/*                 1.  kernel function + row cache              */
/* ──────────────────────────────────────────────────────────── */
struct KernelFn {
    Kernel kind   = Kernel::Rbf;
    double gamma  = 1.0;
    int    degree = 3;
    double coef0  = 0.0;

    /* dot = <a,b>, sa = <a,a>, sb = <b,b> */
    double operator()(double dot, double sa, double sb) const
    {
        switch (kind) {
            case Kernel::Linear: return dot;
            case Kernel::Rbf:    return std::exp(-gamma * std::max(0.0, sa + sb - 2.0 * dot));
            case Kernel::Poly:   return std::pow(gamma * dot + coef0, double(degree));
        }
        return dot;
    }
};

Eigen::VectorXd row_norms(const SpMat& X)
{
    Eigen::VectorXd sq(X.rows());
    for (Eigen::Index r = 0; r < X.outerSize(); ++r) {
        double s = 0.0;
        for (SpMat::InnerIterator it(X, r); it; ++it) s += it.value() * it.value();
        sq[r] = s;
    }
    return sq;
}

class KernelCache {
public:
    KernelCache(const SpMat& X, const KernelFn& fn, size_t cache_mb)
        : X_(X), fn_(fn), sq_(row_norms(X))
    {
        const size_t row_bytes = std::max<size_t>(1, size_t(X.rows()) * sizeof(double));
        capacity_ = std::max<size_t>(2, cache_mb * 1024 * 1024 / row_bytes);
        diag_.resize(X.rows());
        for (Eigen::Index i = 0; i < X.rows(); ++i) diag_[i] = fn_(sq_[i], sq_[i], sq_[i]);
    }

    double diag(int i) const { return diag_[i]; }

    /* K(i, ·) – the reference stays valid until two newer rows are requested */
    const Eigen::VectorXd& row(int i)
    {
        auto it = rows_.find(i);
        if (it != rows_.end()) {
            lru_.splice(lru_.begin(), lru_, it->second.second);
            return it->second.first;
        }
        if (rows_.size() >= capacity_) {
            rows_.erase(lru_.back());
            lru_.pop_back();
        }
        Eigen::VectorXd xi   = X_.row(i).transpose().toDense();
        Eigen::VectorXd dots = X_ * xi;
        for (Eigen::Index j = 0; j < dots.size(); ++j)
            dots[j] = fn_(dots[j], sq_[i], sq_[j]);

        lru_.push_front(i);
        auto& slot = rows_[i];
        slot.first  = std::move(dots);
        slot.second = lru_.begin();
        return slot.first;
    }

private:
    const SpMat&    X_;
    KernelFn        fn_;
    Eigen::VectorXd sq_;
    Eigen::VectorXd diag_;
    size_t          capacity_ = 2;
    std::list<int>  lru_;
    std::unordered_map<int, std::pair<Eigen::VectorXd, std::list<int>::iterator>> rows_;
};

/* ──────────────────────────────────────────────────────────── */
/*                 2.  binary SMO solver                        */
/* ──────────────────────────────────────────────────────────── */
struct BinarySolution {
    Eigen::VectorXd alpha;
    double          rho   = 0.0;
    long            iters = 0;
};

/*  min ½ αᵀQα − eᵀα   s.t.  yᵀα = 0 , 0 ≤ α_i ≤ C_i ,  Q_ij = y_i y_j K_ij */
BinarySolution solve_smo(KernelCache&               K,
                         const std::vector<int>&    y,      // ±1
                         const std::vector<double>& Cb,     // per-sample bound
                         double                     eps,
                         long                       max_iter)
{
    const int n = int(y.size());
    BinarySolution sol;
    sol.alpha = Eigen::VectorXd::Zero(n);
    Eigen::VectorXd G = Eigen::VectorXd::Constant(n, -1.0);   // ∇ = Qα − e
    Eigen::VectorXd& a = sol.alpha;

    auto upper = [&](int t){ return a[t] >= Cb[t]; };
    auto lower = [&](int t){ return a[t] <= 0.0; };

    if (max_iter <= 0)
        max_iter = std::max<long>(10000000L, 100L * n);

    long iter = 0;
    for (; iter < max_iter; ++iter) {
        /* ---- working set: i maximises −y∇ over I_up ---- */
        double Gmax = -INF, Gmax2 = -INF, obj_min = INF;
        int    i = -1, j = -1;
        for (int t = 0; t < n; ++t) {
            if (y[t] == +1) { if (!upper(t) && -G[t] >= Gmax) { Gmax = -G[t]; i = t; } }
            else            { if (!lower(t) &&  G[t] >= Gmax) { Gmax =  G[t]; i = t; } }
        }
        if (i == -1) break;

        const Eigen::VectorXd& Ki = K.row(i);
        for (int t = 0; t < n; ++t) {
            if (y[t] == +1) {
                if (lower(t)) continue;
                double diff = Gmax + G[t];
                if (G[t] >= Gmax2) Gmax2 = G[t];
                if (diff > 0) {
                    double quad = K.diag(i) + K.diag(t) - 2.0 * Ki[t];
                    double obj  = -(diff * diff) / (quad > 0 ? quad : TAU);
                    if (obj <= obj_min) { j = t; obj_min = obj; }
                }
            } else {
                if (upper(t)) continue;
                double diff = Gmax - G[t];
                if (-G[t] >= Gmax2) Gmax2 = -G[t];
                if (diff > 0) {
                    double quad = K.diag(i) + K.diag(t) - 2.0 * Ki[t];
                    double obj  = -(diff * diff) / (quad > 0 ? quad : TAU);
                    if (obj <= obj_min) { j = t; obj_min = obj; }
                }
            }
        }
        if (Gmax + Gmax2 < eps || j == -1) break;

        /* ---- analytic two-variable update ---- */
        const Eigen::VectorXd& Kj = K.row(j);
        const Eigen::VectorXd& Ki2 = K.row(i);          // still cached (capacity ≥ 2)
        const double Qij = y[i] * y[j] * Ki2[j];
        const double Ci = Cb[i], Cj = Cb[j];
        const double old_ai = a[i], old_aj = a[j];

        if (y[i] != y[j]) {
            double quad  = K.diag(i) + K.diag(j) + 2.0 * Qij;
            double delta = (-G[i] - G[j]) / (quad > 0 ? quad : TAU);
            double diff  = a[i] - a[j];
            a[i] += delta; a[j] += delta;
            if (diff > 0) { if (a[j] < 0) { a[j] = 0; a[i] = diff; } }
            else          { if (a[i] < 0) { a[i] = 0; a[j] = -diff; } }
            if (diff > Ci - Cj) { if (a[i] > Ci) { a[i] = Ci; a[j] = Ci - diff; } }
            else                { if (a[j] > Cj) { a[j] = Cj; a[i] = Cj + diff; } }
        } else {
            double quad  = K.diag(i) + K.diag(j) - 2.0 * Qij;
            double delta = (G[i] - G[j]) / (quad > 0 ? quad : TAU);
            double sum   = a[i] + a[j];
            a[i] -= delta; a[j] += delta;
            if (sum > Ci) { if (a[i] > Ci) { a[i] = Ci; a[j] = sum - Ci; } }
            else          { if (a[j] < 0)  { a[j] = 0;  a[i] = sum; } }
            if (sum > Cj) { if (a[j] > Cj) { a[j] = Cj; a[i] = sum - Cj; } }
            else          { if (a[i] < 0)  { a[i] = 0;  a[j] = sum; } }
        }

        const double dai = a[i] - old_ai, daj = a[j] - old_aj;
        for (int t = 0; t < n; ++t)
            G[t] += y[t] * (y[i] * Ki2[t] * dai + y[j] * Kj[t] * daj);
    }
    if (iter >= max_iter)
        logW("SMO reached max_iter=" + std::to_string(max_iter) + " before converging");
    sol.iters = iter;

    /* ---- bias: mean over free SVs, else midpoint of the feasible band ---- */
    double ub = INF, lb = -INF, sum_free = 0.0;
    int    nr_free = 0;
    for (int t = 0; t < n; ++t) {
        const double yG = y[t] * G[t];
        if (upper(t))      { if (y[t] == -1) ub = std::min(ub, yG); else lb = std::max(lb, yG); }
        else if (lower(t)) { if (y[t] == +1) ub = std::min(ub, yG); else lb = std::max(lb, yG); }
        else               { ++nr_free; sum_free += yG; }
    }
    sol.rho = nr_free > 0 ? sum_free / nr_free : (ub + lb) / 2.0;
    return sol;
}

SpMat select_rows(const SpMat& X, const std::vector<int>& idx)
{
    std::vector<Eigen::Triplet<double>> trip;
    for (size_t r = 0; r < idx.size(); ++r)
        for (SpMat::InnerIterator it(X, idx[r]); it; ++it)
            trip.emplace_back(int(r), int(it.col()), it.value());
    SpMat out(Eigen::Index(idx.size()), X.cols());
    out.setFromTriplets(trip.begin(), trip.end());
    out.makeCompressed();
    return out;
}

/* ──────────────────────────────────────────────────────────── */
/*                 3.  C-SVC (one-vs-one)                       */
/* ──────────────────────────────────────────────────────────── */
struct PairModel {
    int             pos = 0, neg = 1;     // class indices, pos is +1
    SpMat           sv;                   // support vectors (rows)
    Eigen::VectorXd sv_sq;                // <sv,sv>
    Eigen::VectorXd coef;                 // α_i y_i
    double          rho = 0.0;

    double decision(const Eigen::VectorXd& x, double x_sq, const KernelFn& fn) const
    {
        if (sv.rows() == 0) return -rho;
        Eigen::VectorXd dots = sv * x;
        double s = 0.0;
        for (Eigen::Index k = 0; k < dots.size(); ++k)
            s += coef[k] * fn(dots[k], sv_sq[k], x_sq);
        return s - rho;
    }
};

class SvcModel : public IModel {
public:
    void fit(const SpMat& X, const std::vector<std::string>& y, const TrainOpt& opt) override
    {
        if (X.rows() == 0 || y.empty())
            throw std::runtime_error("SVC: empty training set");
        if (size_t(X.rows()) != y.size())
            throw std::runtime_error("SVC: " + std::to_string(X.rows()) + " rows but " +
                                     std::to_string(y.size()) + " labels");
        if (opt.C <= 0.0) throw std::runtime_error("SVC: C must be positive");

        std::set<std::string> uniq(y.begin(), y.end());
        classes_.assign(uniq.begin(), uniq.end());
        pairs_.clear();

        fn_.kind   = opt.kernel;
        fn_.gamma  = opt.gamma > 0.0 ? opt.gamma
                                     : 1.0 / double(std::max<Eigen::Index>(1, X.cols()));
        fn_.degree = opt.degree;
        fn_.coef0  = opt.coef0;

        if (classes_.size() == 1) {
            logW("SVC: single class '" + classes_.front() + "' in training data, constant predictor");
            return;
        }

        std::map<std::string, int> cls_id;
        for (size_t c = 0; c < classes_.size(); ++c) cls_id[classes_[c]] = int(c);

        std::vector<int>    label(y.size());
        std::vector<size_t> count(classes_.size(), 0);
        for (size_t i = 0; i < y.size(); ++i) { label[i] = cls_id[y[i]]; ++count[label[i]]; }

        /* per-class C */
        std::vector<double> Cc(classes_.size(), opt.C);
        if (opt.balanced)
            for (size_t c = 0; c < classes_.size(); ++c)
                Cc[c] = opt.C * double(y.size()) / (double(classes_.size()) * double(count[c]));

        for (int p = 0; p < int(classes_.size()); ++p)
            for (int q = p + 1; q < int(classes_.size()); ++q)
                pairs_.push_back(fit_pair(X, label, p, q, Cc, opt));
    }

    std::vector<std::string> predict(const SpMat& X) const override
    {
        if (classes_.empty()) throw std::runtime_error("SVC: predict before fit");

        std::vector<std::string> out(size_t(X.rows()));
        if (classes_.size() == 1) {
            std::fill(out.begin(), out.end(), classes_.front());
            return out;
        }

        for (Eigen::Index r = 0; r < X.rows(); ++r) {
            Eigen::VectorXd x = Eigen::VectorXd::Zero(X.cols());
            double x_sq = 0.0;
            for (SpMat::InnerIterator it(X, r); it; ++it) {
                if (it.col() < x.size()) x[it.col()] = it.value();
                x_sq += it.value() * it.value();
            }

            std::vector<int> votes(classes_.size(), 0);
            for (const auto& pm : pairs_)
                ++votes[pm.decision(x, x_sq, fn_) > 0 ? pm.pos : pm.neg];

            /* first maximum wins */
            size_t best = 0;
            for (size_t c = 1; c < votes.size(); ++c)
                if (votes[c] > votes[best]) best = c;
            out[size_t(r)] = classes_[best];
        }
        return out;
    }

    const std::vector<std::string>& classes() const override { return classes_; }

private:
    PairModel fit_pair(const SpMat& X, const std::vector<int>& label,
                       int p, int q, const std::vector<double>& Cc, const TrainOpt& opt) const
    {
        std::vector<int> idx;
        for (int i = 0; i < int(label.size()); ++i)
            if (label[i] == p || label[i] == q) idx.push_back(i);

        SpMat Xs = select_rows(X, idx);
        std::vector<int>    ys(idx.size());
        std::vector<double> Cb(idx.size());
        for (size_t k = 0; k < idx.size(); ++k) {
            ys[k] = label[idx[k]] == p ? +1 : -1;
            Cb[k] = Cc[label[idx[k]]];
        }

        KernelCache    cache(Xs, fn_, opt.cache_mb);
        BinarySolution sol = solve_smo(cache, ys, Cb, opt.tol, opt.max_iter);

        PairModel pm;
        pm.pos = p;
        pm.neg = q;
        pm.rho = sol.rho;

        std::vector<int> sv_idx;
        for (int k = 0; k < int(idx.size()); ++k)
            if (sol.alpha[k] > 0.0) sv_idx.push_back(k);

        pm.sv    = select_rows(Xs, sv_idx);
        pm.sv_sq = row_norms(pm.sv);
        pm.coef.resize(Eigen::Index(sv_idx.size()));
        for (size_t k = 0; k < sv_idx.size(); ++k)
            pm.coef[Eigen::Index(k)] = sol.alpha[sv_idx[k]] * ys[sv_idx[k]];
        return pm;
    }

    std::vector<std::string> classes_;
    std::vector<PairModel>   pairs_;
    KernelFn                 fn_;
};

} // namespace

/* factory – used by StancePipeline */
std::unique_ptr<IModel> make_svc()
{
    return std::make_unique<SvcModel>();
}

} // namespace sdqc
