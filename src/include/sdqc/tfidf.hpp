/* ──────────────────────────────────────────────────────────────
   tfidf.hpp  –  term-weighted text encoding + cosine similarity
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/SparseCore>

namespace sdqc {

using SpVec = Eigen::SparseVector<double>;
using SpMat = Eigen::SparseMatrix<double, Eigen::RowMajor>;

/* lowercased runs of word characters, length ≥ 2 */
std::vector<std::string> tokenize(const std::string& text);

/*  raw counts × smoothed idf  ln((1+n)/(1+df)) + 1 , rows L2-normalised  */
class TfidfVectorizer {
public:
    void  fit(const std::vector<std::string>& docs);
    SpMat transform(const std::vector<std::string>& docs) const;
    SpVec transform_one(const std::string& doc) const;
    SpMat fit_transform(const std::vector<std::string>& docs);

    size_t dim() const { return vocab_.size(); }
    bool   empty() const { return vocab_.empty(); }
    const std::unordered_map<std::string, int>& vocabulary() const { return vocab_; }

private:
    std::unordered_map<std::string, int> vocab_;   // term → column (sorted term order)
    std::vector<double>                  idf_;
};

/* 0 when either side is all-zero */
double cosine_similarity(const SpVec& a, const SpVec& b);

/* fit on exactly {a, b} and compare; empty vocabulary ⇒ 0 */
double pairwise_tfidf_similarity(const std::string& a, const std::string& b);

} // namespace sdqc
