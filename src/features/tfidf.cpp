/* -----------------------------------------------------------
 *  tfidf.cpp – vocabulary, idf weights, sparse rows, cosine
 * ----------------------------------------------------------- */
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "sdqc/common.hpp"
#include "sdqc/tfidf.hpp"

namespace sdqc {

std::vector<std::string> tokenize(const std::string& text)
{
    std::vector<std::string> out;
    std::string cur;
    size_t      cur_len = 0;    // code points in cur
    auto flush = [&]{
        if (cur_len >= 2) out.push_back(cur);
        cur.clear();
        cur_len = 0;
    };
    for (char32_t cp : decode_utf8(text)) {
        if (is_word_char(cp)) {
            append_utf8(cur, to_lower(cp));
            ++cur_len;
        } else {
            flush();
        }
    }
    flush();
    return out;
}

void TfidfVectorizer::fit(const std::vector<std::string>& docs)
{
    /* document frequency per term, std::map keeps terms sorted */
    std::map<std::string, size_t> df;
    for (const auto& d : docs) {
        auto toks = tokenize(d);
        std::set<std::string> uniq(toks.begin(), toks.end());
        for (const auto& t : uniq) ++df[t];
    }

    vocab_.clear();
    idf_.clear();
    vocab_.reserve(df.size());
    idf_.reserve(df.size());

    const double n = double(docs.size());
    int col = 0;
    for (const auto& kv : df) {
        vocab_.emplace(kv.first, col++);
        idf_.push_back(std::log((1.0 + n) / (1.0 + double(kv.second))) + 1.0);
    }
}

SpVec TfidfVectorizer::transform_one(const std::string& doc) const
{
    SpVec v(Eigen::Index(vocab_.size()));
    std::map<int, double> tf;
    for (const auto& t : tokenize(doc)) {
        auto it = vocab_.find(t);
        if (it != vocab_.end()) tf[it->second] += 1.0;
    }

    double norm2 = 0.0;
    for (auto& kv : tf) {
        kv.second *= idf_[size_t(kv.first)];
        norm2 += kv.second * kv.second;
    }
    if (norm2 <= 0.0) return v;

    const double inv = 1.0 / std::sqrt(norm2);
    v.reserve(Eigen::Index(tf.size()));
    for (const auto& kv : tf)               // ascending column order
        v.insertBack(kv.first) = kv.second * inv;
    return v;
}

SpMat TfidfVectorizer::transform(const std::vector<std::string>& docs) const
{
    std::vector<Eigen::Triplet<double>> trip;
    for (size_t r = 0; r < docs.size(); ++r) {
        SpVec v = transform_one(docs[r]);
        for (SpVec::InnerIterator it(v); it; ++it)
            trip.emplace_back(int(r), int(it.index()), it.value());
    }
    SpMat X(Eigen::Index(docs.size()), Eigen::Index(vocab_.size()));
    X.setFromTriplets(trip.begin(), trip.end());
    return X;
}

SpMat TfidfVectorizer::fit_transform(const std::vector<std::string>& docs)
{
    fit(docs);
    return transform(docs);
}

double cosine_similarity(const SpVec& a, const SpVec& b)
{
    const double na = a.dot(a);
    const double nb = b.dot(b);
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    /* sqrt(na*nb) keeps identical vectors at exactly 1.0 */
    return std::min(1.0, a.dot(b) / std::sqrt(na * nb));
}

double pairwise_tfidf_similarity(const std::string& a, const std::string& b)
{
    TfidfVectorizer vec;
    vec.fit({a, b});
    if (vec.empty()) return 0.0;
    return cosine_similarity(vec.transform_one(a), vec.transform_one(b));
}

} // namespace sdqc
