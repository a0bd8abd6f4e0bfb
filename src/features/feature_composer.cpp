/* -----------------------------------------------------------
 *  feature_composer.cpp – per-channel encoders + weighted union
 * ----------------------------------------------------------- */
#include <set>

#include "sdqc/feature_composer.hpp"

namespace sdqc {

const char* to_string(Encoding e)
{
    switch (e) {
        case Encoding::Numeric:     return "numeric";
        case Encoding::Categorical: return "categorical";
        case Encoding::Text:        return "text";
    }
    return "numeric";
}

Encoding parse_encoding(const std::string& s)
{
    if (s == "numeric")     return Encoding::Numeric;
    if (s == "categorical") return Encoding::Categorical;
    if (s == "text")        return Encoding::Text;
    throw std::runtime_error("unknown channel encoding '" + s + "'");
}

const FeatureValue& ChannelEncoder::lookup(const FeatureBag& bag,
                                           const std::string& key, int row) const
{
    auto it = bag.find(key);
    if (it == bag.end()) throw MissingFeatureError(spec_.name, key, size_t(row));
    return it->second;
}

namespace {

/* ────────────────── numeric: one column per key ────────────────── */
class NumericEncoder : public ChannelEncoder {
public:
    using ChannelEncoder::ChannelEncoder;

    void fit(const std::vector<const FeatureBag*>& bags) override
    {
        /* nothing to learn, but a missing key must fail at fit time too */
        for (size_t r = 0; r < bags.size(); ++r)
            for (const auto& k : spec_.keys) lookup(*bags[r], k, int(r));
    }

    void encode(const FeatureBag& bag, int row, int offset,
                std::vector<Eigen::Triplet<double>>& out) const override
    {
        for (size_t k = 0; k < spec_.keys.size(); ++k) {
            double v = value_of(lookup(bag, spec_.keys[k], row), spec_.keys[k]);
            if (v != 0.0)
                out.emplace_back(row, offset + int(k), v * spec_.weight);
        }
    }

    size_t dim() const override { return spec_.keys.size(); }

private:
    static double value_of(const FeatureValue& v, const std::string& key)
    {
        if (auto d = std::get_if<double>(&v)) return *d;
        if (auto b = std::get_if<bool>(&v))   return *b ? 1.0 : 0.0;
        if (auto l = std::get_if<std::vector<std::string>>(&v)) return double(l->size());
        const auto& s = std::get<std::string>(v);
        try {
            size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size()) return d;
        } catch (const std::exception&) {}
        throw std::runtime_error("numeric feature '" + key + "' holds text '" + s + "'");
    }
};

/* ────────────────── categorical: key=value indicators ────────────────── */
class CategoricalEncoder : public ChannelEncoder {
public:
    using ChannelEncoder::ChannelEncoder;

    void fit(const std::vector<const FeatureBag*>& bags) override
    {
        std::set<std::string> seen;
        for (size_t r = 0; r < bags.size(); ++r)
            for (const auto& k : spec_.keys)
                for (auto& name : names_of(k, lookup(*bags[r], k, int(r))))
                    seen.insert(std::move(name));

        columns_.clear();
        int c = 0;
        for (const auto& name : seen) columns_.emplace(name, c++);
    }

    void encode(const FeatureBag& bag, int row, int offset,
                std::vector<Eigen::Triplet<double>>& out) const override
    {
        std::set<int> hit;
        for (const auto& k : spec_.keys)
            for (const auto& name : names_of(k, lookup(bag, k, row))) {
                auto it = columns_.find(name);
                if (it != columns_.end()) hit.insert(it->second);
            }
        for (int c : hit) out.emplace_back(row, offset + c, spec_.weight);
    }

    size_t dim() const override { return columns_.size(); }

private:
    static std::vector<std::string> names_of(const std::string& key, const FeatureValue& v)
    {
        if (auto b = std::get_if<bool>(&v))   return { key + (*b ? "=true" : "=false") };
        if (auto d = std::get_if<double>(&v)) return { key + "=" + json(*d).dump() };
        if (auto s = std::get_if<std::string>(&v)) return { key + "=" + *s };
        std::vector<std::string> out;
        for (const auto& w : std::get<std::vector<std::string>>(v)) out.push_back(key + "=" + w);
        return out;
    }

    std::map<std::string, int> columns_;
};

/* ────────────────── text: tf-idf over the joined key values ────────────────── */
class TextEncoder : public ChannelEncoder {
public:
    using ChannelEncoder::ChannelEncoder;

    void fit(const std::vector<const FeatureBag*>& bags) override
    {
        std::vector<std::string> docs;
        docs.reserve(bags.size());
        for (size_t r = 0; r < bags.size(); ++r) docs.push_back(document(*bags[r], int(r)));
        tfidf_.fit(docs);
    }

    void encode(const FeatureBag& bag, int row, int offset,
                std::vector<Eigen::Triplet<double>>& out) const override
    {
        SpVec v = tfidf_.transform_one(document(bag, row));
        for (SpVec::InnerIterator it(v); it; ++it)
            out.emplace_back(row, offset + int(it.index()), it.value() * spec_.weight);
    }

    size_t dim() const override { return tfidf_.dim(); }

private:
    std::string document(const FeatureBag& bag, int row) const
    {
        std::string doc;
        for (const auto& k : spec_.keys) {
            const FeatureValue& v = lookup(bag, k, row);
            std::string part;
            if (auto s = std::get_if<std::string>(&v))      part = *s;
            else if (auto l = std::get_if<std::vector<std::string>>(&v)) part = join(*l, " ");
            else if (auto d = std::get_if<double>(&v))      part = json(*d).dump();
            else                                            part = std::get<bool>(v) ? "true" : "false";
            if (!doc.empty() && !part.empty()) doc.push_back(' ');
            doc += part;
        }
        return doc;
    }

    TfidfVectorizer tfidf_;
};

} // namespace

std::unique_ptr<ChannelEncoder> make_encoder(const ChannelSpec& spec)
{
    if (spec.weight < 0.0)
        throw std::runtime_error("channel '" + spec.name + "' has a negative weight");
    if (spec.keys.empty())
        throw std::runtime_error("channel '" + spec.name + "' selects no keys");

    switch (spec.encoding) {
        case Encoding::Numeric:     return std::make_unique<NumericEncoder>(spec);
        case Encoding::Categorical: return std::make_unique<CategoricalEncoder>(spec);
        case Encoding::Text:        return std::make_unique<TextEncoder>(spec);
    }
    throw std::runtime_error("unhandled encoding for channel " + spec.name);
}

/* ══════════════════════════════════════════════════════════════ */

FeatureComposer::FeatureComposer(std::vector<ChannelSpec> channels)
{
    if (channels.empty()) throw std::runtime_error("feature composer without channels");
    enc_.reserve(channels.size());
    for (const auto& c : channels) enc_.push_back(make_encoder(c));
}

void FeatureComposer::fit(const std::vector<const FeatureBag*>& bags)
{
    if (bags.empty()) throw std::runtime_error("cannot fit feature composer on zero messages");
    for (auto& e : enc_) e->fit(bags);
    fitted_ = true;
}

SpMat FeatureComposer::transform(const std::vector<const FeatureBag*>& bags) const
{
    if (!fitted_) throw std::runtime_error("feature composer used before fit");

    std::vector<Eigen::Triplet<double>> trip;
    for (size_t r = 0; r < bags.size(); ++r) {
        int offset = 0;
        for (const auto& e : enc_) {
            e->encode(*bags[r], int(r), offset, trip);
            offset += int(e->dim());
        }
    }
    SpMat X(Eigen::Index(bags.size()), Eigen::Index(dim()));
    X.setFromTriplets(trip.begin(), trip.end());
    X.makeCompressed();
    return X;
}

SpMat FeatureComposer::fit_transform(const std::vector<const FeatureBag*>& bags)
{
    fit(bags);
    return transform(bags);
}

size_t FeatureComposer::dim() const
{
    size_t d = 0;
    for (const auto& e : enc_) d += e->dim();
    return d;
}

std::vector<ChannelSpec> FeatureComposer::channels() const
{
    std::vector<ChannelSpec> out;
    for (const auto& e : enc_) out.push_back(e->spec());
    return out;
}

std::map<std::string, double> FeatureComposer::weights() const
{
    std::map<std::string, double> out;
    for (const auto& e : enc_) out[e->spec().name] = e->spec().weight;
    return out;
}

} // namespace sdqc
