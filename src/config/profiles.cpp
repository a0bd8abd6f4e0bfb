/* -----------------------------------------------------------
 *  profiles.cpp – config/sdqc.json → RunConfig + three profiles
 * ----------------------------------------------------------- */
#include <set>
#include <sstream>

#include "sdqc/profiles.hpp"

namespace sdqc {

/* ───────────────────── search space ───────────────────── */
bool SearchSpace::empty() const
{
    return C.empty() && gamma.empty() && kernel.empty() && weights.empty();
}

std::vector<Candidate> SearchSpace::expand(const TrainOpt& base) const
{
    /* expansion order: C, gamma, kernel, then each weight list by channel name */
    std::vector<Candidate> out{ Candidate{ base, {} } };

    auto grow = [&out](size_t n, auto apply) {
        if (n == 0) return;
        std::vector<Candidate> next;
        next.reserve(out.size() * n);
        for (const auto& c : out)
            for (size_t k = 0; k < n; ++k) {
                Candidate d = c;
                apply(d, k);
                next.push_back(std::move(d));
            }
        out.swap(next);
    };

    grow(C.size(),      [this](Candidate& d, size_t k){ d.svm.C      = C[k]; });
    grow(gamma.size(),  [this](Candidate& d, size_t k){ d.svm.gamma  = gamma[k]; });
    grow(kernel.size(), [this](Candidate& d, size_t k){ d.svm.kernel = kernel[k]; });
    for (const auto& kv : weights) {
        const std::string&         ch = kv.first;
        const std::vector<double>& ws = kv.second;
        grow(ws.size(), [&ch, &ws](Candidate& d, size_t k){ d.weights[ch] = ws[k]; });
    }
    return out;
}

std::vector<ChannelSpec> ClassifierProfile::channels_for(const Candidate& c) const
{
    std::vector<ChannelSpec> out = channels;
    for (auto& ch : out) {
        auto it = c.weights.find(ch.name);
        if (it != c.weights.end()) ch.weight = it->second;
    }
    return out;
}

/* ───────────────────── json hooks ───────────────────── */
void from_json(const json& j, ChannelSpec& c)
{
    c.name = j.at("name").get<std::string>();

    const json& keys = j.at("keys");
    c.keys.clear();
    if (keys.is_string()) c.keys.push_back(keys.get<std::string>());
    else                  c.keys = keys.get<std::vector<std::string>>();

    c.encoding = parse_encoding(j.value("encoding", std::string("numeric")));
    c.weight   = j.value("weight", 1.0);

    if (c.keys.empty())
        throw std::runtime_error("channel '" + c.name + "' selects no keys");
    if (c.weight < 0.0)
        throw std::runtime_error("channel '" + c.name + "' has negative weight " +
                                 fmt_double(c.weight));
}

void from_json(const json& j, TrainOpt& o)
{
    o.kernel   = parse_kernel(j.value("kernel", std::string(to_string(o.kernel))));
    o.C        = j.value("C",        o.C);
    o.gamma    = j.value("gamma",    o.gamma);
    o.degree   = j.value("degree",   o.degree);
    o.coef0    = j.value("coef0",    o.coef0);
    o.tol      = j.value("tol",      o.tol);
    o.cache_mb = j.value("cache_mb", o.cache_mb);
    o.max_iter = j.value("max_iter", o.max_iter);

    /* "class_weight": "balanced" | null */
    if (j.contains("class_weight") && !j["class_weight"].is_null()) {
        std::string cw = j["class_weight"].get<std::string>();
        if (cw != "balanced")
            throw std::runtime_error("unsupported class_weight '" + cw + "'");
        o.balanced = true;
    }

    if (o.C <= 0.0)  throw std::runtime_error("svm C must be positive");
    if (o.tol <= 0.0) throw std::runtime_error("svm tol must be positive");
}

void to_json(json& j, const TrainOpt& o)
{
    j = json{ {"kernel", to_string(o.kernel)}, {"C", o.C}, {"gamma", o.gamma},
              {"degree", o.degree}, {"coef0", o.coef0},
              {"class_weight", o.balanced ? json("balanced") : json(nullptr)} };
}

void from_json(const json& j, SearchSpace& s)
{
    s.C     = j.value("C",     std::vector<double>{});
    s.gamma = j.value("gamma", std::vector<double>{});
    s.kernel.clear();
    for (const auto& k : j.value("kernel", std::vector<std::string>{}))
        s.kernel.push_back(parse_kernel(k));

    s.weights.clear();
    if (j.contains("weights"))
        for (auto it = j["weights"].begin(); it != j["weights"].end(); ++it) {
            auto ws = it.value().get<std::vector<double>>();
            for (double w : ws)
                if (w < 0.0)
                    throw std::runtime_error("search weight for '" + it.key() + "' is negative");
            if (!ws.empty()) s.weights.emplace(it.key(), std::move(ws));
        }

    for (double c : s.C)
        if (c <= 0.0) throw std::runtime_error("search C values must be positive");
}

void from_json(const json& j, RunConfig& r)
{
    r.filter_short         = j.value("filter_short",         r.filter_short);
    r.similarity_threshold = j.value("similarity_threshold", r.similarity_threshold);
    r.fold_count           = j.value("fold_count",           r.fold_count);
    r.threads              = j.value("threads",              r.threads);

    if (j.contains("extractor")) {
        const json& e = j["extractor"];
        r.extractor.task           = e.value("task",           r.extractor.task);
        r.extractor.strip_hashtags = e.value("strip_hashtags", r.extractor.strip_hashtags);
        r.extractor.strip_mentions = e.value("strip_mentions", r.extractor.strip_mentions);
    }
    validate(r);
}

void validate(const RunConfig& r)
{
    if (r.similarity_threshold < 0.0)
        throw std::runtime_error("similarity_threshold must be ≥ 0, got " + fmt_double(r.similarity_threshold));
    if (r.fold_count < 2)
        throw std::runtime_error("fold_count must be ≥ 2, got " + std::to_string(r.fold_count));
    if (r.threads < 0)
        throw std::runtime_error("threads must be ≥ 0, got " + std::to_string(r.threads));
}

/* ───────────────────── profiles ───────────────────── */
ClassifierProfile parse_profile(const std::string& name, const json& j)
{
    ClassifierProfile p;
    p.name = name;

    if (j.contains("target") && !j["target"].is_null())
        p.target = parse_stance(j["target"].get<std::string>());

    p.channels = j.at("channels").get<std::vector<ChannelSpec>>();
    if (p.channels.empty())
        throw std::runtime_error("profile '" + name + "' has no channels");

    std::set<std::string> seen;
    for (const auto& c : p.channels)
        if (!seen.insert(c.name).second)
            throw std::runtime_error("profile '" + name + "' repeats channel '" + c.name + "'");

    if (j.contains("svm"))    p.svm    = j["svm"].get<TrainOpt>();
    if (j.contains("search")) p.search = j["search"].get<SearchSpace>();

    for (const auto& kv : p.search.weights)
        if (!seen.count(kv.first))
            throw std::runtime_error("profile '" + name + "' searches weights of unknown channel '" +
                                     kv.first + "'");
    return p;
}

SdqcConfig parse_config(const json& j)
{
    try {
        SdqcConfig cfg;
        if (j.contains("run")) cfg.run = j["run"].get<RunConfig>();

        const json& prof = j.at("profiles");
        for (const char* name : {"base", "deny", "query"})
            if (!prof.contains(name))
                throw std::runtime_error(std::string("config is missing profile '") + name + "'");

        cfg.base  = parse_profile("base",  prof["base"]);
        cfg.deny  = parse_profile("deny",  prof["deny"]);
        cfg.query = parse_profile("query", prof["query"]);

        if (cfg.base.target)
            throw std::runtime_error("profile 'base' must not set a one-vs-rest target");
        if (cfg.deny.target != Stance::Deny)
            throw std::runtime_error("profile 'deny' must target \"deny\"");
        if (cfg.query.target != Stance::Query)
            throw std::runtime_error("profile 'query' must target \"query\"");
        return cfg;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("malformed config: ") + e.what());
    }
}

SdqcConfig load_config(const std::string& path)
{
    SdqcConfig cfg = parse_config(read_json_file(path));
    logI("config " + path + " : " +
         std::to_string(cfg.base.channels.size())  + " base / " +
         std::to_string(cfg.deny.channels.size())  + " deny / " +
         std::to_string(cfg.query.channels.size()) + " query channels");
    return cfg;
}

std::string describe(const TrainOpt& o)
{
    std::ostringstream os;
    os << "kernel=" << to_string(o.kernel) << " C=" << o.C;
    if (o.kernel != Kernel::Linear) os << " gamma=" << o.gamma;
    if (o.kernel == Kernel::Poly)   os << " degree=" << o.degree << " coef0=" << o.coef0;
    if (o.balanced) os << " class_weight=balanced";
    return os.str();
}

} // namespace sdqc
