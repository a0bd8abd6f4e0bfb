#include <stdexcept>

#include "sdqc/labels.hpp"

namespace sdqc {

const char* to_string(Stance s)
{
    switch (s) {
        case Stance::Comment: return "comment";
        case Stance::Deny:    return "deny";
        case Stance::Query:   return "query";
        case Stance::Support: return "support";
    }
    return "comment";
}

Stance parse_stance(const std::string& label)
{
    for (Stance s : ALL_STANCES)
        if (label == to_string(s)) return s;
    throw std::invalid_argument("unknown stance label '" + label + "'");
}

std::vector<std::string> stance_names()
{
    std::vector<std::string> out;
    for (Stance s : ALL_STANCES) out.emplace_back(to_string(s));
    return out;
}

std::string not_label(Stance target)
{
    return std::string("not_") + to_string(target);
}

OneVsRest relabel_one_vs_rest(const Annotations& annotations, Stance target)
{
    const std::string pos = to_string(target);
    const std::string neg = not_label(target);

    OneVsRest out;
    out.reserve(annotations.size());
    for (const auto& kv : annotations)
        out.emplace(kv.first, kv.second == target ? pos : neg);
    return out;
}

} // namespace sdqc
