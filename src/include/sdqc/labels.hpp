/* ──────────────────────────────────────────────────────────────
   labels.hpp     –  the closed SDQC label set + one-vs-rest view
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sdqc {

/* order == sorted label order, used as canonical class order */
enum class Stance : uint8_t { Comment = 0, Deny, Query, Support };

constexpr std::array<Stance, 4> ALL_STANCES{
    Stance::Comment, Stance::Deny, Stance::Query, Stance::Support };

const char* to_string(Stance s);

/* throws std::invalid_argument on anything outside the four labels */
Stance parse_stance(const std::string& label);

std::vector<std::string> stance_names();          // {"comment",…,"support"}

/* "not_deny", "not_query", … */
std::string not_label(Stance target);

using Annotations = std::unordered_map<std::string, Stance>;
using OneVsRest   = std::unordered_map<std::string, std::string>;

/* id → target  iff gold == target, else id → not_<target> */
OneVsRest relabel_one_vs_rest(const Annotations& annotations, Stance target);

} // namespace sdqc
