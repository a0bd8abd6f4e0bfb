/*───────────────────────────────────────────────────────────
 *  common.hpp   –  declarations-only
 *───────────────────────────────────────────────────────────*/
#pragma once

/* ---------- STL ---------- */
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

/* ---------- deps ---------- */
#include <nlohmann/json.hpp>

namespace sdqc {

using json = nlohmann::json;

/* ────────────────── log / progress & file tools ────────────────── */
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

void progress(const std::string& tag,
              size_t cur, size_t tot, size_t barWidth = 40);

bool file_exists(const std::string& path);

/* read a whole JSON document, throws on open / parse failure */
json read_json_file(const std::string& path);

/* ────────────────── small string helpers ────────────────── */
std::string join(const std::vector<std::string>& v,
                 const std::string& sep = ", ");

/* split on a single ' ' exactly like str.split(' ') – empty pieces kept */
std::vector<std::string> split_space(const std::string& s);

std::string fmt_double(double v, int prec = 3);

/* ────────────────── UTF-8 text ────────────────── */
/* malformed or truncated sequences decode to U+FFFD, one per bad byte */
std::u32string decode_utf8(const std::string& s);
void           append_utf8(std::string& out, char32_t cp);
size_t         utf8_length(const std::string& s);   // code points

/* letters, digits, combining marks and '_' ; punctuation, symbols and
   emoji are separators */
bool     is_word_char(char32_t cp);
char32_t to_lower(char32_t cp);

} // namespace sdqc
