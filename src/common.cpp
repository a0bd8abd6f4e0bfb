/*───────────────────────────────────────────────────────────
 *  common.cpp  –  logging, progress bar, file & string tools
 *───────────────────────────────────────────────────────────*/
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>     // access

#include "sdqc/common.hpp"

using namespace std;

namespace sdqc {

void logI(const string&s){ cerr<<"[INFO]  "<<s<<'\n'; }
void logW(const string&s){ cerr<<"[WARN]  "<<s<<'\n'; }
void logE(const string&s){ cerr<<"[ERR]   "<<s<<'\n'; }

void progress(const string&tag,size_t cur,size_t tot,size_t W){
    double f=tot?double(cur)/tot:1.0; size_t filled=size_t(f*W);
    cerr<<"\r"<<tag<<" ["<<string(filled,'=')<<string(W-filled,' ')
        <<"] "<<setw(3)<<int(f*100)<<"% ("<<cur<<'/'<<tot<<')'<<flush;
    if(cur==tot) cerr<<'\n';
}

/* ─── file tools ─── */
bool file_exists(const std::string& p){
    return ::access(p.c_str(), F_OK) == 0;
}

json read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open " + path);
    try {
        json j;
        in >> j;
        return j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("bad JSON in " + path + ": " + e.what());
    }
}

std::string join(const std::vector<std::string>& v, const std::string& sep)
{
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        out += v[i];
        if (i + 1 < v.size()) out += sep;
    }
    return out;
}

std::vector<std::string> split_space(const std::string& s)
{
    std::vector<std::string> out;
    size_t prev = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == ' ') {
            out.push_back(s.substr(prev, i - prev));
            prev = i + 1;
        }
    }
    out.push_back(s.substr(prev));
    return out;
}

std::string fmt_double(double v, int prec)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

/* ─── UTF-8 ─── */
namespace {
constexpr char32_t kReplacement = 0xFFFD;

struct Range { char32_t lo, hi; };

/* word-character blocks outside ASCII, sorted, inclusive */
const Range kWordRanges[] = {
    {0x00AA, 0x00AA}, {0x00B5, 0x00B5}, {0x00BA, 0x00BA},
    {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02C1},   // Latin
    {0x0300, 0x036F},                                       // combining marks
    {0x0370, 0x0373}, {0x0376, 0x037D}, {0x037F, 0x037F},
    {0x0386, 0x0386}, {0x0388, 0x03FF},                     // Greek
    {0x0400, 0x0481}, {0x0483, 0x052F},                     // Cyrillic
    {0x0531, 0x0556}, {0x0561, 0x0587},                     // Armenian
    {0x0591, 0x05BD}, {0x05D0, 0x05F2},                     // Hebrew
    {0x0610, 0x061A}, {0x0620, 0x0669}, {0x066E, 0x06D3},
    {0x06D5, 0x06DC}, {0x06DF, 0x06E8}, {0x06EA, 0x06FC},   // Arabic
    {0x0900, 0x0963}, {0x0966, 0x0DFF},                     // Indic
    {0x0E01, 0x0E3A}, {0x0E40, 0x0E4E}, {0x0E50, 0x0E59},   // Thai
    {0x1100, 0x11FF},                                       // Hangul Jamo
    {0x1E00, 0x1FBC}, {0x1FC2, 0x1FCC}, {0x1FD0, 0x1FDB},
    {0x1FE0, 0x1FEC}, {0x1FF2, 0x1FFC},                     // Latin/Greek ext.
    {0x3041, 0x3096}, {0x3099, 0x309A}, {0x309D, 0x30FA},
    {0x30FC, 0x30FF},                                       // Kana
    {0x3400, 0x4DBF}, {0x4E00, 0x9FFF},                     // CJK
    {0xAC00, 0xD7A3},                                       // Hangul
    {0xF900, 0xFAFF},
    {0xFF10, 0xFF19}, {0xFF21, 0xFF3A}, {0xFF3F, 0xFF3F},
    {0xFF41, 0xFF5A}, {0xFF66, 0xFFDC},                     // fullwidth
    {0x20000, 0x2FA1F},                                     // CJK ext.
};
} // namespace

std::u32string decode_utf8(const std::string& s)
{
    static const char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};

    std::u32string out;
    out.reserve(s.size());
    const size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        char32_t cp;
        size_t   len;
        if      (c < 0x80)           { cp = c;        len = 1; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
        else { out.push_back(kReplacement); ++i; continue; }

        bool ok = i + len <= n;
        for (size_t k = 1; ok && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) ok = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok || cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp)
{
    if (cp < 0x80) {
        out.push_back(char(cp));
    } else if (cp < 0x800) {
        out.push_back(char(0xC0 | (cp >> 6)));
        out.push_back(char(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(char(0xE0 | (cp >> 12)));
        out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(char(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(char(0xF0 | (cp >> 18)));
        out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(char(0x80 | (cp & 0x3F)));
    }
}

size_t utf8_length(const std::string& s)
{
    return decode_utf8(s).size();
}

bool is_word_char(char32_t cp)
{
    if (cp < 0x80) return std::isalnum(int(cp)) || cp == '_';
    for (const Range& r : kWordRanges) {
        if (cp < r.lo) return false;
        if (cp <= r.hi) return true;
    }
    return false;
}

char32_t to_lower(char32_t cp)
{
    if (cp < 0x80) return char32_t(std::tolower(int(cp)));
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;
    if (cp >= 0x0100 && cp <= 0x017F) {
        if (cp == 0x0130) return 'i';
        if (cp == 0x0178) return 0x00FF;
        const bool odd_upper = (cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E);
        if (cp == 0x0138 || cp == 0x0149 || cp == 0x017F) return cp;
        return ((cp & 1) == (odd_upper ? 1u : 0u)) ? cp + 1 : cp;
    }
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    return cp;
}

} // namespace sdqc
