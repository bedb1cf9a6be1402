#include "../include/seq_utils.hpp"
#include <array>
#include <cctype>

namespace seqUtils {

static std::array<bool,256> make_nt_table() {
    std::array<bool,256> t{};
    for (const char* p = "ACGTUNRYSWKMBDHV*"; *p; ++p) {
        t[(unsigned char)*p] = true;
        t[(unsigned char)std::tolower((unsigned char)*p)] = true;
    }
    return t;
}

bool is_nucleotide(char c) {
    static const auto table = make_nt_table();
    return table[(unsigned char)c];
}

size_t normalize_row(std::string& row) {
    size_t bad = std::string::npos;
    for (size_t i = 0; i < row.size(); ++i) {
        char& c = row[i];
        if (c == '.') { c = '-'; continue; }
        if (c == '-') continue;
        if (!is_nucleotide(c) && bad == std::string::npos) bad = i;
        c = (char)std::toupper((unsigned char)c);
    }
    return bad;
}

std::string ungap(std::string_view row) {
    std::string out;
    out.reserve(row.size());
    for (char c : row) if (!is_gap(c)) out.push_back(c);
    return out;
}

size_t ungapped_length(std::string_view row) {
    size_t n = 0;
    for (char c : row) n += !is_gap(c);
    return n;
}

std::vector<std::string> id_tokens(std::string_view id) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i <= id.size()) {
        size_t j = id.find('|', i);
        if (j == std::string_view::npos) j = id.size();
        if (j > i) out.emplace_back(id.substr(i, j - i));
        i = j + 1;
    }
    return out;
}

bool same_seqid(std::string_view a, std::string_view b) {
    if (a == b) return true;
    auto ta = id_tokens(a);
    auto tb = id_tokens(b);
    if (ta.empty() || tb.empty()) return false;
    if (ta.size() == 1 || tb.size() == 1) {
        const auto& one   = ta.size() == 1 ? ta : tb;
        const auto& other = ta.size() == 1 ? tb : ta;
        for (const auto& t : other) if (t == one[0]) return true;
        return false;
    }
    return false;
}

std::string file_safe(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (char c : id) {
        unsigned char u = (unsigned char)c;
        if (std::isalnum(u) || c == '.' || c == '-' || c == '_') out.push_back(c);
        else out.push_back('_');
    }
    while (!out.empty() && out.back() == '_') out.pop_back();
    if (out.empty()) out = "seq";
    return out;
}

} // namespace seqUtils
