#pragma once
#include <string>
#include <sstream>
#include <iterator>
#include <algorithm>

namespace program {

inline constexpr const char* name        = "tblift";
inline constexpr const char* description = "Transfer GenBank feature tables from a reference genome onto aligned draft genomes.";
inline constexpr const char* version     = "0.1.0";
inline constexpr const char* build_date  = "2026/10/19";

inline std::string cmdline(int argc, char** argv) {
    std::ostringstream oss;
    std::copy(argv, argv + argc, std::ostream_iterator<const char*>(oss, " "));
    std::string s = oss.str();
    if (!s.empty() && s.back() == ' ')
        s.pop_back();
    return s;
}

} // namespace program
