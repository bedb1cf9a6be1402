#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "kio.hpp"

namespace paf {

struct Record {
    // 12 mandatory fields
    std::string qname;
    uint32_t    qlen   = 0;
    uint32_t    qstart = 0; // 0-based, inclusive
    uint32_t    qend   = 0; // 0-based, exclusive
    char        strand = '+'; // '+' or '-'
    std::string tname;
    uint32_t    tlen   = 0;
    uint32_t    tstart = 0;
    uint32_t    tend   = 0;
    uint32_t    nmatch = 0;
    uint32_t    alen   = 0;
    uint32_t    mapq   = 0;

    // Example: "cg:Z:10=1X5=\tNM:i:1\ttp:A:P"
    std::string opt;
};

// strict: digits only, non-empty, fits in 32 bits
static inline bool parse_u32(std::string_view sv, uint32_t& out) {
    if (sv.empty()) return false;
    uint64_t v = 0;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
        v = v * 10u + uint64_t(c - '0');
        if (v > UINT32_MAX) return false;
    }
    out = (uint32_t)v;
    return true;
}

static inline bool split_12_fields(std::string_view v, std::string_view f[12], size_t& pos_after_12) {
    size_t pos = 0;
    for (int i = 0; i < 12; ++i) {
        size_t tab = v.find('\t', pos);
        if (tab == std::string_view::npos) {
            if (i != 11) return false;
            f[i] = v.substr(pos);
            pos = v.size();
        } else {
            f[i] = v.substr(pos, tab - pos);
            pos = tab + 1;
        }
    }
    pos_after_12 = pos;
    return true;
}

// Find a SAM-style tag in Record::opt (2-char tag).
// Return true if found; type_out gets 'Z','i','f','A',... value_out is the raw value view.
static inline bool find_tag(const Record& r, std::string_view tag2, char& type_out, std::string_view& value_out)
{
    if (tag2.size() != 2 || r.opt.empty()) return false;

    std::string_view s(r.opt);
    size_t i = 0;
    while (i < s.size()) {
        size_t j = s.find('\t', i);
        if (j == std::string_view::npos) j = s.size();
        std::string_view tok = s.substr(i, j - i);

        // tok: "cg:Z:...."
        if (tok.size() >= 5 &&
            tok[0] == tag2[0] && tok[1] == tag2[1] &&
            tok[2] == ':' && tok[4] == ':')
        {
            type_out  = tok[3];
            value_out = tok.substr(5);
            return true;
        }
        i = j + 1;
    }
    return false;
}

class Reader {
public:
    explicit Reader(const std::string& path) : lr_(path) {}

    // Throws tblift::ParseError on a malformed line
    bool next(Record& r) {
        std::string line;
        while (lr_.getline(line)) {
            if (line.empty() || line[0] == '#') continue;
            parse_line_(line, r);
            return true;
        }
        return false;
    }

    uint64_t line_no() const { return lr_.line_no(); }

private:
    kio::LineReader lr_;

    void parse_line_(const std::string& s, Record& r) const {
        std::string_view v(s);
        std::string_view f[12];
        size_t pos = 0;

        auto fail = [&](const char* what) {
            throw tblift::ParseError(lr_.path(), lr_.line_no(), s, what);
        };

        if (!split_12_fields(v, f, pos)) fail("PAF line has fewer than 12 columns");

        r.qname = std::string(f[0]);
        r.tname = std::string(f[5]);
        if (r.qname.empty() || r.tname.empty()) fail("empty sequence name");
        if (f[4] != "+" && f[4] != "-") fail("strand must be '+' or '-'");
        r.strand = f[4][0];

        if (!parse_u32(f[1],  r.qlen)   || !parse_u32(f[2],  r.qstart) || !parse_u32(f[3], r.qend) ||
            !parse_u32(f[6],  r.tlen)   || !parse_u32(f[7],  r.tstart) || !parse_u32(f[8], r.tend) ||
            !parse_u32(f[9],  r.nmatch) || !parse_u32(f[10], r.alen)   || !parse_u32(f[11], r.mapq))
            fail("non-numeric PAF column");
        if (r.qstart > r.qend || r.qend > r.qlen || r.tstart > r.tend || r.tend > r.tlen)
            fail("PAF coordinates out of range");

        if (pos < v.size()) {
            r.opt.assign(v.substr(pos));
        } else {
            r.opt.clear();
        }
    }
};

} // namespace paf
