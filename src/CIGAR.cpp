#include "../include/CIGAR.hpp"
#include "../include/errors.hpp"

#include <cstring>

namespace CIGAR {

static inline bool valid_op(char c) {
    return c && std::strchr("MIDNSHP=X", c) != nullptr;
}

std::vector<COp> parse(std::string_view cig) {
    std::vector<COp> cigar_ops;
    cigar_ops.reserve(cig.size()/2 + 1);
    uint64_t n = 0;
    bool has_num = false;
    for (char c : cig) {
        if (uint8_t(c - '0') <= 9) {
            n = n*10 + uint64_t(c - '0');
            has_num = true;
            if (n > UINT32_MAX) throw tblift::ParseError("", 0, std::string(cig), "CIGAR operation too long");
            continue;
        }
        if (!valid_op(c)) throw tblift::ParseError("", 0, std::string(cig), std::string("unknown CIGAR operation '") + c + "'");
        if (!has_num || n == 0) throw tblift::ParseError("", 0, std::string(cig), "CIGAR operation without length");
        cigar_ops.emplace_back((uint32_t)n, c);
        n = 0;
        has_num = false;
    }
    if (has_num) throw tblift::ParseError("", 0, std::string(cig), "CIGAR ends with a number");
    return cigar_ops;
}

void append(std::vector<COp> &ops, uint32_t len, char op) {
    if (len == 0) return;
    if (!ops.empty() && ops.back().op == op) {
        ops.back().len += len;
    } else {
        ops.push_back({len,op});
    }
}

std::string pack(const std::vector<COp> &ops) {
    std::string s;
    s.reserve(ops.size()*4);
    for (auto &o : ops) {
        s += std::to_string(o.len);
        s += o.op;
    }
    return s.empty() ? "*" : s;
}

uint64_t ref_span(const std::vector<COp> &ops) {
    uint64_t n = 0;
    for (auto &o : ops)
        if (o.op == 'M' || o.op == '=' || o.op == 'X' || o.op == 'D' || o.op == 'N') n += o.len;
    return n;
}

uint64_t query_span(const std::vector<COp> &ops) {
    uint64_t n = 0;
    for (auto &o : ops)
        if (o.op == 'M' || o.op == '=' || o.op == 'X' || o.op == 'I') n += o.len;
    return n;
}

void to_rows(const std::vector<COp> &ops, std::string_view a, std::string_view b,
             std::string &a_row, std::string &b_row) {
    if (ref_span(ops) != a.size() || query_span(ops) != b.size()) {
        throw tblift::ParseError("", 0, pack(ops),
            "CIGAR spans " + std::to_string(ref_span(ops)) + "/" + std::to_string(query_span(ops)) +
            " bases but sequences have " + std::to_string(a.size()) + "/" + std::to_string(b.size()));
    }
    a_row.clear(); b_row.clear();
    a_row.reserve(a.size() + b.size());
    b_row.reserve(a.size() + b.size());
    size_t i = 0, j = 0;
    for (auto &o : ops) {
        switch (o.op) {
            case 'M': case '=': case 'X':
                a_row.append(a.substr(i, o.len)); i += o.len;
                b_row.append(b.substr(j, o.len)); j += o.len;
                break;
            case 'D': case 'N':
                a_row.append(a.substr(i, o.len)); i += o.len;
                b_row.append(o.len, '-');
                break;
            case 'I':
                a_row.append(o.len, '-');
                b_row.append(b.substr(j, o.len)); j += o.len;
                break;
            default:
                break;
        }
    }
}

} // namespace CIGAR
