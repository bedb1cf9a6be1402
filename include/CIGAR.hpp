#pragma once
#include <string>
#include <string_view>
#include <cstdint>
#include <vector>

namespace CIGAR {

struct COp {
    uint32_t len;
    char     op;
    COp() = default;
    COp(uint32_t l, char c) : len(l), op(c) {}
};

/**
 * @brief Parse a CIGAR string into a vector of COp.
 *
 * Accepts M,I,D,N,S,H,P,=,X. Throws tblift::ParseError on an unknown
 * operation, a zero-length or missing count, or a trailing number.
 *
 * @param cigar CIGAR string (e.g., "10M1I5D3M")
 * @return Parsed vector of COp.
 */
std::vector<COp> parse(std::string_view cigar);

/**
 * @brief Append a COp to the end of the ops vector.
 *
 * If the last operation is the same as the new one, its length grows.
 */
void append(std::vector<COp> &ops, uint32_t len, char op);

/**
 * @brief Pack a vector of COp into a CIGAR string ("*" when empty).
 */
std::string pack(const std::vector<COp> &ops);

// Bases of the first (reference) / second (query) sequence consumed by ops
uint64_t ref_span(const std::vector<COp> &ops);
uint64_t query_span(const std::vector<COp> &ops);

/**
 * @brief Render ops as two gapped alignment rows.
 *
 * M/=/X consume both sequences, D consumes `a` only (gap in b), I
 * consumes `b` only (gap in a); N behaves like D. S/H/P add no column.
 * Throws tblift::ParseError if the spans do not match the lengths of
 * `a` and `b`.
 */
void to_rows(const std::vector<COp> &ops, std::string_view a, std::string_view b,
             std::string &a_row, std::string &b_row);

} // namespace CIGAR
