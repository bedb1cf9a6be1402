#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace seqUtils {

    inline bool is_gap(char c) { return c == '-' || c == '.'; }

    // IUPAC nucleotide codes (either case) plus '*' for masked bases
    bool is_nucleotide(char c);

    /**
     * @brief Upper-case a sequence in place and normalize '.' gaps to '-'.
     * @return Index of the first character that is neither a nucleotide nor a gap, or npos.
     */
    size_t normalize_row(std::string& row);

    /**
     * @brief Remove gap characters.
     */
    std::string ungap(std::string_view row);

    // Number of non-gap characters
    size_t ungapped_length(std::string_view row);

    /**
     * @brief Split a sequence id into its accession tokens.
     *
     * "gb|KJ660346.2|" -> {"gb", "KJ660346.2"}; "KJ660346.2" -> {"KJ660346.2"}.
     * Empty tokens are dropped.
     */
    std::vector<std::string> id_tokens(std::string_view id);

    /**
     * @brief True when two ids name the same sequence.
     *
     * Equal strings match; otherwise ids match when one of them is a single
     * token that appears among the '|'-separated tokens of the other
     * ("gb|X.1|" vs "X.1" match, "gb|X.1|" vs "ref|X.1|" do not).
     */
    bool same_seqid(std::string_view a, std::string_view b);

    // Replace characters unsafe in file names ('/', '|', whitespace, ...) with '_'
    std::string file_safe(std::string_view id);

} // namespace seqUtils
