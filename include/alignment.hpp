#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "CIGAR.hpp"
#include "seqdb.hpp"

namespace aln {

// Gapped pairwise alignment; column i of a_row is aligned to column i of b_row.
struct Alignment {
    std::string a_name, b_name;
    std::string a_row,  b_row;

    size_t   n_cols() const { return a_row.size(); }
    uint32_t a_len()  const;
    uint32_t b_len()  const;
};

/**
 * @brief Build a validated alignment.
 *
 * Rows are upper-cased ('.' gaps become '-'). Throws tblift::ParseError
 * (tagged with `source`) when the rows differ in length, are empty,
 * contain a non-nucleotide character, or share an all-gap column.
 */
Alignment make_alignment(std::string a_name, std::string a_row,
                         std::string b_name, std::string b_row,
                         const std::string& source = "");

// Alignment of ungapped a/b described by CIGAR ops (D consumes a, I consumes b)
Alignment from_cigar(const std::string& a_name, std::string_view a,
                     const std::string& b_name, std::string_view b,
                     const std::vector<CIGAR::COp>& ops,
                     const std::string& source = "");

/**
 * @brief Pairwise alignments of the hub row against every other row of a
 * multiple alignment. Columns that are gaps in both rows are dropped.
 *
 * Throws tblift::ParseError when rows differ in length or the MSA has
 * fewer than two rows. The hub is looked up with SeqDB::find_like().
 */
std::vector<Alignment> project_msa(const seqdb::SeqDB& msa, std::string_view hub,
                                   const std::string& source = "");

// Load an aligned (multi-)FASTA and project it onto `hub` (first row when empty)
std::vector<Alignment> load_msa(const std::string& path, std::string_view hub = {});

/**
 * @brief Pairwise alignments stored as consecutive row pairs of an aligned
 * FASTA: rows 1,3,5... are references, rows 2,4,6... their targets.
 * Pairs may differ in length. Throws tblift::ParseError on an odd row count.
 */
std::vector<Alignment> load_aligned_pairs(const std::string& path);

/**
 * @brief Alignments from a PAF file with cg:Z CIGAR tags.
 *
 * tname is the reference (side a), qname the target (side b). For each
 * (tname,qname) pair the longest forward-strand record is used.
 * Unaligned flanks become gap-padded columns: the reference flank sits
 * outside the target flank so reference bases there map past the target
 * ends. Reverse-strand records are skipped with a warning.
 */
std::vector<Alignment> load_paf(const std::string& path, const seqdb::SeqDB& ref, const seqdb::SeqDB& alt);

} // namespace aln
