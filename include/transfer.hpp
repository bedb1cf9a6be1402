#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "coordmap.hpp"
#include "feature_table.hpp"

namespace transfer {

// What to do with an interval whose whole span is deleted in the target
// while both ends sit in target gaps.
enum class GapPairPolicy {
    Drop,   // drop the interval
    Point   // keep it as the single upstream target base
};

struct TransferOpts {
    bool          oob_clip          = true;   // clip features hanging over the target ends; false drops the interval
    bool          ignore_ambig_edge = false;  // treat '<'/'>' of the reference as exact
    GapPairPolicy gap_pair          = GapPairPolicy::Drop;
    bool          cds_frame_clip    = false;  // keep a 5'-clipped CDS a whole number of codons long
    bool          cds_note          = true;   // note on CDS truncated at a target end
    size_t        threads           = 1;      // features mapped in parallel
};

enum class DiagKind {
    LengthChanged,     // mapped interval length differs from the reference
    GapAdjacent,       // an end fell into a target gap (upstream base used)
    Truncated,         // clipped at a target end, boundary marked partial
    Collapsed,         // deleted interval kept as a single base
    IntervalDropped,   // one interval removed, feature kept
    FeatureDropped,    // every interval removed
    QualifierDropped   // coordinate qualifier could not be mapped
};

const char* kind_name(DiagKind k);

struct Diagnostic {
    std::string seqid;          // target sequence
    size_t      feature_index;  // 0-based index in the reference table
    std::string feature_type;
    std::string label;
    DiagKind    kind;
    std::string location;       // reference location the note is about
    std::string message;
};

std::string diag_tsv_header();
std::string to_tsv(const Diagnostic& d);

struct TransferResult {
    ftable::FeatureTable    table;
    std::vector<Diagnostic> diags;
    size_t n_in        = 0;
    size_t n_out       = 0;
    size_t n_dropped   = 0;
    size_t n_truncated = 0;   // features with at least one clipped boundary
};

/**
 * @brief Map every feature of `ref` onto the target.
 *
 * `ref_name`/`alt_name` are the sequence names known to the mapper. The
 * input table is not modified; the result carries `alt_name` as seqid and
 * keeps the reference feature order (dropped features are omitted).
 *
 * Throws tblift::OutOfRange when a feature lies outside the reference and
 * tblift::NoAlignment when the mapper cannot join the two sequences.
 */
TransferResult transfer_table(const ftable::FeatureTable& ref,
                              const coordmap::CoordMapper& cm,
                              const std::string& ref_name,
                              const std::string& alt_name,
                              const TransferOpts& opts = {});

// Qualifiers whose values carry reference coordinates
bool is_coordinate_qualifier(const std::string& key);

} // namespace transfer
