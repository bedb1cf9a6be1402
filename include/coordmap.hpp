#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>

#include "alignment.hpp"

namespace coordmap {

// How a position landed on the other sequence. Ordered from best to worst.
enum class MapKind : uint8_t {
    Exact    = 0,  // the aligned column holds a target base
    Upstream = 1,  // target gap; pos is the closest upstream target base
    PastEnd  = 2,  // target gap after its last base; pos is the last base
    Unmapped = 3   // target gap before its first base; no upstream base (pos 0)
};

const char* kind_name(MapKind k);

inline MapKind worst(MapKind a, MapKind b) { return a < b ? b : a; }

struct MappedPos {
    uint32_t pos  = 0;   // 1-based; 0 when kind == Unmapped
    MapKind  kind = MapKind::Exact;

    bool exact() const { return kind == MapKind::Exact; }
};

struct IntervalHit {
    MappedPos lo, hi;        // images of the low and high source ends
    uint32_t  first = 0;     // first target base aligned inside the source span
    uint32_t  last  = 0;     // last target base aligned inside the source span
    uint32_t  n_target = 0;  // last - first + 1, 0 when the span is deleted in the target
    uint32_t  src_len  = 0;
    uint32_t  tgt_seq_len = 0;
};

/*
 * Coordinate mapper over one or more pairwise alignments.
 *
 * Every alignment is usable in both directions. Sequences that share no
 * alignment are joined through intermediate sequences (a hub such as the
 * reference row of a multiple alignment) up to `max_hops` alignments.
 *
 * Gap policy: a position whose aligned column is a gap in the target maps
 * to the closest upstream target base.
 *
 * Built once; all queries are const and safe to call from many threads.
 */
class CoordMapper {
public:
    explicit CoordMapper(int max_hops = 3) : max_hops_(max_hops < 1 ? 1 : max_hops) {}

    // Throws tblift::ParseError for a repeated pair or a sequence whose
    // length disagrees with an earlier alignment.
    void add(const aln::Alignment& a);

    template<class It>
    void add(It beg, It end) { for (; beg != end; ++beg) add(*beg); }

    /**
     * @brief Map a 1-based position of `from` onto `to`.
     *
     * Throws tblift::OutOfRange when pos is 0 or beyond `from`,
     * tblift::NoAlignment when no chain of alignments joins the two.
     */
    MappedPos map_point(std::string_view from, std::string_view to, uint32_t pos) const;

    // Onto the single partner of `from`; tblift::NoAlignment if it has none or several
    MappedPos map_point(std::string_view from, uint32_t pos) const;

    /**
     * @brief Map the closed interval [lo,hi] (lo <= hi) of `from` onto `to`.
     *
     * n_target == 0 means every source base in the span is deleted in the
     * target; that is a valid result, not an error.
     */
    IntervalHit map_interval(std::string_view from, std::string_view to, uint32_t lo, uint32_t hi) const;

    // true when a chain of at most max_hops alignments joins a and b
    bool     joined(std::string_view a, std::string_view b) const;
    uint32_t seq_length(std::string_view name) const;   // tblift::NoAlignment if unknown
    std::vector<std::string> partners(std::string_view name) const;

    size_t num_alignments() const { return pairs_.size(); }
    size_t num_seqs()       const { return names_.size(); }

private:
    // Per-side tables of one alignment
    struct Side {
        uint32_t len = 0;
        std::vector<uint32_t> pos2col;  // pos-1 -> column
        std::vector<uint32_t> cum;      // bases in columns [0..c]
        bool has_base(uint32_t c) const { return cum[c] != (c ? cum[c-1] : 0u); }
        uint32_t before(uint32_t c) const { return c ? cum[c-1] : 0u; }
    };
    struct Pair {
        uint32_t id[2];
        Side     side[2];
    };
    struct Hop {
        uint32_t pair;
        uint8_t  src;  // 0: a->b, 1: b->a
    };

    uint32_t seq_id_(std::string_view name) const;  // NoAlignment if unknown
    bool find_route_(uint32_t from, uint32_t to, std::vector<Hop>& path) const;
    std::vector<Hop> route_(uint32_t from, uint32_t to) const;  // NoAlignment if none

    MappedPos hop_point_(const Hop& h, uint32_t pos) const;
    // tight span of target bases aligned inside [lo,hi]; false if empty
    bool hop_span_(const Hop& h, uint32_t lo, uint32_t hi, uint32_t& first, uint32_t& last) const;

    int max_hops_;
    std::vector<Pair> pairs_;
    std::vector<std::string> names_;
    std::vector<uint32_t> lens_;
    std::vector<std::vector<Hop>> adj_;  // seq id -> outgoing hops
    std::unordered_map<std::string, uint32_t> name2id_;
};

} // namespace coordmap
