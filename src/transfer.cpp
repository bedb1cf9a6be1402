#include "../include/transfer.hpp"
#include "../include/ThreadPool.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <regex>
#include <utility>

namespace transfer {

const char* kind_name(DiagKind k) {
    switch (k) {
        case DiagKind::LengthChanged:    return "length_changed";
        case DiagKind::GapAdjacent:      return "gap_adjacent";
        case DiagKind::Truncated:        return "truncated";
        case DiagKind::Collapsed:        return "collapsed";
        case DiagKind::IntervalDropped:  return "interval_dropped";
        case DiagKind::FeatureDropped:   return "feature_dropped";
        case DiagKind::QualifierDropped: return "qualifier_dropped";
    }
    return "?";
}

std::string diag_tsv_header() {
    return "#seqid\tfeature_index\tfeature_type\tlabel\tkind\tlocation\tmessage\n";
}

std::string to_tsv(const Diagnostic& d) {
    std::string s;
    s += d.seqid;                   s += '\t';
    s += std::to_string(d.feature_index); s += '\t';
    s += d.feature_type;            s += '\t';
    s += d.label;                   s += '\t';
    s += kind_name(d.kind);         s += '\t';
    s += d.location;                s += '\t';
    s += d.message;                 s += '\n';
    return s;
}

bool is_coordinate_qualifier(const std::string& key) {
    return key == "transl_except" || key == "anticodon" || key == "rpt_unit_range" || key == "tag_peptide";
}

namespace {

using coordmap::MapKind;
using ftable::Fuzz;
using ftable::Position;

// A reference span [lo,hi] placed on the target.
struct Span {
    bool     deleted   = false;  // no target base inside the span
    bool     both_gap  = false;  // deleted, and both ends fell on internal target gaps
    uint32_t lo = 0, hi = 0;
    bool     trunc_lo = false, trunc_hi = false;
    bool     gap_lo   = false, gap_hi   = false;
    uint32_t src_len = 0, tgt_len = 0;
};

Span place_span(const coordmap::CoordMapper& cm, const std::string& ref, const std::string& alt,
                uint32_t lo, uint32_t hi) {
    const coordmap::IntervalHit H = cm.map_interval(ref, alt, lo, hi);
    Span s;
    s.src_len = H.src_len;
    s.gap_lo  = H.lo.kind == MapKind::Upstream;
    s.gap_hi  = H.hi.kind == MapKind::Upstream;
    if (H.n_target == 0) {
        s.deleted  = true;
        s.both_gap = s.gap_lo && s.gap_hi;
        s.lo = s.hi = H.lo.pos;
        return s;
    }
    s.trunc_lo = H.lo.kind == MapKind::Unmapped;
    s.trunc_hi = H.hi.kind == MapKind::PastEnd;
    s.lo = s.trunc_lo ? 1u : std::min(H.lo.pos, H.first);
    s.hi = H.hi.pos;
    s.tgt_len = s.hi - s.lo + 1;
    return s;
}

struct FeatureOut {
    bool                    keep = false;
    bool                    truncated = false;
    ftable::Feature         feat;
    std::vector<Diagnostic> diags;
};

class FeatureMapper {
public:
    FeatureMapper(const coordmap::CoordMapper& cm, const std::string& ref, const std::string& alt,
                  const TransferOpts& opts)
        : cm_(cm), ref_(ref), alt_(alt), opts_(opts),
          ref_len_(cm.seq_length(ref)),
          coord_re_(R"(([<>]?)(\d+)(?:\.\.([<>]?)(\d+))?)") {}

    FeatureOut run(const ftable::Feature& src, size_t idx) const {
        FeatureOut out;
        out.feat.type = src.type;
        const std::string loc = src.location();
        auto note = [&](DiagKind k, const std::string& where, std::string msg) {
            out.diags.push_back(Diagnostic{alt_, idx, src.type, src.label(), k, where, std::move(msg)});
        };

        bool trunc_5p = false;
        for (const auto& iv : src.intervals) {
            const std::string iv_loc = interval_loc_(iv);
            const Span s = place_span(cm_, ref_, alt_, iv.lo(), iv.hi());

            Position lo_src = iv.reverse ? iv.end : iv.start;
            Position hi_src = iv.reverse ? iv.start : iv.end;
            if (opts_.ignore_ambig_edge) { lo_src.fuzz = Fuzz::Exact; hi_src.fuzz = Fuzz::Exact; }

            ftable::Interval m;
            m.reverse = iv.reverse;

            if (s.deleted) {
                if (s.both_gap && opts_.gap_pair == GapPairPolicy::Point) {
                    m.start = Position{s.lo, (iv.reverse ? hi_src : lo_src).fuzz};
                    m.end   = Position{s.lo, (iv.reverse ? lo_src : hi_src).fuzz};
                    out.feat.intervals.push_back(m);
                    note(DiagKind::Collapsed, iv_loc, "interval deleted in target, kept as base " + std::to_string(s.lo));
                } else {
                    note(DiagKind::IntervalDropped, iv_loc,
                         s.both_gap || s.gap_lo || s.gap_hi ? "interval deleted in target" : "interval outside target sequence");
                }
                continue;
            }

            if ((s.trunc_lo || s.trunc_hi) && !opts_.oob_clip) {
                note(DiagKind::IntervalDropped, iv_loc, "interval extends beyond target ends");
                continue;
            }

            Position lo_new{s.lo, lo_src.fuzz};
            Position hi_new{s.hi, hi_src.fuzz};
            // 5' boundary takes '<', 3' boundary takes '>'
            if (!iv.reverse) {
                if (s.trunc_lo) lo_new.fuzz = Fuzz::Less;
                if (s.trunc_hi) hi_new.fuzz = Fuzz::Greater;
                m.start = lo_new; m.end = hi_new;
            } else {
                if (s.trunc_hi) hi_new.fuzz = Fuzz::Less;
                if (s.trunc_lo) lo_new.fuzz = Fuzz::Greater;
                m.start = hi_new; m.end = lo_new;
            }

            const bool t5 = iv.reverse ? s.trunc_hi : s.trunc_lo;
            if (out.feat.intervals.empty() && t5) trunc_5p = true;
            if (s.trunc_lo || s.trunc_hi) {
                out.truncated = true;
                note(DiagKind::Truncated, iv_loc, "clipped to target ends as " + interval_loc_(m));
            }
            if (s.gap_lo || s.gap_hi) {
                note(DiagKind::GapAdjacent, iv_loc, std::string(s.gap_lo ? "start" : "end") +
                     (s.gap_lo && s.gap_hi ? " and end" : "") + " in a target gap, mapped to the upstream base");
            }
            if (!s.trunc_lo && !s.trunc_hi && s.tgt_len != s.src_len) {
                note(DiagKind::LengthChanged, iv_loc, "length " + std::to_string(s.src_len) + " -> " +
                     std::to_string(s.tgt_len) + (s.tgt_len < s.src_len ? " (deletion)" : " (insertion)"));
            }
            out.feat.intervals.push_back(m);
        }

        if (out.feat.intervals.empty()) {
            note(DiagKind::FeatureDropped, loc, "no interval left on target");
            return out;
        }

        const bool is_cds = src.type == "CDS";
        if (is_cds && trunc_5p && opts_.cds_frame_clip && !frame_clip_(out.feat)) {
            note(DiagKind::FeatureDropped, loc, "less than one codon left after frame clipping");
            out.feat.intervals.clear();
            return out;
        }

        for (const auto& q : src.quals) {
            if (!is_coordinate_qualifier(q.key) || !q.has_value) {
                out.feat.quals.push_back(q);
                continue;
            }
            std::string v;
            if (remap_qualifier_(q.value, q.key, v)) {
                out.feat.quals.push_back(ftable::Qualifier{q.key, std::move(v), true});
            } else {
                note(DiagKind::QualifierDropped, loc, q.key + " " + q.value + " cannot be placed on target");
            }
        }
        if (is_cds && out.truncated && opts_.cds_note) {
            out.feat.add_qualifier("note", "sequencing did not capture complete CDS");
        }
        out.keep = true;
        return out;
    }

private:
    static std::string interval_loc_(const ftable::Interval& iv) {
        return ftable::to_string(iv.start) + ".." + ftable::to_string(iv.end);
    }

    // Move the 5' start of the first interval inward so the coding length is a multiple of 3.
    static bool frame_clip_(ftable::Feature& f) {
        uint64_t total = 0;
        for (const auto& iv : f.intervals) total += iv.len();
        const uint32_t shift = (uint32_t)(total % 3);
        if (total - shift < 3) return false;
        ftable::Interval& first = f.intervals.front();
        if (first.len() <= shift) return false;
        if (first.reverse) first.start.pos -= shift;
        else               first.start.pos += shift;
        return true;
    }

    // Remap every coordinate of a pos:/range value; false when any cannot be placed
    bool remap_qualifier_(const std::string& value, const std::string& key, std::string& out) const {
        size_t beg = 0, end = value.size();
        if (key == "transl_except" || key == "anticodon") {
            beg = value.find("pos:");
            if (beg == std::string::npos) return false;
            beg += 4;
            size_t stop = value.find(",aa:", beg);
            if (stop == std::string::npos) stop = value.find(",seq:", beg);
            if (stop != std::string::npos) end = stop;
        }

        const std::string seg = value.substr(beg, end - beg);
        std::string mapped;
        size_t last = 0;
        bool any = false;
        for (auto it = std::sregex_iterator(seg.begin(), seg.end(), coord_re_); it != std::sregex_iterator(); ++it) {
            const std::smatch& m = *it;
            mapped.append(seg, last, (size_t)m.position(0) - last);
            std::string piece;
            if (!remap_range_(m, piece)) return false;
            mapped += piece;
            last = (size_t)(m.position(0) + m.length(0));
            any = true;
        }
        if (!any) return false;
        mapped.append(seg, last, std::string::npos);
        out = value.substr(0, beg) + mapped + value.substr(end);
        return true;
    }

    bool remap_range_(const std::smatch& m, std::string& out) const {
        auto fuzz_of = [](const std::string& s) {
            return s == "<" ? Fuzz::Less : s == ">" ? Fuzz::Greater : Fuzz::Exact;
        };
        if (m[2].length() > 9 || m[4].length() > 9) return false;
        const uint64_t a = std::stoull(m[2].str());
        const uint64_t b = m[4].matched ? std::stoull(m[4].str()) : a;
        const uint64_t lo = std::min(a, b), hi = std::max(a, b);
        if (lo == 0 || hi > ref_len_) return false;

        const Span s = place_span(cm_, ref_, alt_, (uint32_t)lo, (uint32_t)hi);
        if (s.deleted) return false;
        if ((s.trunc_lo || s.trunc_hi) && !opts_.oob_clip) return false;

        const bool rev = a > b;
        Position p1{rev ? s.hi : s.lo, fuzz_of(m[1].str())};
        if (opts_.ignore_ambig_edge) p1.fuzz = Fuzz::Exact;
        if (!m[4].matched) {
            out = ftable::to_string(p1);
            return true;
        }
        Position p2{rev ? s.lo : s.hi, fuzz_of(m[3].str())};
        if (opts_.ignore_ambig_edge) p2.fuzz = Fuzz::Exact;
        if (rev ? s.trunc_hi : s.trunc_lo) p1.fuzz = Fuzz::Less;
        if (rev ? s.trunc_lo : s.trunc_hi) p2.fuzz = Fuzz::Greater;
        out = ftable::to_string(p1) + ".." + ftable::to_string(p2);
        return true;
    }

    const coordmap::CoordMapper& cm_;
    const std::string& ref_;
    const std::string& alt_;
    const TransferOpts& opts_;
    uint32_t ref_len_;
    std::regex coord_re_;
};

} // namespace

TransferResult transfer_table(const ftable::FeatureTable& ref,
                              const coordmap::CoordMapper& cm,
                              const std::string& ref_name,
                              const std::string& alt_name,
                              const TransferOpts& opts) {
    if (!cm.joined(ref_name, alt_name)) throw tblift::NoAlignment(ref_name, alt_name);

    const FeatureMapper fm(cm, ref_name, alt_name, opts);
    auto outs = parallel_map(ref.features.size(), opts.threads, [&](size_t i) {
        return fm.run(ref.features[i], i);
    });

    TransferResult res;
    res.table.seqid      = alt_name;
    res.table.table_name = ref.table_name;
    res.n_in = ref.features.size();
    for (auto& o : outs) {
        for (auto& d : o.diags) res.diags.push_back(std::move(d));
        if (o.truncated) ++res.n_truncated;
        if (!o.keep) { ++res.n_dropped; continue; }
        res.table.features.push_back(std::move(o.feat));
    }
    res.n_out = res.table.features.size();

    debug_stream() << ref_name << " -> " << alt_name << ": " << res.n_out << "/" << res.n_in
                   << " features, " << res.n_dropped << " dropped, " << res.n_truncated << " truncated\n";
    return res;
}

} // namespace transfer
