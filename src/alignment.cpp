#include "../include/alignment.hpp"
#include "../include/errors.hpp"
#include "../include/kpaf.hpp"
#include "../include/logger.hpp"
#include "../include/seq_utils.hpp"

#include <map>
#include <utility>

namespace aln {

uint32_t Alignment::a_len() const { return (uint32_t)seqUtils::ungapped_length(a_row); }
uint32_t Alignment::b_len() const { return (uint32_t)seqUtils::ungapped_length(b_row); }

Alignment make_alignment(std::string a_name, std::string a_row,
                         std::string b_name, std::string b_row,
                         const std::string& source) {
    const std::string pair = a_name + " vs " + b_name;
    if (a_row.size() != b_row.size()) {
        throw tblift::ParseError(source, 0, pair,
            "aligned rows differ in length (" + std::to_string(a_row.size()) + " vs " + std::to_string(b_row.size()) + ")");
    }
    if (a_row.empty()) throw tblift::ParseError(source, 0, pair, "empty alignment");

    size_t bad = seqUtils::normalize_row(a_row);
    if (bad != std::string::npos)
        throw tblift::ParseError(source, 0, a_name, std::string("illegal character '") + a_row[bad] + "' in aligned row");
    bad = seqUtils::normalize_row(b_row);
    if (bad != std::string::npos)
        throw tblift::ParseError(source, 0, b_name, std::string("illegal character '") + b_row[bad] + "' in aligned row");

    for (size_t c = 0; c < a_row.size(); ++c) {
        if (a_row[c] == '-' && b_row[c] == '-') {
            throw tblift::ParseError(source, 0, pair, "degenerate alignment: column " + std::to_string(c + 1) + " is a gap in both rows");
        }
    }
    return Alignment{std::move(a_name), std::move(b_name), std::move(a_row), std::move(b_row)};
}

Alignment from_cigar(const std::string& a_name, std::string_view a,
                     const std::string& b_name, std::string_view b,
                     const std::vector<CIGAR::COp>& ops,
                     const std::string& source) {
    if (CIGAR::ref_span(ops) != a.size() || CIGAR::query_span(ops) != b.size()) {
        throw tblift::ParseError(source, 0, CIGAR::pack(ops),
            "CIGAR does not span " + a_name + " (" + std::to_string(a.size()) + " bp) and " +
            b_name + " (" + std::to_string(b.size()) + " bp)");
    }
    std::string a_row, b_row;
    CIGAR::to_rows(ops, a, b, a_row, b_row);
    return make_alignment(a_name, std::move(a_row), b_name, std::move(b_row), source);
}

std::vector<Alignment> project_msa(const seqdb::SeqDB& msa, std::string_view hub, const std::string& source) {
    if (msa.size() < 2) throw tblift::ParseError(source, 0, "", "alignment needs at least two sequences");

    const seqdb::Record* h = hub.empty() ? &msa.at(0) : msa.find_like(hub);
    if (!h) throw tblift::ParseError(source, 0, std::string(hub), "reference sequence not found in alignment");

    const size_t ncol = h->seq.size();
    for (const auto& r : msa.records()) {
        if (r.seq.size() != ncol) {
            throw tblift::ParseError(source, 0, r.name,
                "aligned row length " + std::to_string(r.seq.size()) + " differs from " + std::to_string(ncol));
        }
    }

    std::vector<Alignment> out;
    out.reserve(msa.size() - 1);
    for (const auto& r : msa.records()) {
        if (&r == h) continue;
        std::string a_row, b_row;
        a_row.reserve(ncol); b_row.reserve(ncol);
        for (size_t c = 0; c < ncol; ++c) {
            if (h->seq[c] == '-' && r.seq[c] == '-') continue;
            a_row.push_back(h->seq[c]);
            b_row.push_back(r.seq[c]);
        }
        out.push_back(make_alignment(h->name, std::move(a_row), r.name, std::move(b_row), source));
    }
    return out;
}

std::vector<Alignment> load_msa(const std::string& path, std::string_view hub) {
    seqdb::SeqDB msa;
    msa.load(path);
    auto out = project_msa(msa, hub, path);
    log_stream() << path << ": " << msa.size() << " aligned sequences, " << out.size() << " pairwise alignments\n";
    return out;
}

std::vector<Alignment> load_aligned_pairs(const std::string& path) {
    seqdb::SeqDB db;
    db.load(path);
    if (db.empty() || db.size() % 2 != 0) {
        throw tblift::ParseError(path, 0, "", "expected reference/target row pairs, found " + std::to_string(db.size()) + " rows");
    }
    std::vector<Alignment> out;
    out.reserve(db.size() / 2);
    for (size_t i = 0; i < db.size(); i += 2) {
        const seqdb::Record& a = db.at(i);
        const seqdb::Record& b = db.at(i + 1);
        out.push_back(make_alignment(a.name, a.seq, b.name, b.seq, path));
    }
    log_stream() << path << ": " << out.size() << " pairwise alignments\n";
    return out;
}

std::vector<Alignment> load_paf(const std::string& path, const seqdb::SeqDB& ref, const seqdb::SeqDB& alt) {
    struct Best { paf::Record rec; uint64_t line = 0; };
    std::map<std::pair<std::string, std::string>, Best> best;  // (tname,qname)

    paf::Reader reader(path);
    paf::Record r;
    size_t n_rev = 0, n_rec = 0;
    while (reader.next(r)) {
        ++n_rec;
        if (r.strand == '-') { ++n_rev; continue; }
        auto key = std::make_pair(r.tname, r.qname);
        auto it = best.find(key);
        uint32_t span = r.tend - r.tstart;
        if (it == best.end() || span > it->second.rec.tend - it->second.rec.tstart) {
            best[key] = Best{r, reader.line_no()};
        }
    }
    if (n_rev) warning_stream() << path << ": skipped " << n_rev << " reverse-strand records\n";

    std::vector<Alignment> out;
    for (const auto& kv : best) {
        const paf::Record& p = kv.second.rec;
        const uint64_t ln = kv.second.line;

        const seqdb::Record* t = ref.find_like(p.tname);
        const seqdb::Record* q = alt.find_like(p.qname);
        if (!t || !q) {
            warning_stream() << path << ":" << ln << ": " << (t ? p.qname : p.tname) << " not found in the input FASTA, record skipped\n";
            continue;
        }
        if (t->seq.size() != p.tlen || q->seq.size() != p.qlen) {
            throw tblift::ParseError(path, ln, p.tname + " vs " + p.qname, "PAF sequence lengths disagree with the FASTA");
        }

        char type = 0;
        std::string_view cg;
        if (!paf::find_tag(p, "cg", type, cg) || type != 'Z') {
            throw tblift::ParseError(path, ln, p.tname + " vs " + p.qname, "record has no cg:Z CIGAR tag");
        }

        std::vector<CIGAR::COp> core;
        try {
            core = CIGAR::parse(cg);
        } catch (const tblift::ParseError&) {
            throw tblift::ParseError(path, ln, std::string(cg), "malformed CIGAR");
        }
        if (CIGAR::ref_span(core) != p.tend - p.tstart || CIGAR::query_span(core) != p.qend - p.qstart) {
            throw tblift::ParseError(path, ln, std::string(cg), "CIGAR does not span the PAF intervals");
        }

        // [ref prefix|-][-|alt prefix] core [-|alt suffix][ref suffix|-]
        std::vector<CIGAR::COp> ops;
        CIGAR::append(ops, p.tstart, 'D');
        CIGAR::append(ops, p.qstart, 'I');
        for (const auto& o : core) CIGAR::append(ops, o.len, o.op);
        CIGAR::append(ops, p.qlen - p.qend, 'I');
        CIGAR::append(ops, p.tlen - p.tend, 'D');

        out.push_back(from_cigar(t->name, t->seq, q->name, q->seq, ops, path));
    }
    log_stream() << path << ": " << n_rec << " records, " << out.size() << " pairwise alignments\n";
    return out;
}

} // namespace aln
