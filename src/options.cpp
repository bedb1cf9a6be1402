#include "../include/options.hpp"
#include "../include/errors.hpp"

#include <regex>

namespace opt {

void init_opts(const AppConfig& cfg, transfer::TransferOpts& t, ftable::WriteOpts& w) {
    t.oob_clip          = !cfg.transfer.oob_drop;
    t.ignore_ambig_edge = cfg.transfer.ignore_ambig_edge;
    t.gap_pair          = cfg.transfer.gap_pair == "point" ? transfer::GapPairPolicy::Point : transfer::GapPairPolicy::Drop;
    t.cds_frame_clip    = cfg.transfer.cds_frame_clip;
    t.cds_note          = !cfg.transfer.no_cds_note;
    t.threads           = (size_t)cfg.global.threads;

    w.exclude_quals.clear();
    if (!cfg.transfer.keep_protein_id) w.exclude_quals.emplace_back(DEFAULT_EXCLUDED_QUAL);
    for (const auto& re : cfg.transfer.exclude_quals) {
        try {
            w.exclude_quals.emplace_back(re);
        } catch (const std::regex_error& e) {
            throw tblift::ParseError("--exclude_qual", 0, re, std::string("invalid regular expression: ") + e.what());
        }
    }
    w.trailing_blank = true;
}

void init_opts(const AppConfig& cfg, multichr::MultiOpts& m) {
    init_opts(cfg, m.transfer, m.write);
    m.pairing = cfg.multichr.by_order        ? multichr::Pairing::ByOrder
              : !cfg.in.pairsFile.empty()    ? multichr::Pairing::Explicit
                                             : multichr::Pairing::Equality;
    m.strict      = cfg.multichr.strict;
    m.exclude     = cfg.multichr.exclude;
    m.threads     = (size_t)cfg.global.threads;
    m.out_dir     = cfg.out.outDir;
    m.write_fasta = !cfg.out.noFasta;
    m.diag_path   = cfg.out.diagFile;
}

} // namespace opt
