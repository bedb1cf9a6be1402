#include <atomic>
#include <csignal>
#include <iostream>
#include <iomanip>
#include <memory>
#include <string>

#include <htslib/hts.h>

#include "include/OptionParser.hpp"
#include "include/ProgramMetadata.hpp"
#include "include/aligner.hpp"
#include "include/alignment.hpp"
#include "include/cancel.hpp"
#include "include/errors.hpp"
#include "include/feature_table.hpp"
#include "include/logger.hpp"
#include "include/multichr.hpp"
#include "include/options.hpp"
#include "include/save.hpp"
#include "include/seqdb.hpp"
#include "include/sys_utils.hpp"
#include "include/transfer.hpp"

namespace {

/* ====================== helpers ====================== */
const seqdb::Record& bind_reference(const seqdb::SeqDB& ref, const std::string& seqid, const std::string& source) {
    if (const seqdb::Record* r = ref.find_like(seqid)) return *r;
    if (ref.size() == 1) {
        warning_stream() << "table sequence " << seqid << " not found in " << source
                         << ", using its only record " << ref.at(0).name << "\n";
        return ref.at(0);
    }
    throw tblift::ParseError(source, 0, seqid, "feature table names no sequence of the reference FASTA");
}

std::unique_ptr<aln::Aligner> build_aligner(const AppConfig& cfg, const seqdb::SeqDB& ref, const seqdb::SeqDB& alt) {
    if (!cfg.in.alnFile.empty())
        return std::make_unique<aln::PrecomputedAligner>(aln::load_aligned_pairs(cfg.in.alnFile), cfg.in.alnFile);
    if (!cfg.in.pafFile.empty())
        return std::make_unique<aln::PrecomputedAligner>(aln::load_paf(cfg.in.pafFile, ref, alt), cfg.in.pafFile);
    auto a = aln::make_aligner(cfg.transfer.aligner);
    log_stream() << "aligner: " << a->name() << " (" << a->version() << ")\n";
    return a;
}

void write_diags(const std::string& path, const std::vector<transfer::Diagnostic>& diags) {
    SAVE out(path);
    out.save(transfer::diag_tsv_header());
    for (const auto& d : diags) out.save(transfer::to_tsv(d));
    out.close();
}

/* ====================== subcommands ====================== */
int run_transfer(const AppConfig& cfg, const tblift::CancelToken& cancel) {
    seqdb::SeqDB ref, alt;
    ref.load(cfg.in.refFasta);
    alt.load(cfg.in.altFasta);
    if (alt.empty()) throw tblift::ParseError(cfg.in.altFasta, 0, "", "no target sequence");
    if (alt.size() > 1) warning_stream() << cfg.in.altFasta << " holds " << alt.size() << " sequences, using the first\n";

    const ftable::FeatureTable table = ftable::parse_table_file(cfg.in.tblFiles[0]);
    const seqdb::Record& r = bind_reference(ref, table.seqid, cfg.in.refFasta);
    const seqdb::Record& a = alt.at(0);

    transfer::TransferOpts topts;
    ftable::WriteOpts      wopts;
    opt::init_opts(cfg, topts, wopts);

    transfer::TransferResult res;
    if (!cfg.in.alnFile.empty()) {
        const std::vector<aln::Alignment> alns = aln::load_msa(cfg.in.alnFile, r.name);
        res = multichr::transfer_msa(table, alns, r, a, topts, cfg.in.alnFile, cfg.transfer.max_hops);
    } else {
        const auto aligner = build_aligner(cfg, ref, alt);
        res = multichr::transfer_one(table, r, a, *aligner, topts, cancel);
    }

    SAVE out(cfg.out.outFile);
    out.save(ftable::write_table(res.table, wopts));
    out.close();
    if (!cfg.out.diagFile.empty()) write_diags(cfg.out.diagFile, res.diags);

    log_stream() << r.name << " -> " << a.name << ": " << res.n_out << "/" << res.n_in << " features transferred, "
                 << res.n_dropped << " dropped, " << res.n_truncated << " truncated, "
                 << res.diags.size() << " diagnostics\n";
    return 0;
}

int run_prealigned(const AppConfig& cfg, const tblift::CancelToken& cancel) {
    multichr::MultiOpts m;
    opt::init_opts(cfg, m);

    seqdb::SeqDB msa;
    msa.load(cfg.in.msaFile);
    const ftable::FeatureTable table = ftable::parse_table_file(cfg.in.tblFiles[0]);

    seqdb::SeqDB ref;
    const seqdb::Record* r = nullptr;
    if (!cfg.in.refFasta.empty()) {
        ref.load(cfg.in.refFasta);
        r = &bind_reference(ref, table.seqid, cfg.in.refFasta);
    }

    const multichr::RunSummary s = multichr::run_prealigned(table, msa, r, m, cancel);
    multichr::log_summary(s);
    return s.any_success() ? 0 : 1;
}

int run_multichr(const AppConfig& cfg, const tblift::CancelToken& cancel) {
    multichr::MultiOpts m;
    opt::init_opts(cfg, m);
    if (!cfg.in.pairsFile.empty()) m.pairs = multichr::load_pairs(cfg.in.pairsFile);

    seqdb::SeqDB ref, alt;
    ref.load(cfg.in.refFasta);
    alt.load(cfg.in.altFasta);

    std::vector<ftable::FeatureTable> tables;
    for (const auto& f : cfg.in.tblFiles) {
        for (auto& t : ftable::parse_tables_file(f)) tables.push_back(std::move(t));
    }
    log_stream() << tables.size() << " reference tables, " << ref.size() << " reference and "
                 << alt.size() << " target sequences\n";

    const auto aligner = build_aligner(cfg, ref, alt);
    const multichr::RunSummary s = multichr::run(tables, ref, alt, *aligner, m, cancel);
    multichr::log_summary(s);
    return s.any_success() ? 0 : 1;
}

/* ====================== command table ====================== */
struct Command {
    const char* name;
    const char* summary;
    AppConfig (*parse)(int, char**);
    int (*run)(const AppConfig&, const tblift::CancelToken&);
};

const Command COMMANDS[] = {
    {"transfer",   "transfer one reference feature table onto one target sequence",         main_transfer,   run_transfer},
    {"prealigned", "transfer a feature table onto every sequence of a multiple alignment",  main_prealigned, run_prealigned},
    {"multichr",   "transfer the feature tables of a multi-chromosome reference",           main_multichr,   run_multichr},
};

void usage(char** argv) {
    help(argv);
    std::cerr << "Subcommands:\n";
    for (const Command& c : COMMANDS) std::cerr << "  " << std::left << std::setw(12) << c.name << c.summary << "\n";
    std::cerr << "\n";
}

const Command* find_command(const std::string& name) {
    for (const Command& c : COMMANDS)
        if (name == c.name) return &c;
    return nullptr;
}

std::atomic<bool>* g_cancel_flag = nullptr;

extern "C" void on_signal(int) {
    if (g_cancel_flag) g_cancel_flag->store(true);
}

void install_signal_handlers(const tblift::CancelToken& cancel) {
    g_cancel_flag = cancel.raw();
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

inline bool is_top_help_flag(const std::string& s) { return s == "-h" || s == "--help"; }
inline bool is_top_ver_flag(const std::string& s)  { return s == "-v" || s == "--version"; }

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) { usage(argv); return 1; }
    if (is_top_help_flag(argv[1])) { usage(argv); return 0; }
    if (is_top_ver_flag(argv[1])) {
        std::cerr << program::version << " (htslib " << hts_version() << ")\n";
        return 0;
    }

    // Dispatch by subcommand
    const Command* cmd = find_command(argv[1]);
    if (!cmd) {
        error_stream() << "Unknown subcommand: " << argv[1] << "\n";
        usage(argv);
        return 1;
    }

    // timing
    double realtime0 = realtime();

    tblift::CancelToken cancel;
    install_signal_handlers(cancel);

    int rc = 1;
    try {
        const AppConfig cfg = cmd->parse(argc, argv);
        log_stream() << "CMD: " << program::cmdline(argc, argv) << "\n";
        rc = cmd->run(cfg, cancel);
    } catch (const tblift::Error& e) {
        error_stream() << tblift::kind_name(e.kind()) << ": " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        error_stream() << e.what() << "\n";
        rc = 1;
    }
    if (cancel.cancelled()) warning_stream() << "interrupted; finished chromosomes were written\n";

    log_stream()
        << "Real time: " << std::fixed << std::setprecision(3)
        << (realtime() - realtime0) << " sec; CPU: " << cputime()
        << " sec; Peak RSS: " << (peakrss() / 1024.0 / 1024.0 / 1024.0) << " GB\n";

    return rc;
}
