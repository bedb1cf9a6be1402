#include "../include/OptionParser.hpp"
#include "../include/ProgramMetadata.hpp"
#include "../include/logger.hpp"

#include <getopt.h>
#include <cstdlib>
#include <initializer_list>
#include <iterator>
#include <vector>
#include <iostream>
#include <algorithm>
#include <iomanip>
#include <sstream>

/* ids of long-only options shared by every subcommand */
enum SharedOpt {
    OPT_OOB_DROP = 2001,
    OPT_IGNORE_AMBIG,
    OPT_GAP_PAIR,
    OPT_FRAME_CLIP,
    OPT_NO_CDS_NOTE,
    OPT_EXCLUDE_QUAL,
    OPT_KEEP_PROTEIN_ID,
    OPT_DIAG,
    OPT_LOGLEVEL
};

static const struct option SHARED_LONG_OPTS[] = {
    {"oob_drop",          no_argument,       nullptr, OPT_OOB_DROP},
    {"ignore_ambig_edge", no_argument,       nullptr, OPT_IGNORE_AMBIG},
    {"gap_pair",          required_argument, nullptr, OPT_GAP_PAIR},
    {"cds_frame_clip",    no_argument,       nullptr, OPT_FRAME_CLIP},
    {"no_cds_note",       no_argument,       nullptr, OPT_NO_CDS_NOTE},
    {"exclude_qual",      required_argument, nullptr, OPT_EXCLUDE_QUAL},
    {"keep_protein_id",   no_argument,       nullptr, OPT_KEEP_PROTEIN_ID},
    {"diag",              required_argument, nullptr, OPT_DIAG},
    {"loglevel",          required_argument, nullptr, OPT_LOGLEVEL},
    {"threads",           required_argument, nullptr, 't'},
    {"debug",             no_argument,       nullptr, 'd'},
    {"help",              no_argument,       nullptr, 'h'},
};

// subcommand options followed by the shared ones and the terminator
static std::vector<struct option> with_shared(std::initializer_list<struct option> own) {
    std::vector<struct option> v(own);
    v.insert(v.end(), std::begin(SHARED_LONG_OPTS), std::end(SHARED_LONG_OPTS));
    v.push_back({nullptr, 0, nullptr, 0});
    return v;
}

// true when c was one of the shared options
static bool parse_shared(int c, AppConfig& cfg) {
    switch (c) {
        case OPT_OOB_DROP:        cfg.transfer.oob_drop          = true;   return true;
        case OPT_IGNORE_AMBIG:    cfg.transfer.ignore_ambig_edge = true;   return true;
        case OPT_GAP_PAIR:        cfg.transfer.gap_pair          = optarg; return true;
        case OPT_FRAME_CLIP:      cfg.transfer.cds_frame_clip    = true;   return true;
        case OPT_NO_CDS_NOTE:     cfg.transfer.no_cds_note       = true;   return true;
        case OPT_EXCLUDE_QUAL:    cfg.transfer.exclude_quals.emplace_back(optarg); return true;
        case OPT_KEEP_PROTEIN_ID: cfg.transfer.keep_protein_id   = true;   return true;
        case OPT_DIAG:            cfg.out.diagFile               = optarg; return true;
        case OPT_LOGLEVEL:        cfg.global.loglevel            = optarg; return true;
        case 't':                 cfg.global.threads             = std::stoi(optarg); return true;
        case 'd':                 cfg.global.debug               = true;   return true;
        default:                  return false;
    }
}

static void validate_and_print(AppConfig& cfg) {
    using std::left;
    using std::setw;

    auto die    = [&](const char* msg){ error_stream() << msg << "\n"; std::exit(1); };
    auto ensure = [&](bool ok, const char* msg){ if (!ok) die(msg); };
    auto onoff  = [](bool b){ return b ? "ON" : "OFF"; };

    const int KEYW = 25;

    auto kv = [&](const char* key, const auto& val) {
        std::ostringstream oss;
        oss << left << setw(KEYW) << key << ": " << val;
        log_stream() << oss.str() << "\n";
    };
    auto join = [](const std::vector<std::string>& v) {
        std::string s;
        for (const auto& x : v) { if (!s.empty()) s += ' '; s += x; }
        return s;
    };

    LogLevel lv;
    ensure(parse_log_level(cfg.global.loglevel, lv), "--loglevel must be one of debug, info, warning, error");
    if (cfg.global.debug) { cfg.global.threads = 1; set_debug(true); }
    else                  set_log_level(lv);

    ensure(cfg.global.threads >= 1, "threads must be >= 1");
    ensure(cfg.transfer.gap_pair == "drop" || cfg.transfer.gap_pair == "point", "--gap_pair must be drop or point");
    ensure(cfg.transfer.aligner == "wfa" || cfg.transfer.aligner == "mafft", "--aligner must be wfa or mafft");
    ensure(cfg.transfer.max_hops >= 1, "--max_hops must be >= 1");

    const char* mode =
        cfg.mode == ToolMode::transfer   ? "transfer" :
        cfg.mode == ToolMode::prealigned ? "prealigned" :
        cfg.mode == ToolMode::multichr   ? "multichr" : "unknown";

    kv("Version", program::version);
    kv("Mode", mode);
    kv("Threads", cfg.global.threads);
    kv("Debug", onoff(cfg.global.debug));

    switch (cfg.mode) {
        case ToolMode::transfer:
            ensure(!cfg.in.refFasta.empty(),     "-r/--ref is required");
            ensure(cfg.in.tblFiles.size() == 1,  "exactly one -a/--tbl is required");
            ensure(!cfg.in.altFasta.empty(),     "-q/--query is required");
            ensure(cfg.in.alnFile.empty() || cfg.in.pafFile.empty(), "Options --aln and --paf are mutually exclusive");
            kv("Reference FASTA", cfg.in.refFasta);
            kv("Reference table", cfg.in.tblFiles[0]);
            kv("Target FASTA",    cfg.in.altFasta);
            kv("Output table",    cfg.out.outFile);
            break;

        case ToolMode::prealigned:
            ensure(!cfg.in.msaFile.empty(),      "-i/--msa is required");
            ensure(cfg.in.tblFiles.size() == 1,  "exactly one -a/--tbl is required");
            ensure(!cfg.out.outDir.empty(),      "-o/--outdir is required");
            kv("Alignment",        cfg.in.msaFile);
            kv("Reference table",  cfg.in.tblFiles[0]);
            if (!cfg.in.refFasta.empty()) kv("Reference FASTA", cfg.in.refFasta);
            kv("Output directory", cfg.out.outDir);
            if (!cfg.multichr.exclude.empty()) kv("Excluded", join(cfg.multichr.exclude));
            break;

        case ToolMode::multichr:
            ensure(!cfg.in.refFasta.empty(),     "-r/--ref is required");
            ensure(!cfg.in.tblFiles.empty(),     "-a/--tbl is required");
            ensure(!cfg.in.altFasta.empty(),     "-q/--query is required");
            ensure(!cfg.out.outDir.empty(),      "-o/--outdir is required");
            ensure(cfg.in.pairsFile.empty() || !cfg.multichr.by_order, "Options --pairs and --by_order are mutually exclusive");
            ensure(cfg.in.alnFile.empty() || cfg.in.pafFile.empty(),   "Options --aln and --paf are mutually exclusive");
            kv("Reference FASTA",  cfg.in.refFasta);
            kv("Reference tables", join(cfg.in.tblFiles));
            kv("Target FASTA",     cfg.in.altFasta);
            kv("Output directory", cfg.out.outDir);
            kv("Pairing", cfg.multichr.by_order ? std::string("by order")
                        : !cfg.in.pairsFile.empty() ? "pairs file " + cfg.in.pairsFile : std::string("same id"));
            kv("Unmatched", cfg.multichr.strict ? "fatal" : "warn");
            if (!cfg.multichr.exclude.empty()) kv("Excluded", join(cfg.multichr.exclude));
            break;
    }

    if (cfg.mode != ToolMode::prealigned) {
        kv("Alignment", !cfg.in.alnFile.empty() ? "aligned FASTA " + cfg.in.alnFile
                      : !cfg.in.pafFile.empty() ? "PAF " + cfg.in.pafFile
                      : "computed with " + cfg.transfer.aligner);
    }
    kv("Out-of-range intervals", cfg.transfer.oob_drop ? "drop" : "clip");
    kv("Ignore '<'/'>' edges",   onoff(cfg.transfer.ignore_ambig_edge));
    kv("Deleted gap pairs",      cfg.transfer.gap_pair);
    kv("CDS frame clip",         onoff(cfg.transfer.cds_frame_clip));
    kv("CDS truncation note",    onoff(!cfg.transfer.no_cds_note));
    kv("Keep protein_id",        onoff(cfg.transfer.keep_protein_id));
    if (!cfg.transfer.exclude_quals.empty()) kv("Excluded qualifiers", join(cfg.transfer.exclude_quals));
    if (!cfg.out.diagFile.empty()) kv("Diagnostics", cfg.out.diagFile);
}

static void help_shared() {
    std::cerr
        << "Transfer Options:\n"
        << "      --oob_drop             drop intervals that run past the target ends (default: clip and mark '<'/'>')\n"
        << "      --ignore_ambig_edge    treat '<'/'>' in the reference table as exact ends\n"
        << "      --gap_pair    STR      interval deleted in the target with both ends in gaps: drop|point [" << TransferCliOpts().gap_pair << "]\n"
        << "      --cds_frame_clip       keep a 5'-truncated CDS a whole number of codons long\n"
        << "      --no_cds_note          do not add a note to truncated CDS features\n"
        << "      --exclude_qual REGEX   leave out qualifiers whose key matches (repeatable)\n"
        << "      --keep_protein_id      copy protein_id qualifiers (left out by default)\n"
        << "      --diag        FILE     write per-feature diagnostics as TSV\n\n"
        << "General Options:\n"
        << "  -t, --threads     INT      threads [" << GlobalOpts().threads << "]\n"
        << "      --loglevel    STR      debug|info|warning|error [" << GlobalOpts().loglevel << "]\n"
        << "  -d, --debug                debug mode (forces threads=1)\n"
        << "  -h, --help                 show this help\n\n";
}

void help(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " <subcommand> [options]\n\n"
        << program::description << "\n"
        << "Version: " << program::version << "\n"
        << "Date:    " << program::build_date << "\n"
        << "\n";
}

/* ---------------------------- transfer ---------------------------- */
void help_transfer(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -r FILE -a FILE -q FILE [-o FILE] [options]\n\n"
        << "Transfer one reference feature table onto one target sequence\n\n"
        << "Input/Output:\n"
        << "  -r, --ref         FILE     reference FASTA (the chromosome of the table)\n"
        << "  -a, --tbl         FILE     reference feature table (5-column .tbl)\n"
        << "  -q, --query       FILE     target FASTA\n"
        << "  -o, --output      FILE     output feature table [stdout]\n\n"
        << "Alignment Options:\n"
        << "      --aln         FILE     precomputed aligned FASTA holding both sequences\n"
        << "      --paf         FILE     precomputed PAF (cg:Z CIGAR; tname = reference)\n"
        << "      --aligner     STR      aligner when no alignment is given: wfa|mafft [" << TransferCliOpts().aligner << "]\n"
        << "      --max_hops    INT      alignments chained through a hub sequence [" << TransferCliOpts().max_hops << "]\n\n";
    help_shared();
}

AppConfig main_transfer(int argc, char** argv) {
    if (argc < 3) { help_transfer(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::transfer;

    const auto long_opts = with_shared({
        {"ref",      required_argument, nullptr, 'r'},
        {"tbl",      required_argument, nullptr, 'a'},
        {"query",    required_argument, nullptr, 'q'},
        {"output",   required_argument, nullptr, 'o'},
        {"aln",      required_argument, nullptr, 1001},
        {"paf",      required_argument, nullptr, 1002},
        {"aligner",  required_argument, nullptr, 1003},
        {"max_hops", required_argument, nullptr, 1004},
    });
    const char* short_opts = "r:a:q:o:t:dh";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts.data(), &idx)) != -1) {
        if (parse_shared(c, cfg)) continue;
        switch (c) {
            case 'r':  cfg.in.refFasta = optarg;                break;
            case 'a':  cfg.in.tblFiles.emplace_back(optarg);    break;
            case 'q':  cfg.in.altFasta = optarg;                break;
            case 'o':  cfg.out.outFile = optarg;                break;
            case 1001: cfg.in.alnFile  = optarg;                break;
            case 1002: cfg.in.pafFile  = optarg;                break;
            case 1003: cfg.transfer.aligner  = optarg;          break;
            case 1004: cfg.transfer.max_hops = std::stoi(optarg); break;
            case 'h': help_transfer(argv); std::exit(0);
            default:  help_transfer(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);

    return cfg;
}

/* ---------------------------- prealigned ---------------------------- */
void help_prealigned(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -i FILE -a FILE -o DIR [options]\n\n"
        << "Transfer a reference feature table onto every other sequence of a multiple alignment\n\n"
        << "Input/Output:\n"
        << "  -i, --msa         FILE     aligned FASTA; the row named like the table's sequence is the reference\n"
        << "  -a, --tbl         FILE     reference feature table\n"
        << "  -r, --ref         FILE     reference FASTA, checked against its aligned row (optional)\n"
        << "  -o, --outdir      DIR      output directory (<id>.tbl, <id>.fasta, transfer.diag.tsv)\n"
        << "      --exclude     ID       skip this aligned sequence (repeatable)\n"
        << "      --no_fasta             do not write the target FASTA files\n\n";
    help_shared();
}

AppConfig main_prealigned(int argc, char** argv) {
    if (argc < 3) { help_prealigned(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::prealigned;

    const auto long_opts = with_shared({
        {"msa",      required_argument, nullptr, 'i'},
        {"tbl",      required_argument, nullptr, 'a'},
        {"ref",      required_argument, nullptr, 'r'},
        {"outdir",   required_argument, nullptr, 'o'},
        {"exclude",  required_argument, nullptr, 1001},
        {"no_fasta", no_argument,       nullptr, 1002},
    });
    const char* short_opts = "i:a:r:o:t:dh";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts.data(), &idx)) != -1) {
        if (parse_shared(c, cfg)) continue;
        switch (c) {
            case 'i':  cfg.in.msaFile  = optarg;                 break;
            case 'a':  cfg.in.tblFiles.emplace_back(optarg);     break;
            case 'r':  cfg.in.refFasta = optarg;                 break;
            case 'o':  cfg.out.outDir  = optarg;                 break;
            case 1001: cfg.multichr.exclude.emplace_back(optarg); break;
            case 1002: cfg.out.noFasta = true;                   break;
            case 'h': help_prealigned(argv); std::exit(0);
            default:  help_prealigned(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);

    return cfg;
}

/* ---------------------------- multichr ---------------------------- */
void help_multichr(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -r FILE -a FILE [-a FILE ...] -q FILE -o DIR [options]\n\n"
        << "Transfer the feature tables of a multi-chromosome reference onto the matching target chromosomes\n\n"
        << "Input/Output:\n"
        << "  -r, --ref         FILE     reference FASTA (all chromosomes)\n"
        << "  -a, --tbl         FILE     reference feature tables, one or many per file (repeatable)\n"
        << "  -q, --query       FILE     target FASTA (all chromosomes)\n"
        << "  -o, --outdir      DIR      output directory (<id>.tbl, <id>.fasta, transfer.diag.tsv)\n"
        << "      --no_fasta             do not write the target FASTA files\n\n"
        << "Pairing Options:\n"
        << "      --pairs       FILE     ref<TAB>target id pairs (default: same id)\n"
        << "      --by_order             pair the i-th reference table with the i-th target sequence\n"
        << "      --warn_unmatched       warn and go on when a reference chromosome has no target\n"
        << "      --exclude     ID       skip this reference chromosome (repeatable)\n\n"
        << "Alignment Options:\n"
        << "      --aln         FILE     precomputed aligned FASTA, consecutive reference/target row pairs\n"
        << "      --paf         FILE     precomputed PAF (cg:Z CIGAR; tname = reference)\n"
        << "      --aligner     STR      aligner when no alignment is given: wfa|mafft [" << TransferCliOpts().aligner << "]\n\n";
    help_shared();
}

AppConfig main_multichr(int argc, char** argv) {
    if (argc < 3) { help_multichr(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::multichr;

    const auto long_opts = with_shared({
        {"ref",      required_argument, nullptr, 'r'},
        {"tbl",      required_argument, nullptr, 'a'},
        {"query",    required_argument, nullptr, 'q'},
        {"outdir",   required_argument, nullptr, 'o'},
        {"pairs",    required_argument, nullptr, 1001},
        {"by_order", no_argument,       nullptr, 1002},
        {"warn_unmatched", no_argument, nullptr, 1003},
        {"exclude",  required_argument, nullptr, 1004},
        {"aln",      required_argument, nullptr, 1005},
        {"paf",      required_argument, nullptr, 1006},
        {"aligner",  required_argument, nullptr, 1007},
        {"no_fasta", no_argument,       nullptr, 1008},
    });
    const char* short_opts = "r:a:q:o:t:dh";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts.data(), &idx)) != -1) {
        if (parse_shared(c, cfg)) continue;
        switch (c) {
            case 'r':  cfg.in.refFasta = optarg;                  break;
            case 'a':  cfg.in.tblFiles.emplace_back(optarg);      break;
            case 'q':  cfg.in.altFasta = optarg;                  break;
            case 'o':  cfg.out.outDir  = optarg;                  break;
            case 1001: cfg.in.pairsFile = optarg;                 break;
            case 1002: cfg.multichr.by_order = true;              break;
            case 1003: cfg.multichr.strict   = false;             break;
            case 1004: cfg.multichr.exclude.emplace_back(optarg); break;
            case 1005: cfg.in.alnFile  = optarg;                  break;
            case 1006: cfg.in.pafFile  = optarg;                  break;
            case 1007: cfg.transfer.aligner = optarg;             break;
            case 1008: cfg.out.noFasta = true;                    break;
            case 'h': help_multichr(argv); std::exit(0);
            default:  help_multichr(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);

    return cfg;
}
