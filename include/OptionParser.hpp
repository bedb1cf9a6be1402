#pragma once

#include <string>
#include <vector>
#include <cstdint>

/* ===================== I/O option ===================== */
struct IOInOpts {
    std::string refFasta;               // reference sequences (FASTA, gz)
    std::vector<std::string> tblFiles;  // reference feature tables
    std::string altFasta;               // target sequences (FASTA, gz)
    std::string alnFile;                // precomputed aligned FASTA (pairwise or multiple)
    std::string pafFile;                // precomputed PAF with cg:Z
    std::string msaFile;                // multiple alignment for prealigned
    std::string pairsFile;              // ref<TAB>alt chromosome pairs
};

struct IOOutOpts {
    std::string outFile = "-";          // transfer: output table [stdout]
    std::string outDir  = "";           // prealigned / multichr: output directory
    std::string diagFile = "";          // diagnostics TSV
    bool        noFasta = false;        // do not write <alt>.fasta next to each table
};

/* ===================== Global ===================== */
struct GlobalOpts {
    int  threads  = 1;
    std::string loglevel = "info";
    bool debug    = false;
};

/* ===================== Transfer options ===================== */
struct TransferCliOpts {
    bool oob_drop          = false;  // drop intervals hanging over target ends instead of clipping
    bool ignore_ambig_edge = false;  // treat '<'/'>' of the reference as exact
    std::string gap_pair   = "drop"; // drop | point
    bool cds_frame_clip    = false;  // keep a 5'-clipped CDS in frame
    bool no_cds_note       = false;  // no note on truncated CDS
    std::vector<std::string> exclude_quals;  // qualifier key regexes left out of the output
    bool keep_protein_id   = false;  // protein_id is left out unless set
    std::string aligner    = "wfa";  // wfa | mafft when no alignment is given
    int  max_hops          = 3;      // alignments chained through a hub sequence
};

/* ===================== Multi-chromosome options ===================== */
struct MultiChrOpts {
    bool by_order = false;               // pair i-th table with i-th target
    bool strict   = true;                // unmatched reference chromosome is fatal
    std::vector<std::string> exclude;    // reference ids to skip
};

/* ===================== Tool mode ===================== */
enum class ToolMode {
    transfer,    // one reference chromosome onto one target
    prealigned,  // one reference table onto every row of a multiple alignment
    multichr     // many chromosomes, paired by id, pairs file or order
};

/* ===================== Whole configuration ===================== */
struct AppConfig {
    ToolMode        mode = ToolMode::transfer;
    IOInOpts        in;
    IOOutOpts       out;
    GlobalOpts      global;
    TransferCliOpts transfer;
    MultiChrOpts    multichr;
};

void help(char** argv);

// one reference chromosome onto one target
AppConfig main_transfer(int argc, char** argv);
void help_transfer(char** argv);

// one reference table onto every row of a multiple alignment
AppConfig main_prealigned(int argc, char** argv);
void help_prealigned(char** argv);

// many chromosomes in one run
AppConfig main_multichr(int argc, char** argv);
void help_multichr(char** argv);
