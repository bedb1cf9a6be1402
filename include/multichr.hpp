#pragma once
#include <string>
#include <utility>
#include <vector>

#include "aligner.hpp"
#include "cancel.hpp"
#include "errors.hpp"
#include "feature_table.hpp"
#include "seqdb.hpp"
#include "transfer.hpp"

namespace multichr {

// How reference chromosomes find their targets
enum class Pairing {
    Equality,  // same id after accession normalization
    Explicit,  // listed in a two-column pairs file
    ByOrder    // i-th reference table with the i-th target sequence
};

struct MultiOpts {
    Pairing pairing = Pairing::Equality;
    std::vector<std::pair<std::string, std::string>> pairs;  // ref -> alt, Explicit only
    bool strict = true;                     // an unmatched reference aborts the run
    std::vector<std::string> exclude;       // reference ids skipped silently
    size_t threads = 1;                     // chromosome units in parallel

    transfer::TransferOpts transfer;
    ftable::WriteOpts      write;
    std::string out_dir;                    // <out_dir>/<alt>.tbl and .fasta; empty: nothing written
    bool        write_fasta = true;
    std::string diag_path;                  // default <out_dir>/transfer.diag.tsv
};

enum class UnitStatus { Ok, Failed, Unmatched, Excluded, Cancelled };

const char* status_name(UnitStatus s);

struct ChromResult {
    std::string ref_id;
    std::string alt_id;                     // empty when unmatched
    UnitStatus  status = UnitStatus::Ok;
    tblift::ErrorKind error_kind = tblift::ErrorKind::Internal;
    std::string error;                      // message when not Ok
    transfer::TransferResult result;        // meaningful when Ok
};

struct RunSummary {
    std::vector<ChromResult> units;         // jobs in planned order, then skipped tables

    size_t count(UnitStatus s) const;
    size_t features_dropped() const;
    size_t features_truncated() const;
    bool   any_success() const { return count(UnitStatus::Ok) != 0; }
};

// One chromosome unit before it runs
struct Job {
    const ftable::FeatureTable* table;
    const seqdb::Record*        ref;
    const seqdb::Record*        alt;
};

/**
 * @brief Read a `ref<TAB>alt` pairs file ('#' comments and blank lines skipped).
 *
 * Throws tblift::ParseError on a line without exactly two columns or an
 * alt id listed twice.
 */
std::vector<std::pair<std::string, std::string>> load_pairs(const std::string& path);

/**
 * @brief Pair every reference table with its target sequence.
 *
 * Tables are bound to reference sequences with SeqDB::find_like(). A
 * table without a target (and not excluded) throws
 * tblift::UnmatchedChromosome in strict mode; otherwise it is logged and
 * recorded in `skipped` with status Unmatched, like excluded tables are
 * with status Excluded.
 */
std::vector<Job> plan(const std::vector<ftable::FeatureTable>& tables,
                      const seqdb::SeqDB& ref, const seqdb::SeqDB& alt,
                      const MultiOpts& opts, std::vector<ChromResult>& skipped);

// Align, map and transfer one chromosome; errors propagate
transfer::TransferResult transfer_one(const ftable::FeatureTable& table,
                                      const seqdb::Record& ref, const seqdb::Record& alt,
                                      const aln::Aligner& aligner,
                                      const transfer::TransferOpts& opts,
                                      const tblift::CancelToken& cancel);

/**
 * @brief Transfer one table through alignments projected on the reference
 * row of a multiple alignment (aln::load_msa with `ref` as hub).
 *
 * The output table and its diagnostics are named after `alt`. Throws
 * tblift::ParseError when the hub is not `ref`, when `alt` has no row, or
 * when a row's ungapped length differs from its sequence.
 */
transfer::TransferResult transfer_msa(const ftable::FeatureTable& table,
                                      const std::vector<aln::Alignment>& alns,
                                      const seqdb::Record& ref, const seqdb::Record& alt,
                                      const transfer::TransferOpts& opts,
                                      const std::string& source, int max_hops = 3);

/**
 * @brief Run the jobs on a worker pool and write their outputs.
 *
 * Errors of one unit are caught and recorded in its ChromResult; the
 * other units proceed. Units not started when `cancel` fires are
 * recorded as Cancelled. `skipped` entries are carried into the summary.
 */
RunSummary run_jobs(const std::vector<Job>& jobs, std::vector<ChromResult> skipped,
                    const aln::Aligner& aligner, const MultiOpts& opts,
                    const tblift::CancelToken& cancel);

// plan() followed by run_jobs()
RunSummary run(const std::vector<ftable::FeatureTable>& tables,
               const seqdb::SeqDB& ref, const seqdb::SeqDB& alt,
               const aln::Aligner& aligner, const MultiOpts& opts,
               const tblift::CancelToken& cancel);

/**
 * @brief Transfer one reference table onto every other row of a multiple
 * alignment.
 *
 * The row matching the table's seqid is the hub. When `ref` is given its
 * sequence must equal the ungapped hub row (tblift::ParseError otherwise).
 */
RunSummary run_prealigned(const ftable::FeatureTable& table, const seqdb::SeqDB& msa,
                          const seqdb::Record* ref, const MultiOpts& opts,
                          const tblift::CancelToken& cancel);

// Log the end-of-run counts
void log_summary(const RunSummary& s);

} // namespace multichr
