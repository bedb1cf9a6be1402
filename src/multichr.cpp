#include "../include/multichr.hpp"
#include "../include/ThreadPool.hpp"
#include "../include/coordmap.hpp"
#include "../include/kio.hpp"
#include "../include/logger.hpp"
#include "../include/progress_tracker.hpp"
#include "../include/save.hpp"
#include "../include/seq_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <future>
#include <set>

#include <sys/stat.h>
#include <sys/types.h>

namespace multichr {

const char* status_name(UnitStatus s) {
    switch (s) {
        case UnitStatus::Ok:        return "ok";
        case UnitStatus::Failed:    return "failed";
        case UnitStatus::Unmatched: return "unmatched";
        case UnitStatus::Excluded:  return "excluded";
        case UnitStatus::Cancelled: return "cancelled";
    }
    return "?";
}

size_t RunSummary::count(UnitStatus s) const {
    return (size_t)std::count_if(units.begin(), units.end(), [s](const ChromResult& u) { return u.status == s; });
}

size_t RunSummary::features_dropped() const {
    size_t n = 0;
    for (const auto& u : units) if (u.status == UnitStatus::Ok) n += u.result.n_dropped;
    return n;
}

size_t RunSummary::features_truncated() const {
    size_t n = 0;
    for (const auto& u : units) if (u.status == UnitStatus::Ok) n += u.result.n_truncated;
    return n;
}

/*------------------------------ pairs file ------------------------------*/
std::vector<std::pair<std::string, std::string>> load_pairs(const std::string& path) {
    kio::LineReader lr(path);
    std::vector<std::pair<std::string, std::string>> out;
    std::set<std::string> alts;
    std::string line;
    while (lr.getline(line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        const size_t t = line.find('\t');
        if (t == std::string::npos || t == 0 || t + 1 == line.size() || line.find('\t', t + 1) != std::string::npos) {
            throw tblift::ParseError(path, lr.line_no(), line, "expected two tab-separated columns: ref and target id");
        }
        std::string ref = line.substr(0, t);
        std::string alt = line.substr(t + 1);
        if (!alts.insert(alt).second) throw tblift::ParseError(path, lr.line_no(), line, "target id listed twice");
        out.emplace_back(std::move(ref), std::move(alt));
    }
    return out;
}

/*------------------------------ pairing ------------------------------*/
static bool excluded(const MultiOpts& opts, const std::string& table_id, const seqdb::Record* ref) {
    for (const auto& e : opts.exclude) {
        if (seqUtils::same_seqid(e, table_id)) return true;
        if (ref && seqUtils::same_seqid(e, ref->name)) return true;
    }
    return false;
}

static ChromResult skipped_unit(const std::string& ref_id, UnitStatus st, tblift::ErrorKind kind, std::string msg) {
    ChromResult r;
    r.ref_id = ref_id;
    r.status = st;
    r.error_kind = kind;
    r.error = std::move(msg);
    return r;
}

std::vector<Job> plan(const std::vector<ftable::FeatureTable>& tables,
                      const seqdb::SeqDB& ref, const seqdb::SeqDB& alt,
                      const MultiOpts& opts, std::vector<ChromResult>& skipped) {
    std::vector<Job> jobs;
    std::set<const seqdb::Record*> used_alt;

    auto unmatched = [&](const ftable::FeatureTable& t, const std::string& why) {
        if (opts.strict) throw tblift::UnmatchedChromosome(t.seqid);
        warning_stream() << "reference chromosome " << t.seqid << " has no target (" << why << "), skipped\n";
        skipped.push_back(skipped_unit(t.seqid, UnitStatus::Unmatched, tblift::ErrorKind::UnmatchedChromosome,
                                       tblift::UnmatchedChromosome(t.seqid).what()));
    };
    auto add_job = [&](const ftable::FeatureTable& t, const seqdb::Record* r, const seqdb::Record* a) {
        if (!used_alt.insert(a).second) {
            throw tblift::ParseError("", 0, a->name, "target sequence paired with more than one reference table");
        }
        jobs.push_back(Job{&t, r, a});
    };

    for (size_t i = 0; i < tables.size(); ++i) {
        const ftable::FeatureTable& t = tables[i];
        const seqdb::Record* r = ref.find_like(t.seqid);

        if (excluded(opts, t.seqid, r)) {
            log_stream() << "reference chromosome " << t.seqid << " excluded\n";
            skipped.push_back(skipped_unit(t.seqid, UnitStatus::Excluded, tblift::ErrorKind::Internal, "excluded"));
            continue;
        }
        if (!r) {
            const std::string msg = "feature table " + t.seqid + " names no sequence of the reference FASTA";
            if (opts.strict) throw tblift::ParseError("", 0, t.seqid, msg);
            warning_stream() << msg << ", skipped\n";
            skipped.push_back(skipped_unit(t.seqid, UnitStatus::Failed, tblift::ErrorKind::Parse, msg));
            continue;
        }

        switch (opts.pairing) {
            case Pairing::Equality: {
                const seqdb::Record* a = alt.find_like(r->name);
                if (!a) a = alt.find_like(t.seqid);
                if (a) add_job(t, r, a);
                else   unmatched(t, "no target with the same id");
                break;
            }
            case Pairing::ByOrder: {
                if (i < alt.size()) add_job(t, r, &alt.at(i));
                else unmatched(t, "fewer target sequences than reference tables");
                break;
            }
            case Pairing::Explicit: {
                bool listed = false, found = false;
                for (const auto& p : opts.pairs) {
                    if (!seqUtils::same_seqid(p.first, t.seqid) && !seqUtils::same_seqid(p.first, r->name)) continue;
                    listed = true;
                    if (const seqdb::Record* a = alt.find_like(p.second)) {
                        add_job(t, r, a);
                        found = true;
                    } else {
                        warning_stream() << "target " << p.second << " of " << t.seqid << " not in the target FASTA\n";
                    }
                }
                if (!found) unmatched(t, listed ? "listed target missing" : "not in the pairs file");
                break;
            }
        }
    }

    if (opts.pairing == Pairing::ByOrder && alt.size() > tables.size()) {
        warning_stream() << alt.size() - tables.size() << " target sequences have no reference table\n";
    }
    return jobs;
}

/*------------------------------ one unit ------------------------------*/
transfer::TransferResult transfer_one(const ftable::FeatureTable& table,
                                      const seqdb::Record& ref, const seqdb::Record& alt,
                                      const aln::Aligner& aligner,
                                      const transfer::TransferOpts& opts,
                                      const tblift::CancelToken& cancel) {
    debug_stream() << "aligning " << ref.name << " (" << ref.seq.size() << " bp) with " << alt.name
                   << " (" << alt.seq.size() << " bp) using " << aligner.name() << "\n";
    coordmap::CoordMapper cm;
    cm.add(aligner.align(ref, alt, cancel));
    return transfer::transfer_table(table, cm, ref.name, alt.name, opts);
}

transfer::TransferResult transfer_msa(const ftable::FeatureTable& table,
                                      const std::vector<aln::Alignment>& alns,
                                      const seqdb::Record& ref, const seqdb::Record& alt,
                                      const transfer::TransferOpts& opts,
                                      const std::string& source, int max_hops) {
    if (alns.empty() || !seqUtils::same_seqid(alns[0].a_name, ref.name))
        throw tblift::ParseError(source, 0, ref.name, "reference is not the hub row of the alignment");

    const std::string& rn = alns[0].a_name;
    std::string an;
    for (const auto& a : alns) {
        if (seqUtils::same_seqid(a.b_name, alt.name)) { an = a.b_name; break; }
    }
    if (an.empty()) throw tblift::ParseError(source, 0, alt.name, "sequence has no row in the alignment");

    coordmap::CoordMapper cm(max_hops);
    cm.add(alns.begin(), alns.end());
    if (cm.seq_length(rn) != ref.seq.size())
        throw tblift::ParseError(source, 0, rn, "aligned row length differs from the reference sequence");
    if (cm.seq_length(an) != alt.seq.size())
        throw tblift::ParseError(source, 0, an, "aligned row length differs from the target sequence");

    transfer::TransferResult res = transfer::transfer_table(table, cm, rn, an, opts);
    res.table.seqid = alt.name;
    for (auto& d : res.diags) d.seqid = alt.name;
    return res;
}

static void make_dir(const std::string& dir) {
    if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) throw tblift::IoError(dir, std::strerror(errno));
    struct stat st;
    if (::stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) throw tblift::IoError(dir, "not a directory");
}

static void write_unit(const transfer::TransferResult& res, const seqdb::Record& alt, const MultiOpts& opts) {
    if (opts.out_dir.empty()) return;
    const std::string stem = opts.out_dir + "/" + seqUtils::file_safe(alt.name);
    {
        SAVE tbl(stem + ".tbl");
        tbl.save(ftable::write_table(res.table, opts.write));
        tbl.close();
    }
    if (opts.write_fasta) {
        SAVE fa(stem + ".fasta");
        fa.save(seqdb::to_fasta(alt.name, alt.seq));
        fa.close();
    }
}

static ChromResult run_unit(const Job& job, const aln::Aligner& aligner, const MultiOpts& opts,
                            const transfer::TransferOpts& topts, const tblift::CancelToken& cancel) {
    ChromResult r;
    r.ref_id = job.table->seqid;
    r.alt_id = job.alt->name;
    if (cancel.cancelled()) {
        r.status = UnitStatus::Cancelled;
        r.error  = "cancelled before start";
        return r;
    }
    try {
        r.result = transfer_one(*job.table, *job.ref, *job.alt, aligner, topts, cancel);
        write_unit(r.result, *job.alt, opts);
        r.status = UnitStatus::Ok;
    } catch (const tblift::Error& e) {
        r.status = (e.kind() == tblift::ErrorKind::Aligner && cancel.cancelled()) ? UnitStatus::Cancelled : UnitStatus::Failed;
        r.error_kind = e.kind();
        r.error = e.what();
    } catch (const std::exception& e) {
        r.status = UnitStatus::Failed;
        r.error_kind = tblift::ErrorKind::Internal;
        r.error = e.what();
    }

    if (r.status == UnitStatus::Failed) {
        error_stream() << r.ref_id << " -> " << r.alt_id << ": " << tblift::kind_name(r.error_kind) << ": " << r.error << "\n";
    } else if (r.status == UnitStatus::Ok) {
        log_stream() << r.ref_id << " -> " << r.alt_id << ": " << r.result.n_out << "/" << r.result.n_in
                     << " features transferred\n";
    }
    return r;
}

/*------------------------------ driver ------------------------------*/
static void write_diags(const RunSummary& s, const MultiOpts& opts) {
    std::string path = opts.diag_path;
    if (path.empty() && !opts.out_dir.empty()) path = opts.out_dir + "/transfer.diag.tsv";
    if (path.empty()) return;

    SAVE out(path);
    out.save(transfer::diag_tsv_header());
    for (const auto& u : s.units) {
        if (u.status != UnitStatus::Ok) continue;
        for (const auto& d : u.result.diags) out.save(transfer::to_tsv(d));
    }
    out.close();
}

RunSummary run_jobs(const std::vector<Job>& jobs, std::vector<ChromResult> skipped,
                    const aln::Aligner& aligner, const MultiOpts& opts,
                    const tblift::CancelToken& cancel) {
    if (!opts.out_dir.empty()) make_dir(opts.out_dir);

    const size_t workers = std::max<size_t>(1, std::min(opts.threads, jobs.size()));
    transfer::TransferOpts topts = opts.transfer;
    if (workers > 1) topts.threads = 1;  // parallel over chromosomes, not features

    log_stream() << jobs.size() << " chromosome pairs, " << workers << " worker(s), aligner " << aligner.name() << "\n";

    RunSummary s;
    s.units.reserve(jobs.size() + skipped.size());
    {
        ProgressTracker tracker(jobs.size(), 10, "chromosomes");
        ThreadPool pool(workers);
        std::vector<std::future<ChromResult>> futs;
        futs.reserve(jobs.size());
        for (const Job& job : jobs) {
            futs.emplace_back(pool.submit([&, job] {
                ChromResult r = run_unit(job, aligner, opts, topts, cancel);
                tracker.hit();
                return r;
            }));
        }
        for (auto& f : futs) s.units.push_back(f.get());
        pool.stop();
        tracker.finish();
    }
    for (auto& u : skipped) s.units.push_back(std::move(u));

    write_diags(s, opts);
    return s;
}

RunSummary run(const std::vector<ftable::FeatureTable>& tables,
               const seqdb::SeqDB& ref, const seqdb::SeqDB& alt,
               const aln::Aligner& aligner, const MultiOpts& opts,
               const tblift::CancelToken& cancel) {
    std::vector<ChromResult> skipped;
    const std::vector<Job> jobs = plan(tables, ref, alt, opts, skipped);
    return run_jobs(jobs, std::move(skipped), aligner, opts, cancel);
}

RunSummary run_prealigned(const ftable::FeatureTable& table, const seqdb::SeqDB& msa,
                          const seqdb::Record* ref, const MultiOpts& opts,
                          const tblift::CancelToken& cancel) {
    const seqdb::Record* hub = msa.find_like(table.seqid);
    if (!hub) throw tblift::ParseError("", 0, table.seqid, "reference sequence of the feature table not found in the alignment");

    std::vector<aln::Alignment> alns = aln::project_msa(msa, hub->name, "alignment");

    // ungapped rows are the sequences every unit works on
    seqdb::SeqDB rows;
    rows.add(hub->name, seqUtils::ungap(hub->seq));
    for (const auto& a : alns) rows.add(a.b_name, seqUtils::ungap(a.b_row));

    const seqdb::Record& hub_rec = rows.at(0);
    if (ref && ref->seq != hub_rec.seq) {
        throw tblift::ParseError("", 0, ref->name, "reference sequence differs from its row in the alignment");
    }

    const aln::PrecomputedAligner pre(std::move(alns), "alignment");
    std::vector<Job> jobs;
    for (size_t i = 1; i < rows.size(); ++i) {
        if (excluded(opts, rows.at(i).name, nullptr)) continue;
        jobs.push_back(Job{&table, &hub_rec, &rows.at(i)});
    }
    return run_jobs(jobs, {}, pre, opts, cancel);
}

void log_summary(const RunSummary& s) {
    log_stream() << "chromosomes: " << s.count(UnitStatus::Ok) << " processed, "
                 << s.count(UnitStatus::Failed) << " failed, "
                 << s.count(UnitStatus::Unmatched) << " unmatched, "
                 << s.count(UnitStatus::Excluded) << " excluded, "
                 << s.count(UnitStatus::Cancelled) << " cancelled\n";
    log_stream() << "features: " << s.features_dropped() << " dropped, "
                 << s.features_truncated() << " truncated\n";
    for (const auto& u : s.units) {
        if (u.status == UnitStatus::Failed || u.status == UnitStatus::Cancelled)
            warning_stream() << "  " << u.ref_id << (u.alt_id.empty() ? "" : " -> " + u.alt_id) << ": "
                             << status_name(u.status) << " (" << u.error << ")\n";
    }
}

} // namespace multichr
