/*------------------------------------------------------------------*
 * Aligner implementations: WFA2, external MAFFT, precomputed
 *------------------------------------------------------------------*/
#include "../include/aligner.hpp"
#include "../include/CIGAR.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/save.hpp"
#include "../include/seq_utils.hpp"

#include "bindings/cpp/WFAligner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace aln {

/*====================== 1. WFA2 ============================*/
Alignment WfaAligner::align(const seqdb::Record& ref, const seqdb::Record& alt,
                            const tblift::CancelToken& cancel) const {
    if (cancel.cancelled()) throw tblift::AlignerError("wfa: cancelled before aligning " + alt.name);
    if (ref.seq.empty() || alt.seq.empty()) {
        throw tblift::AlignerError("wfa: empty sequence (" + ref.name + " vs " + alt.name + ")");
    }

    wfa::WFAlignerGapAffine aligner(
        /*match*/      pen_.match,
        /*mismatch*/   pen_.mismatch,
        /*gap_open*/   pen_.gap_open,
        /*gap_extend*/ pen_.gap_extend,
        wfa::WFAligner::Alignment,
        wfa::WFAligner::MemoryHigh
    );
    // pattern = reference: D consumes the reference, I the target
    const wfa::WFAligner::AlignmentStatus st = aligner.alignEnd2End(
        ref.seq.data(), (int)ref.seq.size(), alt.seq.data(), (int)alt.seq.size());
    if (st != wfa::WFAligner::StatusAlgCompleted) {
        throw tblift::AlignerError("wfa: alignment of " + ref.name + " vs " + alt.name +
                                   " did not complete (status " + std::to_string((int)st) + ")");
    }
    if (cancel.cancelled()) throw tblift::AlignerError("wfa: cancelled while aligning " + alt.name);

    debug_stream() << ref.name << " vs " << alt.name << " score " << aligner.getAlignmentScore() << "\n";
    const std::vector<CIGAR::COp> ops = CIGAR::parse(aligner.getCIGAR(true));
    return from_cigar(ref.name, ref.seq, alt.name, alt.seq, ops, "wfa");
}

/*====================== 2. MAFFT ============================*/
namespace {

// Temporary file removed when the guard goes out of scope
class TempFile {
public:
    TempFile(const std::string& dir, const char* stem) {
        path_ = (dir.empty() ? std::string("/tmp") : dir) + "/" + stem + ".XXXXXX";
        fd_ = ::mkstemp(path_.data());
        if (fd_ < 0) throw tblift::IoError(path_, std::strerror(errno));
    }
    ~TempFile() {
        if (fd_ >= 0) ::close(fd_);
        ::unlink(path_.c_str());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }
    int fd() const { return fd_; }

private:
    std::string path_;
    int fd_ = -1;
};

std::string default_tmp_dir() {
    const char* t = std::getenv("TMPDIR");
    return (t && *t) ? std::string(t) : std::string("/tmp");
}

// SIGTERM, a short grace period, then SIGKILL; always reaps the child
void terminate_child(pid_t pid) {
    ::kill(pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        if (::waitpid(pid, nullptr, WNOHANG) == pid) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
}

} // namespace

MafftAligner::MafftAligner(std::string exe, std::string tmp_dir)
    : exe_(std::move(exe)), tmp_dir_(tmp_dir.empty() ? default_tmp_dir() : std::move(tmp_dir)) {}

std::string MafftAligner::version() const {
    const std::string cmd = exe_ + " --version 2>&1";
    FILE* p = ::popen(cmd.c_str(), "r");
    if (!p) return "unknown";
    char buf[256];
    std::string line;
    if (std::fgets(buf, sizeof(buf), p)) line = buf;
    ::pclose(p);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    return line.empty() ? "unknown" : line;
}

Alignment MafftAligner::align(const seqdb::Record& ref, const seqdb::Record& alt,
                              const tblift::CancelToken& cancel) const {
    if (cancel.cancelled()) throw tblift::AlignerError("mafft: cancelled before aligning " + alt.name);

    // short fixed names; mafft rewrites headers it does not like
    TempFile in(tmp_dir_, "tblift_in");
    TempFile out(tmp_dir_, "tblift_out");
    {
        SAVE saver(in.path());
        saver.save(seqdb::to_fasta("ref", ref.seq));
        saver.save(seqdb::to_fasta("alt", alt.seq));
        saver.close();
    }

    const pid_t pid = ::fork();
    if (pid < 0) throw tblift::AlignerError(std::string("mafft: fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        ::dup2(out.fd(), STDOUT_FILENO);
        const int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
        ::execlp(exe_.c_str(), exe_.c_str(), "--auto", "--quiet", in.path().c_str(), (char*)nullptr);
        ::_exit(127);
    }

    int status = 0;
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            throw tblift::AlignerError(std::string("mafft: waitpid failed: ") + std::strerror(errno));
        }
        if (cancel.cancelled()) {
            terminate_child(pid);
            throw tblift::AlignerError("mafft: cancelled while aligning " + alt.name);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (WIFSIGNALED(status)) {
        throw tblift::AlignerError("mafft: killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw tblift::AlignerError(code == 127 ? "mafft: cannot execute '" + exe_ + "'"
                                               : "mafft: exited with status " + std::to_string(code));
    }

    seqdb::SeqDB msa;
    try {
        msa.load(out.path());
    } catch (const tblift::Error& e) {
        throw tblift::AlignerError(std::string("mafft: unreadable output: ") + e.what());
    }
    if (msa.size() != 2 || !msa.get("ref") || !msa.get("alt")) {
        throw tblift::AlignerError("mafft: expected two aligned records, got " + std::to_string(msa.size()));
    }

    std::vector<Alignment> v = project_msa(msa, "ref", "mafft");
    Alignment a = std::move(v.front());
    a.a_name = ref.name;
    a.b_name = alt.name;
    return a;
}

/*====================== 3. Precomputed ============================*/
PrecomputedAligner::PrecomputedAligner(std::vector<Alignment> alns, std::string source)
    : alns_(std::move(alns)), source_(std::move(source)) {
    for (size_t i = 0; i < alns_.size(); ++i) {
        idx_.emplace(std::make_pair(alns_[i].a_name, alns_[i].b_name), i);
    }
}

static void check_row(const std::string& row, const seqdb::Record& rec, const std::string& source) {
    const std::string s = seqUtils::ungap(row);
    if (s.size() != rec.seq.size()) {
        throw tblift::ParseError(source, 0, rec.name,
            "aligned row has " + std::to_string(s.size()) + " bases, sequence has " + std::to_string(rec.seq.size()));
    }
    if (s != rec.seq) throw tblift::ParseError(source, 0, rec.name, "aligned row differs from the sequence");
}

Alignment PrecomputedAligner::align(const seqdb::Record& ref, const seqdb::Record& alt,
                                    const tblift::CancelToken& cancel) const {
    if (cancel.cancelled()) throw tblift::AlignerError("cancelled before looking up " + alt.name);

    const Alignment* hit = nullptr;
    bool swapped = false;
    auto it = idx_.find(std::make_pair(ref.name, alt.name));
    if (it != idx_.end()) hit = &alns_[it->second];
    if (!hit) {
        for (const auto& a : alns_) {
            if (seqUtils::same_seqid(a.a_name, ref.name) && seqUtils::same_seqid(a.b_name, alt.name)) { hit = &a; break; }
            if (seqUtils::same_seqid(a.b_name, ref.name) && seqUtils::same_seqid(a.a_name, alt.name)) { hit = &a; swapped = true; break; }
        }
    }
    if (!hit) throw tblift::NoAlignment(ref.name, alt.name + " in " + source_);

    Alignment a = swapped ? Alignment{ref.name, alt.name, hit->b_row, hit->a_row}
                          : Alignment{ref.name, alt.name, hit->a_row, hit->b_row};
    check_row(a.a_row, ref, source_);
    check_row(a.b_row, alt, source_);
    return a;
}

/*====================== 4. factory ============================*/
std::unique_ptr<Aligner> make_aligner(std::string_view name) {
    if (name == "wfa")   return std::make_unique<WfaAligner>();
    if (name == "mafft") return std::make_unique<MafftAligner>();
    throw tblift::AlignerError("unknown aligner '" + std::string(name) + "' (expected wfa or mafft)");
}

} // namespace aln
