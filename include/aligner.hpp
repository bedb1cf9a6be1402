#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <utility>

#include "alignment.hpp"
#include "cancel.hpp"
#include "seqdb.hpp"

namespace aln {

/*------------------------------ Aligner --------------------------*/
/*
 * Produces the pairwise alignment of a reference chromosome (side a) and
 * its target (side b). Implementations are stateless between calls and
 * may be shared by several worker threads.
 */
class Aligner {
public:
    virtual ~Aligner() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const = 0;

    /**
     * @brief Align `ref` against `alt`.
     *
     * Throws tblift::AlignerError when the aligner fails or `cancel`
     * fires while it runs, tblift::NoAlignment when a precomputed source
     * has nothing for the pair.
     */
    virtual Alignment align(const seqdb::Record& ref, const seqdb::Record& alt,
                            const tblift::CancelToken& cancel) const = 0;
};

// In-process gap-affine end-to-end alignment with WFA2
class WfaAligner : public Aligner {
public:
    struct Penalties {
        int match      = 0;
        int mismatch   = 4;
        int gap_open   = 6;
        int gap_extend = 2;
    };

    WfaAligner() = default;
    explicit WfaAligner(const Penalties& p) : pen_(p) {}

    std::string name() const override { return "wfa"; }
    std::string version() const override { return "WFA2-lib"; }
    Alignment align(const seqdb::Record& ref, const seqdb::Record& alt,
                    const tblift::CancelToken& cancel) const override;

private:
    Penalties pen_;
};

// External `mafft` on a temporary two-record FASTA
class MafftAligner : public Aligner {
public:
    explicit MafftAligner(std::string exe = "mafft", std::string tmp_dir = "");

    std::string name() const override { return "mafft"; }
    std::string version() const override;   // first line of `mafft --version`, "unknown" if none
    Alignment align(const seqdb::Record& ref, const seqdb::Record& alt,
                    const tblift::CancelToken& cancel) const override;

private:
    std::string exe_;
    std::string tmp_dir_;
};

// Alignments loaded up front (aligned FASTA or PAF), looked up by name
class PrecomputedAligner : public Aligner {
public:
    PrecomputedAligner(std::vector<Alignment> alns, std::string source);

    std::string name() const override { return "precomputed"; }
    std::string version() const override { return source_; }
    Alignment align(const seqdb::Record& ref, const seqdb::Record& alt,
                    const tblift::CancelToken& cancel) const override;

    size_t size() const { return alns_.size(); }

private:
    std::vector<Alignment> alns_;
    std::map<std::pair<std::string, std::string>, size_t> idx_;
    std::string source_;
};

// "wfa" or "mafft"; tblift::AlignerError for anything else
std::unique_ptr<Aligner> make_aligner(std::string_view name);

} // namespace aln
