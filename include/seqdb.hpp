#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>

namespace seqdb {

struct Record {
    std::string name;
    std::string comment;
    std::string seq;
};

// FASTA/FASTQ sequences (plain or gzip) in file order
class SeqDB {
public:
    struct SvHash {
        using is_transparent = void;
        size_t operator()(std::string_view s) const noexcept { return std::hash<std::string_view>{}(s); }
    };
    struct SvEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    /**
     * @brief Load every record of a FASTA/FASTQ file.
     *
     * Sequences are upper-cased; gap characters are kept so aligned FASTA
     * can be loaded too ('.' becomes '-').
     * Throws tblift::IoError when unreadable and tblift::ParseError on a
     * truncated record, a duplicated name or an illegal character.
     */
    void load(const std::string& path);

    void add(std::string name, std::string seq, std::string comment = "");

    size_t size() const { return recs_.size(); }
    bool   empty() const { return recs_.empty(); }
    const Record& at(size_t i) const { return recs_.at(i); }
    const std::vector<Record>& records() const { return recs_; }

    const Record* get(std::string_view name) const;

    // exact name first, then seqUtils::same_seqid(); nullptr if none or ambiguous
    const Record* find_like(std::string_view id) const;

private:
    std::vector<Record> recs_;
    std::unordered_map<std::string, size_t, SvHash, SvEq> idx_;
};

/**
 * @brief Write records as FASTA, wrapping lines at `width` (0 = no wrap).
 */
std::string to_fasta(const std::string& name, std::string_view seq, size_t width = 60);

} // namespace seqdb
