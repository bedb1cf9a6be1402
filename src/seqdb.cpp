#include "../include/seqdb.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/seq_utils.hpp"

#include <utility>
#include <zlib.h>
#include <htslib/kseq.h>

KSEQ_INIT(gzFile, gzread)

namespace seqdb {

void SeqDB::load(const std::string& path) {
    gzFile fp = path == "-" ? gzdopen(0, "rb") : gzopen(path.c_str(), "rb");
    if (!fp) throw tblift::IoError(path, "No such file or directory");

    kseq_t* ks = kseq_init(fp);
    if (!ks) {
        gzclose(fp);
        throw tblift::IoError(path, "kseq_init failed");
    }

    int ret = 0;
    size_t n0 = recs_.size();
    while ((ret = kseq_read(ks)) >= 0) {
        std::string name(ks->name.s ? ks->name.s : "", ks->name.l);
        std::string seq(ks->seq.s ? ks->seq.s : "", (size_t)ks->seq.l);
        std::string comment(ks->comment.s ? ks->comment.s : "", ks->comment.l);
        if (name.empty()) {
            kseq_destroy(ks); gzclose(fp);
            throw tblift::ParseError(path, 0, "", "record without a name");
        }
        size_t bad = seqUtils::normalize_row(seq);
        if (bad != std::string::npos) {
            kseq_destroy(ks); gzclose(fp);
            throw tblift::ParseError(path, 0, name, std::string("illegal character '") + seq[bad] + "' in sequence");
        }
        if (idx_.count(name)) {
            kseq_destroy(ks); gzclose(fp);
            throw tblift::ParseError(path, 0, name, "duplicated sequence name");
        }
        add(std::move(name), std::move(seq), std::move(comment));
    }
    kseq_destroy(ks);
    gzclose(fp);

    // -1 is a clean EOF; -2 truncated quality, -3 stream error
    if (ret == -3) throw tblift::IoError(path, "read error (corrupt or truncated gzip stream)");
    if (ret < -1) throw tblift::ParseError(path, 0, "", "truncated FASTA/FASTQ record");
    debug_stream() << path << ": loaded " << (recs_.size() - n0) << " sequences\n";
}

void SeqDB::add(std::string name, std::string seq, std::string comment) {
    idx_.emplace(name, recs_.size());
    recs_.push_back(Record{std::move(name), std::move(comment), std::move(seq)});
}

const Record* SeqDB::get(std::string_view name) const {
    auto it = idx_.find(name);
    return (it == idx_.end()) ? nullptr : &recs_[it->second];
}

const Record* SeqDB::find_like(std::string_view id) const {
    if (const Record* r = get(id)) return r;
    const Record* hit = nullptr;
    for (const auto& r : recs_) {
        if (!seqUtils::same_seqid(r.name, id)) continue;
        if (hit) return nullptr;
        hit = &r;
    }
    return hit;
}

std::string to_fasta(const std::string& name, std::string_view seq, size_t width) {
    std::string out;
    out.reserve(seq.size() + seq.size() / (width ? width : seq.size() + 1) + name.size() + 4);
    out += '>';
    out += name;
    out += '\n';
    if (width == 0) {
        out.append(seq);
        out += '\n';
        return out;
    }
    for (size_t i = 0; i < seq.size(); i += width) {
        out.append(seq.substr(i, width));
        out += '\n';
    }
    return out;
}

} // namespace seqdb
