#pragma once
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>

#include <zlib.h>

#include "errors.hpp"

namespace kio {

// Plain or gzip file; "-" reads stdin (gzip or plain, zlib detects it).
class File {
public:
    File() = default;
    ~File() { close(); }

    File(const File&) = delete;
    File& operator=(const File&) = delete;

    bool open(const std::string& path) {
        close();
        path_ = path;
        if (path == "-") {
            is_gz_ = true;
            gz_ = gzdopen(dup(STDIN_FILENO), "rb");
            return gz_ != nullptr;
        }
        is_gz_ = endswith_(path, ".gz") || endswith_(path, ".GZ");
        if (is_gz_) {
            gz_ = gzopen(path.c_str(), "rb");
            return gz_ != nullptr;
        } else {
            fp_ = std::fopen(path.c_str(), "rb");
            return fp_ != nullptr;
        }
    }

    void close() {
        if (gz_) { gzclose(gz_); gz_ = nullptr; }
        if (fp_) { std::fclose(fp_); fp_ = nullptr; }
        eof_ = false;
    }

    bool good() const { return (gz_ || fp_); }
    bool eof()  const { return eof_; }

    // Return number of bytes read; 0 => EOF. Throws tblift::IoError on a stream error.
    int read(void* dst, int n) {
        if (!good() || n <= 0) return 0;
        int ret = 0;
        if (is_gz_) {
            ret = gzread(gz_, dst, (unsigned)n);
        } else {
            ret = (int)std::fread(dst, 1, (size_t)n, fp_);
        }
        if (ret < 0 || (!is_gz_ && ret == 0 && std::ferror(fp_))) {
            throw tblift::IoError(path_, "read error (corrupt or truncated gzip stream)");
        }
        if (ret == 0) eof_ = true;
        return ret;
    }

private:
    static bool endswith_(const std::string& s, const char* suf) {
        const size_t n = std::strlen(suf);
        return s.size() >= n && s.compare(s.size() - n, n, suf) == 0;
    }

    std::string path_;
    bool  is_gz_ = false;
    bool  eof_   = false;
    gzFile gz_   = nullptr;
    FILE*  fp_   = nullptr;
};

// Buffered line reader (supports very long lines), counts lines for error reports
class LineReader {
public:
    explicit LineReader(const std::string& path, int bufsize = 1 << 16)
        : path_(path), buf_((size_t)bufsize)
    {
        if (!f_.open(path)) {
            throw tblift::IoError(path, "No such file or directory");
        }
    }

    bool good() const { return f_.good(); }
    const std::string& path() const { return path_; }

    // 1-based number of the line last returned by getline()
    uint64_t line_no() const { return line_no_; }

    // Read next line without its '\n' (and trailing '\r'); return false at EOF
    bool getline(std::string& out) {
        out.clear();
        bool got = false;
        for (;;) {
            if (beg_ >= end_) {
                if (f_.eof()) break;
                refill_();
                if (end_ == 0) break;
            }

            const char* base = buf_.data();
            const char* p = (const char*)std::memchr(base + beg_, '\n', (size_t)(end_ - beg_));
            got = true;
            if (p) {
                const int i = (int)(p - base);
                out.append(base + beg_, (size_t)(i - beg_));
                beg_ = i + 1;
                break;
            }
            out.append(base + beg_, (size_t)(end_ - beg_));
            beg_ = end_;
        }
        if (!got) return false;
        if (!out.empty() && out.back() == '\r') out.pop_back();
        ++line_no_;
        return true;
    }

private:
    void refill_() {
        beg_ = 0;
        end_ = f_.read(buf_.data(), (int)buf_.size());
    }

    std::string path_;
    File f_;
    std::vector<char> buf_;
    int beg_ = 0;
    int end_ = 0;
    uint64_t line_no_ = 0;
};

} // namespace kio
