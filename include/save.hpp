#ifndef SAVE_HPP
#define SAVE_HPP

#include <fstream>
#include <string>
#include <memory>
#include <zlib.h>

/**
 * @brief Buffered text writer: plain file, gzip (".gz" suffix) or stdout ("-" or empty name).
 *
 * Throws tblift::IoError when the file cannot be opened or written.
**/
class SAVE
{
private:
    std::string outputFileName_;

    bool is_gzip_{false};
    bool is_stdout_{false};
    bool closed_{false};

    // file handles
    std::ofstream fpO;
    std::unique_ptr<gzFile_s, int(*)(gzFile)> gzfpO_{nullptr, gzclose};

    // internal write buffer
    std::string buffer_;
    size_t cache_size_{1 << 20};

    SAVE(const SAVE&) = delete;
    SAVE& operator=(const SAVE&) = delete;

    /* flush internal buffer to file */
    void flush();
public:
    explicit SAVE(const std::string& outFileName, size_t cacheSize = 1 << 20);
    ~SAVE();

    void save(const std::string& outTxt);

    // flush and close; errors surface here instead of in the destructor
    void close();

    const std::string& name() const { return outputFileName_; }
};

#endif
