#include "../include/save.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <iostream>

/*------------------------------------------------------------*/
/*                       constructor                         */
/*------------------------------------------------------------*/
SAVE::SAVE(const std::string& outFileName, size_t cacheSize)
    : outputFileName_(outFileName), cache_size_(cacheSize) {
    is_stdout_ = outputFileName_.empty() || outputFileName_ == "-";
    is_gzip_ = !is_stdout_ &&
               (outputFileName_.size() > 3 &&
                (outputFileName_.compare(outputFileName_.size() - 3, 3, ".gz") == 0 ||
                 outputFileName_.compare(outputFileName_.size() - 3, 3, ".GZ") == 0));

    if (is_gzip_) {
        gzFile fp = gzopen(outputFileName_.c_str(), "wb");
        if (!fp) throw tblift::IoError(outputFileName_, "cannot open for writing");
        gzfpO_.reset(fp);
    } else if (!is_stdout_) {
        fpO.open(outputFileName_, std::ios::out);
        if (!fpO) throw tblift::IoError(outputFileName_, "cannot open for writing");
    }

    buffer_.reserve(cache_size_);
}

/*------------------------------------------------------------*/
/*                         destructor                         */
/*------------------------------------------------------------*/
SAVE::~SAVE() {
    if (closed_) return;
    try {
        close();
    } catch (const tblift::Error& e) {
        error_stream() << e.what() << "\n";
    }
}

/*------------------------------------------------------------*/
/*                          flush                             */
/*------------------------------------------------------------*/
void SAVE::flush() {
    if (buffer_.empty()) return;

    if (is_gzip_) {
        int n = gzwrite(gzfpO_.get(), buffer_.data(), static_cast<unsigned int>(buffer_.size()));
        if (n <= 0) throw tblift::IoError(outputFileName_, "write failed");
    } else if (!is_stdout_) {
        fpO.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        if (!fpO) throw tblift::IoError(outputFileName_, "write failed");
    } else {
        std::cout.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    }
    buffer_.clear();
}

/*------------------------------------------------------------*/
/*                           save                             */
/*------------------------------------------------------------*/
void SAVE::save(const std::string& outTxt) {
    if (outTxt.empty()) return;
    if (closed_) throw tblift::IoError(outputFileName_, "write after close");

    buffer_.append(outTxt);

    if (buffer_.size() >= cache_size_) flush();
}

void SAVE::close() {
    if (closed_) return;
    closed_ = true;
    flush();
    if (is_gzip_) {
        if (gzclose(gzfpO_.release()) != Z_OK) throw tblift::IoError(outputFileName_, "close failed");
    } else if (!is_stdout_) {
        fpO.close();
        if (!fpO) throw tblift::IoError(outputFileName_, "close failed");
    } else {
        std::cout.flush();
    }
}
