#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tblift {

enum class ErrorKind {
    Parse,                // malformed feature table / alignment / FASTA text
    OutOfRange,           // coordinate outside the sequence
    NoAlignment,          // no alignment joins the requested pair
    UnmatchedChromosome,  // reference chromosome without a target
    Aligner,              // external aligner failed or was cancelled
    Io,                   // file cannot be opened or written
    Internal              // anything else caught at a unit boundary
};

inline const char* kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Parse:               return "ParseError";
        case ErrorKind::OutOfRange:          return "OutOfRange";
        case ErrorKind::NoAlignment:         return "NoAlignment";
        case ErrorKind::UnmatchedChromosome: return "UnmatchedChromosome";
        case ErrorKind::Aligner:             return "AlignerError";
        case ErrorKind::Io:                  return "IOError";
        case ErrorKind::Internal:            return "InternalError";
    }
    return "Error";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ParseError : public Error {
public:
    // line == 0 means the error is not tied to one line
    ParseError(const std::string& source, uint64_t line, const std::string& content, const std::string& what)
        : Error(ErrorKind::Parse, format_(source, line, content, what)),
          source_(source), line_(line), content_(content) {}

    const std::string& source()  const noexcept { return source_; }
    uint64_t           line()    const noexcept { return line_; }
    const std::string& content() const noexcept { return content_; }

private:
    static std::string format_(const std::string& source, uint64_t line, const std::string& content, const std::string& what) {
        std::string s = source.empty() ? std::string("<input>") : source;
        if (line) s += ":" + std::to_string(line);
        s += ": " + what;
        if (!content.empty()) s += " [" + content + "]";
        return s;
    }

    std::string source_;
    uint64_t    line_;
    std::string content_;
};

class OutOfRange : public Error {
public:
    OutOfRange(const std::string& seq, uint64_t pos, uint64_t len)
        : Error(ErrorKind::OutOfRange,
                "position " + std::to_string(pos) + " is outside " + seq + " (length " + std::to_string(len) + ")") {}
};

class NoAlignment : public Error {
public:
    NoAlignment(const std::string& from, const std::string& to)
        : Error(ErrorKind::NoAlignment, "no alignment between " + from + " and " + to) {}
};

class UnmatchedChromosome : public Error {
public:
    explicit UnmatchedChromosome(const std::string& ref)
        : Error(ErrorKind::UnmatchedChromosome, "reference chromosome " + ref + " has no target chromosome"),
          ref_(ref) {}

    const std::string& ref() const noexcept { return ref_; }

private:
    std::string ref_;
};

class AlignerError : public Error {
public:
    explicit AlignerError(const std::string& msg) : Error(ErrorKind::Aligner, msg) {}
};

class IoError : public Error {
public:
    IoError(const std::string& path, const std::string& what)
        : Error(ErrorKind::Io, path + ": " + what) {}
};

} // namespace tblift
