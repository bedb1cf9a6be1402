#pragma once
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace ftable {

// GenBank partial-boundary marker
enum class Fuzz : uint8_t { Exact, Less, Greater };  // "", "<", ">"

struct Position {
    uint32_t pos  = 0;  // 1-based
    Fuzz     fuzz = Fuzz::Exact;

    bool operator==(const Position& o) const { return pos == o.pos && fuzz == o.fuzz; }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

// One span of a feature, in the column order of the table: start is the 5'
// end, so a reverse-strand interval has start > end.
struct Interval {
    Position start, end;
    bool     reverse = false;

    uint32_t lo()  const { return start.pos < end.pos ? start.pos : end.pos; }
    uint32_t hi()  const { return start.pos < end.pos ? end.pos : start.pos; }
    uint32_t len() const { return hi() - lo() + 1; }

    bool operator==(const Interval& o) const { return start == o.start && end == o.end && reverse == o.reverse; }
    bool operator!=(const Interval& o) const { return !(*this == o); }
};

struct Qualifier {
    std::string key;
    std::string value;
    bool        has_value = false;  // "\t\t\tpseudo" has no value column

    bool operator==(const Qualifier& o) const { return key == o.key && value == o.value && has_value == o.has_value; }
};

struct Feature {
    std::string            type;
    std::vector<Interval>  intervals;  // join order
    std::vector<Qualifier> quals;      // file order, repeats allowed

    bool operator==(const Feature& o) const { return type == o.type && intervals == o.intervals && quals == o.quals; }

    const std::string* qualifier(std::string_view key) const;
    void add_qualifier(std::string key, std::string value);

    // first gene / locus_tag / product value, "." if none
    std::string label() const;
    // "2..7", "<1..>200", "30..21,12..3"
    std::string location() const;
};

struct FeatureTable {
    std::string          seqid;
    std::string          table_name;  // optional third header token
    std::vector<Feature> features;

    bool operator==(const FeatureTable& o) const {
        return seqid == o.seqid && table_name == o.table_name && features == o.features;
    }
};

std::string to_string(const Position& p);

/**
 * @brief Parse every table of a 5-column feature table file ("-" = stdin).
 *
 * Throws tblift::ParseError with the 1-based line number and the line text
 * for any malformed line; nothing is recovered.
 */
std::vector<FeatureTable> parse_tables_file(const std::string& path);
std::vector<FeatureTable> parse_tables_string(std::string_view text, const std::string& source = "<string>");

// Exactly one table expected (tblift::ParseError otherwise)
FeatureTable parse_table_file(const std::string& path);
FeatureTable parse_table_string(std::string_view text, const std::string& source = "<string>");

struct WriteOpts {
    std::vector<std::regex> exclude_quals;  // qualifier keys matching any are skipped
    bool trailing_blank = false;            // extra empty line after the table
};

std::string write_table(const FeatureTable& t, const WriteOpts& opts = {});

} // namespace ftable
