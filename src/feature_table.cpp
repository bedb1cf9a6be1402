#include "../include/feature_table.hpp"
#include "../include/errors.hpp"
#include "../include/kio.hpp"

#include <cctype>
#include <utility>

namespace ftable {

// ====== model helpers ======
const std::string* Feature::qualifier(std::string_view key) const {
    for (const auto& q : quals)
        if (q.key == key) return &q.value;
    return nullptr;
}

void Feature::add_qualifier(std::string key, std::string value) {
    quals.push_back(Qualifier{std::move(key), std::move(value), true});
}

std::string Feature::label() const {
    for (const char* k : {"gene", "locus_tag", "product"}) {
        const std::string* v = qualifier(k);
        if (v && !v->empty()) return *v;
    }
    return ".";
}

std::string to_string(const Position& p) {
    std::string s;
    if (p.fuzz == Fuzz::Less)    s += '<';
    if (p.fuzz == Fuzz::Greater) s += '>';
    s += std::to_string(p.pos);
    return s;
}

std::string Feature::location() const {
    std::string s;
    for (size_t i = 0; i < intervals.size(); ++i) {
        if (i) s += ',';
        s += to_string(intervals[i].start);
        if (intervals[i].start != intervals[i].end) {
            s += "..";
            s += to_string(intervals[i].end);
        }
    }
    return s;
}

// ====== parser ======
namespace {

void rtrim(std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.pop_back();
}

std::vector<std::string_view> split_tabs(std::string_view s) {
    std::vector<std::string_view> out;
    size_t i = 0;
    for (;;) {
        size_t j = s.find('\t', i);
        if (j == std::string_view::npos) { out.push_back(s.substr(i)); break; }
        out.push_back(s.substr(i, j - i));
        i = j + 1;
    }
    return out;
}

class TableParser {
public:
    explicit TableParser(std::string source) : source_(std::move(source)) {}

    void feed(std::string line, uint64_t ln) {
        rtrim(line);
        ln_ = ln;
        line_ = &line;
        if (line.empty()) return;

        if (line[0] == '>') header_(line);
        else if (line[0] == '\t') qualifier_(line);
        else interval_(line);
    }

    std::vector<FeatureTable> finish() {
        if (tables_.empty()) throw tblift::ParseError(source_, 0, "", "no '>Feature' table found");
        return std::move(tables_);
    }

private:
    [[noreturn]] void fail_(const std::string& what) const {
        throw tblift::ParseError(source_, ln_, *line_, what);
    }

    void header_(const std::string& line) {
        std::vector<std::string> tok;
        size_t i = 1;
        while (i < line.size()) {
            while (i < line.size() && std::isspace((unsigned char)line[i])) ++i;
            size_t j = i;
            while (j < line.size() && !std::isspace((unsigned char)line[j])) ++j;
            if (j > i) tok.push_back(line.substr(i, j - i));
            i = j;
        }
        if (tok.empty() || tok[0] != "Feature") fail_("header must start with '>Feature'");
        if (tok.size() < 2) fail_("header has no sequence id");
        if (tok.size() > 3) fail_("header has more than a sequence id and a table name");

        FeatureTable t;
        t.seqid = tok[1];
        if (tok.size() == 3) t.table_name = tok[2];
        tables_.push_back(std::move(t));
    }

    Position position_(std::string_view s) const {
        Position p;
        if (!s.empty() && s[0] == '<') { p.fuzz = Fuzz::Less;    s.remove_prefix(1); }
        else if (!s.empty() && s[0] == '>') { p.fuzz = Fuzz::Greater; s.remove_prefix(1); }
        if (s.empty()) fail_("missing coordinate");
        if (s.find('^') != std::string_view::npos) fail_("between-base positions ('^') are not supported");
        uint64_t v = 0;
        for (char c : s) {
            if (c < '0' || c > '9') fail_("non-numeric coordinate");
            v = v * 10 + uint64_t(c - '0');
            if (v > UINT32_MAX) fail_("coordinate too large");
        }
        if (v == 0) fail_("coordinates are 1-based");
        p.pos = (uint32_t)v;
        return p;
    }

    void interval_(const std::string& line) {
        if (tables_.empty()) fail_("feature line before any '>Feature' header");
        auto f = split_tabs(line);
        if (f.size() < 2) fail_("interval line needs start and stop columns");
        if (f.size() > 3) fail_("interval line has more than three columns");

        Interval iv;
        iv.start = position_(f[0]);
        iv.end   = position_(f[1]);
        iv.reverse = iv.start.pos > iv.end.pos;

        auto& feats = tables_.back().features;
        if (f.size() == 3 && !f[2].empty()) {
            Feature ft;
            ft.type = std::string(f[2]);
            ft.intervals.push_back(iv);
            feats.push_back(std::move(ft));
            single_base_pending_ = iv.start.pos == iv.end.pos;
            return;
        }
        if (f.size() == 3) fail_("empty feature key");
        if (feats.empty()) fail_("continuation interval without a feature");
        if (!feats.back().quals.empty()) fail_("interval after qualifiers");

        Feature& ft = feats.back();
        if (iv.start.pos == iv.end.pos) {
            iv.reverse = ft.intervals.back().reverse;
        } else if (single_base_pending_) {
            // earlier one-base intervals take the orientation of the first real span
            for (auto& prev : ft.intervals) prev.reverse = iv.reverse;
            single_base_pending_ = false;
        }
        ft.intervals.push_back(iv);
    }

    void qualifier_(const std::string& line) {
        if (tables_.empty() || tables_.back().features.empty()) fail_("qualifier before any feature");
        size_t tabs = 0;
        while (tabs < line.size() && line[tabs] == '\t') ++tabs;
        if (tabs != 3) fail_("qualifier lines start with exactly three tabs");

        std::string_view rest(line);
        rest.remove_prefix(3);
        size_t t = rest.find('\t');
        Qualifier q;
        q.key = std::string(rest.substr(0, t));
        if (q.key.empty()) fail_("empty qualifier key");
        if (t != std::string_view::npos) {
            q.value = std::string(rest.substr(t + 1));
            q.has_value = true;
        }
        tables_.back().features.back().quals.push_back(std::move(q));
    }

    std::string source_;
    std::vector<FeatureTable> tables_;
    uint64_t ln_ = 0;
    const std::string* line_ = nullptr;
    bool single_base_pending_ = false;
};

} // namespace

std::vector<FeatureTable> parse_tables_file(const std::string& path) {
    kio::LineReader lr(path);
    TableParser p(path);
    std::string line;
    while (lr.getline(line)) p.feed(line, lr.line_no());
    return p.finish();
}

std::vector<FeatureTable> parse_tables_string(std::string_view text, const std::string& source) {
    TableParser p(source);
    uint64_t ln = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t j = text.find('\n', i);
        if (j == std::string_view::npos) j = text.size();
        p.feed(std::string(text.substr(i, j - i)), ++ln);
        i = j + 1;
    }
    return p.finish();
}

static FeatureTable only_one(std::vector<FeatureTable> v, const std::string& source) {
    if (v.size() != 1) {
        throw tblift::ParseError(source, 0, "", "expected one feature table, found " + std::to_string(v.size()));
    }
    return std::move(v[0]);
}

FeatureTable parse_table_file(const std::string& path) {
    return only_one(parse_tables_file(path), path);
}

FeatureTable parse_table_string(std::string_view text, const std::string& source) {
    return only_one(parse_tables_string(text, source), source);
}

// ====== writer ======
static bool excluded(const std::string& key, const std::vector<std::regex>& ex) {
    for (const auto& re : ex)
        if (std::regex_search(key, re)) return true;
    return false;
}

std::string write_table(const FeatureTable& t, const WriteOpts& opts) {
    std::string out;
    out.reserve(64 + t.features.size() * 64);
    out += ">Feature ";
    out += t.seqid;
    if (!t.table_name.empty()) {
        out += ' ';
        out += t.table_name;
    }
    out += '\n';

    for (const auto& f : t.features) {
        for (size_t i = 0; i < f.intervals.size(); ++i) {
            out += to_string(f.intervals[i].start);
            out += '\t';
            out += to_string(f.intervals[i].end);
            if (i == 0) {
                out += '\t';
                out += f.type;
            }
            out += '\n';
        }
        for (const auto& q : f.quals) {
            if (excluded(q.key, opts.exclude_quals)) continue;
            out += "\t\t\t";
            out += q.key;
            if (q.has_value) {
                out += '\t';
                out += q.value;
            }
            out += '\n';
        }
    }
    if (opts.trailing_blank) out += '\n';
    return out;
}

} // namespace ftable
