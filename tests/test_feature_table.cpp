#include "gtest/gtest.h"

#include "errors.hpp"
#include "feature_table.hpp"
#include "test_utils.hpp"

using namespace ftable;

static const char* kTwoFeatures =
    ">Feature gb|KJ660346.2|\n"
    "<1\t>200\tgene\n"
    "\t\t\tgene\tNP\n"
    "30\t21\tCDS\n"
    "12\t3\n"
    "\t\t\tproduct\tnucleoprotein\n"
    "\t\t\tpseudo\n";

TEST(FeatureTableParse, Basic) {
    FeatureTable t = parse_table_string(kTwoFeatures);
    EXPECT_EQ(t.seqid, "gb|KJ660346.2|");
    EXPECT_TRUE(t.table_name.empty());
    ASSERT_EQ(t.features.size(), 2u);

    const Feature& gene = t.features[0];
    EXPECT_EQ(gene.type, "gene");
    ASSERT_EQ(gene.intervals.size(), 1u);
    EXPECT_EQ(gene.intervals[0].start, (Position{1, Fuzz::Less}));
    EXPECT_EQ(gene.intervals[0].end, (Position{200, Fuzz::Greater}));
    EXPECT_FALSE(gene.intervals[0].reverse);
    ASSERT_NE(gene.qualifier("gene"), nullptr);
    EXPECT_EQ(*gene.qualifier("gene"), "NP");
    EXPECT_EQ(gene.label(), "NP");

    const Feature& cds = t.features[1];
    ASSERT_EQ(cds.intervals.size(), 2u);
    EXPECT_TRUE(cds.intervals[0].reverse);
    EXPECT_TRUE(cds.intervals[1].reverse);
    EXPECT_EQ(cds.intervals[1].lo(), 3u);
    EXPECT_EQ(cds.intervals[1].hi(), 12u);
    EXPECT_EQ(cds.location(), "30..21,12..3");
    ASSERT_EQ(cds.quals.size(), 2u);
    EXPECT_EQ(cds.quals[1].key, "pseudo");
    EXPECT_FALSE(cds.quals[1].has_value);
    EXPECT_EQ(cds.label(), "nucleoprotein");
}

TEST(FeatureTableParse, HeaderWithTableName) {
    FeatureTable t = parse_table_string(">Feature chr1 Table1\n1\t10\tgene\n");
    EXPECT_EQ(t.seqid, "chr1");
    EXPECT_EQ(t.table_name, "Table1");
}

TEST(FeatureTableParse, BlankLinesAndCarriageReturns) {
    FeatureTable t = parse_table_string(">Feature chr1\r\n\r\n1\t10\tgene\r\n\t\t\tgene\tabc  \r\n\n");
    ASSERT_EQ(t.features.size(), 1u);
    EXPECT_EQ(*t.features[0].qualifier("gene"), "abc");
}

TEST(FeatureTableParse, SingleBaseTakesJoinOrientation) {
    FeatureTable t = parse_table_string(">Feature chr1\n5\t5\tmisc_feature\n10\t8\n");
    const Feature& f = t.features[0];
    ASSERT_EQ(f.intervals.size(), 2u);
    EXPECT_TRUE(f.intervals[0].reverse);
    EXPECT_TRUE(f.intervals[1].reverse);
}

TEST(FeatureTableParse, MultipleTables) {
    const std::string text = std::string(kTwoFeatures) + ">Feature chr2\n1\t9\tgene\n";
    auto tables = parse_tables_string(text);
    ASSERT_EQ(tables.size(), 2u);
    EXPECT_EQ(tables[1].seqid, "chr2");
    EXPECT_THROW(parse_table_string(text), tblift::ParseError);
}

TEST(FeatureTableParse, ErrorsCarryLine) {
    try {
        parse_table_string(">Feature chr1\n1\t10\tgene\n\t\tgene\tabc\n");
        FAIL() << "two-tab qualifier accepted";
    } catch (const tblift::ParseError& e) {
        EXPECT_EQ(e.line(), 3u);
        EXPECT_EQ(e.content(), "\t\tgene\tabc");
        EXPECT_EQ(e.kind(), tblift::ErrorKind::Parse);
    }
}

TEST(FeatureTableParse, Rejects) {
    EXPECT_THROW(parse_table_string("1\t10\tgene\n"), tblift::ParseError);                       // no header
    EXPECT_THROW(parse_table_string(""), tblift::ParseError);                                    // no table
    EXPECT_THROW(parse_table_string(">Feature\n"), tblift::ParseError);                          // no seqid
    EXPECT_THROW(parse_table_string(">Features chr1\n"), tblift::ParseError);
    EXPECT_THROW(parse_table_string(">Feature chr1\n0\t10\tgene\n"), tblift::ParseError);        // 1-based
    EXPECT_THROW(parse_table_string(">Feature chr1\n5^6\t10\tgene\n"), tblift::ParseError);      // between bases
    EXPECT_THROW(parse_table_string(">Feature chr1\n1x\t10\tgene\n"), tblift::ParseError);
    EXPECT_THROW(parse_table_string(">Feature chr1\n1\n"), tblift::ParseError);                  // one column
    EXPECT_THROW(parse_table_string(">Feature chr1\n1\t10\tgene\textra\n"), tblift::ParseError);
    EXPECT_THROW(parse_table_string(">Feature chr1\n1\t10\n"), tblift::ParseError);              // continuation first
    EXPECT_THROW(parse_table_string(">Feature chr1\n\t\t\tgene\tx\n"), tblift::ParseError);      // qualifier first
    EXPECT_THROW(parse_table_string(">Feature chr1\n1\t10\tCDS\n\t\t\tgene\tx\n20\t30\n"), tblift::ParseError);
}

TEST(FeatureTableWrite, Format) {
    FeatureTable t = parse_table_string(kTwoFeatures);
    const std::string expect =
        ">Feature gb|KJ660346.2|\n"
        "<1\t>200\tgene\n"
        "\t\t\tgene\tNP\n"
        "30\t21\tCDS\n"
        "12\t3\n"
        "\t\t\tproduct\tnucleoprotein\n"
        "\t\t\tpseudo\n";
    EXPECT_EQ(write_table(t), expect);
}

TEST(FeatureTableWrite, RoundTrip) {
    FeatureTable t;
    t.seqid = "chr7";
    t.table_name = "annot";
    Feature f;
    f.type = "CDS";
    f.intervals.push_back(Interval{{100, Fuzz::Less}, {40, Fuzz::Exact}, true});
    f.intervals.push_back(Interval{{30, Fuzz::Exact}, {30, Fuzz::Exact}, true});
    f.intervals.push_back(Interval{{20, Fuzz::Exact}, {1, Fuzz::Greater}, true});
    f.add_qualifier("product", "polymerase");
    f.add_qualifier("transl_except", "(pos:complement(50..48),aa:TERM)");
    f.quals.push_back(Qualifier{"ribosomal_slippage", "", false});
    t.features.push_back(f);

    EXPECT_EQ(parse_table_string(write_table(t)), t);
}

TEST(FeatureTableWrite, ExcludedQualifiersAndTrailingBlank) {
    FeatureTable t = parse_table_string(
        ">Feature chr1\n1\t9\tCDS\n\t\t\tprotein_id\tgb|ABC1.1|\n\t\t\tproduct\tp\n");
    WriteOpts w;
    w.exclude_quals.emplace_back("^protein_id$");
    w.trailing_blank = true;
    EXPECT_EQ(write_table(t, w), ">Feature chr1\n1\t9\tCDS\n\t\t\tproduct\tp\n\n");
}

TEST(FeatureTableFile, ReadsFromDisk) {
    const std::string path = write_temp("ft_basic.tbl", kTwoFeatures);
    auto tables = parse_tables_file(path);
    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(tables[0], parse_table_string(kTwoFeatures));
    EXPECT_THROW(parse_tables_file(path + ".missing"), tblift::IoError);
}

TEST(FeatureTableFile, CorruptGzipIsAnIoError) {
    // gzip header followed by a deflate block of reserved type
    const char bytes[] = {'\x1f', '\x8b', '\x08', '\x00', '\x00', '\x00', '\x00', '\x00', '\x00', '\x03',
                          '\xff', '\xff', '\xff', '\xff'};
    const std::string path = write_temp("ft_corrupt.tbl.gz", std::string(bytes, sizeof(bytes)));
    EXPECT_THROW(parse_tables_file(path), tblift::IoError);
}
