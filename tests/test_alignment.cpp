#include "gtest/gtest.h"

#include "CIGAR.hpp"
#include "alignment.hpp"
#include "errors.hpp"
#include "seq_utils.hpp"
#include "seqdb.hpp"
#include "test_utils.hpp"

TEST(Alignment, MakeNormalizesRows) {
    aln::Alignment a = aln::make_alignment("r", "acgt.a", "q", "ACG-TA");
    EXPECT_EQ(a.a_row, "ACGT-A");
    EXPECT_EQ(a.b_row, "ACG-TA");
    EXPECT_EQ(a.n_cols(), 6u);
    EXPECT_EQ(a.a_len(), 5u);
    EXPECT_EQ(a.b_len(), 5u);
}

TEST(Alignment, MakeRejects) {
    EXPECT_THROW(aln::make_alignment("r", "ACGT", "q", "ACG"), tblift::ParseError);
    EXPECT_THROW(aln::make_alignment("r", "", "q", ""), tblift::ParseError);
    EXPECT_THROW(aln::make_alignment("r", "AC#T", "q", "ACGT"), tblift::ParseError);
    EXPECT_THROW(aln::make_alignment("r", "AC-T", "q", "AC-T"), tblift::ParseError);  // all-gap column
}

TEST(Cigar, ParseAndPack) {
    auto ops = CIGAR::parse("4=1D3=");
    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(ops[1].op, 'D');
    EXPECT_EQ(CIGAR::ref_span(ops), 8u);
    EXPECT_EQ(CIGAR::query_span(ops), 7u);
    EXPECT_EQ(CIGAR::pack(ops), "4=1D3=");

    std::vector<CIGAR::COp> merged;
    CIGAR::append(merged, 2, 'M');
    CIGAR::append(merged, 3, 'M');
    CIGAR::append(merged, 0, 'I');
    EXPECT_EQ(CIGAR::pack(merged), "5M");
    EXPECT_EQ(CIGAR::pack({}), "*");

    EXPECT_THROW(CIGAR::parse("10"), tblift::ParseError);
    EXPECT_THROW(CIGAR::parse("0M"), tblift::ParseError);
    EXPECT_THROW(CIGAR::parse("5Q"), tblift::ParseError);
    EXPECT_THROW(CIGAR::parse("M"), tblift::ParseError);
}

TEST(Alignment, FromCigar) {
    aln::Alignment a = aln::from_cigar("r", "ACGTACGT", "q", "ACGTCGT", CIGAR::parse("4=1D3="));
    EXPECT_EQ(a.a_row, "ACGTACGT");
    EXPECT_EQ(a.b_row, "ACGT-CGT");

    aln::Alignment ins = aln::from_cigar("r", "ACGT", "q", "ACTTGT", CIGAR::parse("2M2I2M"));
    EXPECT_EQ(ins.a_row, "AC--GT");
    EXPECT_EQ(ins.b_row, "ACTTGT");

    EXPECT_THROW(aln::from_cigar("r", "ACGT", "q", "ACGT", CIGAR::parse("3M")), tblift::ParseError);
}

TEST(Alignment, ProjectMsaDropsSharedGaps) {
    seqdb::SeqDB msa;
    msa.add("x", "ACTG-");
    msa.add("gb|H1.1|", "AC-GT");
    msa.add("y", "A--GT");

    auto alns = aln::project_msa(msa, "H1.1", "msa");
    ASSERT_EQ(alns.size(), 2u);
    EXPECT_EQ(alns[0].a_name, "gb|H1.1|");
    EXPECT_EQ(alns[0].b_name, "x");
    EXPECT_EQ(alns[0].a_row, "AC-GT");
    EXPECT_EQ(alns[0].b_row, "ACTG-");
    EXPECT_EQ(alns[1].b_name, "y");
    EXPECT_EQ(alns[1].a_row, "ACGT");
    EXPECT_EQ(alns[1].b_row, "A-GT");

    EXPECT_THROW(aln::project_msa(msa, "missing", "msa"), tblift::ParseError);

    seqdb::SeqDB ragged;
    ragged.add("a", "ACGT");
    ragged.add("b", "ACG");
    EXPECT_THROW(aln::project_msa(ragged, "", "msa"), tblift::ParseError);

    seqdb::SeqDB single;
    single.add("a", "ACGT");
    EXPECT_THROW(aln::project_msa(single, "", "msa"), tblift::ParseError);
}

TEST(Alignment, LoadMsaFromFile) {
    const std::string path = write_temp("aln_msa.fa", ">ref\nACGTACGT\n>alt desc\nacgt-cgt\n");
    auto alns = aln::load_msa(path);
    ASSERT_EQ(alns.size(), 1u);
    EXPECT_EQ(alns[0].a_name, "ref");
    EXPECT_EQ(alns[0].b_name, "alt");
    EXPECT_EQ(alns[0].b_row, "ACGT-CGT");
}

TEST(Alignment, LoadAlignedPairs) {
    const std::string path = write_temp("aln_pairs.fa", ">r1\nACGT\n>q1\nAC-T\n>r2\nAA-A\n>q2\nAAGA\n");
    auto alns = aln::load_aligned_pairs(path);
    ASSERT_EQ(alns.size(), 2u);
    EXPECT_EQ(alns[1].a_name, "r2");
    EXPECT_EQ(alns[1].b_row, "AAGA");

    const std::string odd = write_temp("aln_pairs_odd.fa", ">r1\nACGT\n>q1\nAC-T\n>r2\nAAAA\n");
    EXPECT_THROW(aln::load_aligned_pairs(odd), tblift::ParseError);
}

TEST(Alignment, LoadPafPadsFlanks) {
    seqdb::SeqDB ref, alt;
    ref.add("r", "GGACGTACGT");
    alt.add("q", "ACGTACGTCC");
    const std::string path = write_temp("aln.paf",
        "q\t10\t0\t8\t+\tr\t10\t2\t10\t8\t8\t60\tNM:i:0\tcg:Z:8M\n"
        "q\t10\t0\t4\t-\tr\t10\t2\t6\t4\t4\t60\tcg:Z:4M\n");

    auto alns = aln::load_paf(path, ref, alt);
    ASSERT_EQ(alns.size(), 1u);
    EXPECT_EQ(alns[0].a_name, "r");
    EXPECT_EQ(alns[0].b_name, "q");
    EXPECT_EQ(alns[0].a_row, "GGACGTACGT--");
    EXPECT_EQ(alns[0].b_row, "--ACGTACGTCC");
}

TEST(Alignment, LoadPafRejects) {
    seqdb::SeqDB ref, alt;
    ref.add("r", "GGACGTACGT");
    alt.add("q", "ACGTACGTCC");

    const std::string no_cg = write_temp("aln_nocg.paf", "q\t10\t0\t8\t+\tr\t10\t2\t10\t8\t8\t60\n");
    EXPECT_THROW(aln::load_paf(no_cg, ref, alt), tblift::ParseError);

    const std::string bad_len = write_temp("aln_badlen.paf", "q\t11\t0\t8\t+\tr\t10\t2\t10\t8\t8\t60\tcg:Z:8M\n");
    EXPECT_THROW(aln::load_paf(bad_len, ref, alt), tblift::ParseError);

    const std::string short_cg = write_temp("aln_short.paf", "q\t10\t0\t8\t+\tr\t10\t2\t10\t8\t8\t60\tcg:Z:7M\n");
    EXPECT_THROW(aln::load_paf(short_cg, ref, alt), tblift::ParseError);

    const std::string cols = write_temp("aln_cols.paf", "q\t10\t0\t8\t+\tr\n");
    EXPECT_THROW(aln::load_paf(cols, ref, alt), tblift::ParseError);
}

TEST(SeqUtils, IdMatching) {
    EXPECT_TRUE(seqUtils::same_seqid("gb|KJ660346.2|", "KJ660346.2"));
    EXPECT_TRUE(seqUtils::same_seqid("chr1", "chr1"));
    EXPECT_FALSE(seqUtils::same_seqid("gb|X.1|", "ref|X.1|"));
    EXPECT_FALSE(seqUtils::same_seqid("chr1", "chr10"));
    EXPECT_EQ(seqUtils::file_safe("gb|KJ660346.2|"), "gb_KJ660346.2");
    EXPECT_EQ(seqUtils::ungap("AC--G-T"), "ACGT");
}

TEST(SeqDB, LoadAndLookup) {
    const std::string path = write_temp("seqdb.fa", ">gb|A1.1| first\nacgt\nNN\n>B2\nTTTT\n");
    seqdb::SeqDB db;
    db.load(path);
    ASSERT_EQ(db.size(), 2u);
    EXPECT_EQ(db.at(0).seq, "ACGTNN");
    EXPECT_EQ(db.at(0).comment, "first");
    ASSERT_NE(db.find_like("A1.1"), nullptr);
    EXPECT_EQ(db.find_like("A1.1")->name, "gb|A1.1|");
    EXPECT_EQ(db.find_like("C3"), nullptr);

    const std::string dup = write_temp("seqdb_dup.fa", ">a\nACGT\n>a\nACGT\n");
    seqdb::SeqDB d2;
    EXPECT_THROW(d2.load(dup), tblift::ParseError);

    const std::string bad = write_temp("seqdb_bad.fa", ">a\nAC1T\n");
    seqdb::SeqDB d3;
    EXPECT_THROW(d3.load(bad), tblift::ParseError);

    EXPECT_EQ(seqdb::to_fasta("a", "ACGTAC", 4), ">a\nACGT\nAC\n");
}
