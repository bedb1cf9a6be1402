#include "gtest/gtest.h"

#include <algorithm>

#include "alignment.hpp"
#include "coordmap.hpp"
#include "errors.hpp"
#include "feature_table.hpp"
#include "multichr.hpp"
#include "seqdb.hpp"
#include "test_utils.hpp"
#include "transfer.hpp"

using transfer::DiagKind;
using transfer::TransferOpts;
using transfer::TransferResult;

static TransferResult lift(const std::string& ref_row, const std::string& alt_row,
                           const std::string& features, const TransferOpts& opts = {}) {
    coordmap::CoordMapper cm;
    cm.add(aln::make_alignment("ref", ref_row, "alt", alt_row));
    const ftable::FeatureTable t = ftable::parse_table_string(">Feature ref\n" + features);
    return transfer::transfer_table(t, cm, "ref", "alt", opts);
}

static size_t count_kind(const TransferResult& r, DiagKind k) {
    return (size_t)std::count_if(r.diags.begin(), r.diags.end(),
                                 [k](const transfer::Diagnostic& d) { return d.kind == k; });
}

TEST(Transfer, IdentityKeepsEverything) {
    auto r = lift("ACGTACGTAC", "ACGTACGTAC",
                  "<1\t6\tgene\n\t\t\tgene\tg1\n10\t2\tCDS\n\t\t\tproduct\tp\n");
    EXPECT_EQ(r.table.seqid, "alt");
    ASSERT_EQ(r.table.features.size(), 2u);
    EXPECT_EQ(r.table.features[0].location(), "<1..6");
    EXPECT_EQ(r.table.features[1].location(), "10..2");
    EXPECT_EQ(*r.table.features[1].qualifier("product"), "p");
    EXPECT_TRUE(r.diags.empty());
    EXPECT_EQ(r.n_in, 2u);
    EXPECT_EQ(r.n_out, 2u);
    EXPECT_EQ(r.n_dropped, 0u);
}

TEST(Transfer, DeletionShortensInterval) {
    auto r = lift("ACGTACGT", "ACGT-CGT", "2\t7\tgene\n");
    ASSERT_EQ(r.table.features.size(), 1u);
    EXPECT_EQ(r.table.features[0].location(), "2..6");
    ASSERT_EQ(r.diags.size(), 1u);
    EXPECT_EQ(r.diags[0].kind, DiagKind::LengthChanged);
    EXPECT_EQ(r.diags[0].seqid, "alt");
    EXPECT_EQ(r.diags[0].location, "2..7");
}

TEST(Transfer, FuzzyEndsSurvive) {
    auto r = lift("ACGTACGT", "ACGT-CGT", "<2\t>7\tgene\n");
    EXPECT_EQ(r.table.features[0].location(), "<2..>6");

    TransferOpts o;
    o.ignore_ambig_edge = true;
    auto exact = lift("ACGTACGT", "ACGT-CGT", "<2\t>7\tgene\n", o);
    EXPECT_EQ(exact.table.features[0].location(), "2..6");
}

TEST(Transfer, DeletedBaseIsDroppedByDefault) {
    auto r = lift("ACGTACGT", "ACGT-CGT", "5\t5\tmisc_feature\n1\t8\tgene\n");
    ASSERT_EQ(r.table.features.size(), 1u);
    EXPECT_EQ(r.table.features[0].type, "gene");
    EXPECT_EQ(r.n_dropped, 1u);
    EXPECT_EQ(count_kind(r, DiagKind::IntervalDropped), 1u);
    EXPECT_EQ(count_kind(r, DiagKind::FeatureDropped), 1u);
    EXPECT_EQ(r.diags[0].feature_index, 0u);
}

TEST(Transfer, DeletedBaseCollapsesUnderPointPolicy) {
    TransferOpts o;
    o.gap_pair = transfer::GapPairPolicy::Point;
    auto r = lift("ACGTACGT", "ACGT-CGT", "5\t5\tmisc_feature\n", o);
    ASSERT_EQ(r.table.features.size(), 1u);
    EXPECT_EQ(r.table.features[0].location(), "4");
    EXPECT_EQ(count_kind(r, DiagKind::Collapsed), 1u);
    EXPECT_EQ(r.n_dropped, 0u);
}

TEST(Transfer, JoinLosesDeletedInterval) {
    auto r = lift("ACGTACGTACGT", "ACGTACG--CGT", "2\t4\tmRNA\n8\t9\n");
    ASSERT_EQ(r.table.features.size(), 1u);
    EXPECT_EQ(r.table.features[0].location(), "2..4");
    EXPECT_EQ(count_kind(r, DiagKind::IntervalDropped), 1u);
    EXPECT_EQ(count_kind(r, DiagKind::FeatureDropped), 0u);
}

TEST(Transfer, ClipsAtTargetEnd) {
    auto r = lift("ACGTACGTAC", "ACGTA-----", "3\t9\tCDS\n\t\t\tproduct\tp\n");
    ASSERT_EQ(r.table.features.size(), 1u);
    const ftable::Feature& f = r.table.features[0];
    EXPECT_EQ(f.location(), "3..>5");
    ASSERT_NE(f.qualifier("note"), nullptr);
    EXPECT_EQ(*f.qualifier("note"), "sequencing did not capture complete CDS");
    EXPECT_EQ(count_kind(r, DiagKind::Truncated), 1u);
    EXPECT_EQ(r.n_truncated, 1u);

    TransferOpts quiet;
    quiet.cds_note = false;
    auto q = lift("ACGTACGTAC", "ACGTA-----", "3\t9\tCDS\n", quiet);
    EXPECT_EQ(q.table.features[0].qualifier("note"), nullptr);
}

TEST(Transfer, ClipOnReverseStrand) {
    auto r = lift("ACGTACGTAC", "ACGTA-----", "9\t3\tgene\n");
    ASSERT_EQ(r.table.features.size(), 1u);
    const ftable::Interval& iv = r.table.features[0].intervals[0];
    EXPECT_EQ(iv.start, (ftable::Position{5, ftable::Fuzz::Less}));
    EXPECT_EQ(iv.end, (ftable::Position{3, ftable::Fuzz::Exact}));
    EXPECT_TRUE(iv.reverse);
}

TEST(Transfer, OutOfBoundsDropWhenClippingIsOff) {
    TransferOpts o;
    o.oob_clip = false;
    auto r = lift("ACGTACGTAC", "ACGTA-----", "3\t9\tCDS\n1\t4\tgene\n", o);
    ASSERT_EQ(r.table.features.size(), 1u);
    EXPECT_EQ(r.table.features[0].type, "gene");
    EXPECT_EQ(r.n_dropped, 1u);
    EXPECT_EQ(count_kind(r, DiagKind::IntervalDropped), 1u);
}

TEST(Transfer, MissingTargetStart) {
    auto r = lift("ACGTACGTAC", "---TACGTAC", "1\t6\tgene\n");
    EXPECT_EQ(r.table.features[0].location(), "<1..3");

    auto cds = lift("ACGTACGTAC", "---TACGTAC", "1\t8\tCDS\n");
    EXPECT_EQ(cds.table.features[0].location(), "<1..5");

    TransferOpts o;
    o.cds_frame_clip = true;
    auto framed = lift("ACGTACGTAC", "---TACGTAC", "1\t8\tCDS\n", o);
    ASSERT_EQ(framed.table.features.size(), 1u);
    EXPECT_EQ(framed.table.features[0].location(), "<3..5");

    auto tiny = lift("ACGTACGTAC", "---TACGTAC", "1\t5\tCDS\n", o);
    EXPECT_TRUE(tiny.table.features.empty());
    EXPECT_EQ(tiny.n_dropped, 1u);
}

TEST(Transfer, CoordinateQualifiers) {
    auto r = lift("ACGTACGT", "ACGT-CGT",
                  "1\t8\tCDS\n"
                  "\t\t\ttransl_except\t(pos:6..7,aa:Sec)\n"
                  "\t\t\ttransl_except\t(pos:5,aa:Sec)\n"
                  "\t\t\tnote\tpos:5 is untouched\n");
    ASSERT_EQ(r.table.features.size(), 1u);
    const ftable::Feature& f = r.table.features[0];
    ASSERT_EQ(f.quals.size(), 2u);
    EXPECT_EQ(f.quals[0].key, "transl_except");
    EXPECT_EQ(f.quals[0].value, "(pos:5..6,aa:Sec)");
    EXPECT_EQ(f.quals[1].value, "pos:5 is untouched");
    EXPECT_EQ(count_kind(r, DiagKind::QualifierDropped), 1u);
    EXPECT_TRUE(transfer::is_coordinate_qualifier("anticodon"));
    EXPECT_FALSE(transfer::is_coordinate_qualifier("note"));
}

TEST(Transfer, ReverseStrandCoordinateQualifiers) {
    auto r = lift("ACGTACGT", "ACGT-CGT",
                  "8\t1\tCDS\n"
                  "\t\t\ttransl_except\t(pos:8..6,aa:Sec)\n");
    ASSERT_EQ(r.table.features.size(), 1u);
    EXPECT_EQ(r.table.features[0].location(), "7..1");
    EXPECT_EQ(*r.table.features[0].qualifier("transl_except"), "(pos:7..5,aa:Sec)");

    // the 3' part of the feature runs past the target end
    auto clipped = lift("ACGTACGTAC", "ACGTA-----",
                        "9\t1\tCDS\n"
                        "\t\t\ttransl_except\t(pos:8..4,aa:Sec)\n");
    ASSERT_EQ(clipped.table.features.size(), 1u);
    const ftable::Feature& f = clipped.table.features[0];
    EXPECT_EQ(f.location(), "<5..1");
    EXPECT_EQ(*f.qualifier("transl_except"), "(pos:<5..4,aa:Sec)");
    EXPECT_EQ(count_kind(clipped, DiagKind::QualifierDropped), 0u);

    TransferOpts strict;
    strict.oob_clip = false;
    auto dropped = lift("ACGTACGTAC", "ACGTA-----",
                        "4\t1\tCDS\n"
                        "\t\t\ttransl_except\t(pos:8..4,aa:Sec)\n", strict);
    ASSERT_EQ(dropped.table.features.size(), 1u);
    EXPECT_EQ(dropped.table.features[0].qualifier("transl_except"), nullptr);
    EXPECT_EQ(count_kind(dropped, DiagKind::QualifierDropped), 1u);
}

TEST(Transfer, InputTableUntouched) {
    coordmap::CoordMapper cm;
    cm.add(aln::make_alignment("ref", "ACGTACGT", "alt", "ACGT-CGT"));
    const ftable::FeatureTable t = ftable::parse_table_string(">Feature ref\n2\t7\tgene\n");
    const ftable::FeatureTable copy = t;
    transfer::transfer_table(t, cm, "ref", "alt");
    EXPECT_EQ(t, copy);
}

TEST(Transfer, ThreadsDoNotChangeTheResult) {
    std::string feats;
    for (int i = 1; i <= 40; ++i) {
        const int lo = (i % 15) + 1;
        feats += std::to_string(lo) + "\t" + std::to_string(lo + 4) + "\tmisc_feature\n";
    }
    TransferOpts par;
    par.threads = 4;
    auto a = lift("ACGTACGTACGTACGTACGT", "ACGT-CGTAC--ACGTACG-", feats);
    auto b = lift("ACGTACGTACGTACGTACGT", "ACGT-CGTAC--ACGTACG-", feats, par);
    EXPECT_EQ(a.table, b.table);
    ASSERT_EQ(a.diags.size(), b.diags.size());
    for (size_t i = 0; i < a.diags.size(); ++i) {
        EXPECT_EQ(transfer::to_tsv(a.diags[i]), transfer::to_tsv(b.diags[i]));
    }
}

TEST(Transfer, Errors) {
    EXPECT_THROW(lift("ACGTACGT", "ACGT-CGT", "2\t20\tgene\n"), tblift::OutOfRange);

    coordmap::CoordMapper cm;
    cm.add(aln::make_alignment("ref", "ACGT", "alt", "ACGT"));
    const ftable::FeatureTable t = ftable::parse_table_string(">Feature ref\n1\t2\tgene\n");
    EXPECT_THROW(transfer::transfer_table(t, cm, "ref", "other"), tblift::NoAlignment);
}

TEST(Transfer, DiagnosticRows) {
    auto r = lift("ACGTACGT", "ACGT-CGT", "2\t7\tgene\n\t\t\tgene\tabc\n");
    ASSERT_EQ(r.diags.size(), 1u);
    EXPECT_EQ(transfer::diag_tsv_header(),
              "#seqid\tfeature_index\tfeature_type\tlabel\tkind\tlocation\tmessage\n");
    EXPECT_EQ(transfer::to_tsv(r.diags[0]),
              "alt\t0\tgene\tabc\tlength_changed\t2..7\tlength 6 -> 5 (deletion)\n");
}

// The first row of this alignment is neither the reference nor the target
static seqdb::SeqDB msa_with_leading_row() {
    seqdb::SeqDB msa;
    msa.add("h", "ACG-TACGT---");
    msa.add("r", "ACGATACGTACG");
    msa.add("a", "ACGATACGTACG");
    return msa;
}

TEST(TransferMsa, ReferenceRowIsTheHub) {
    const std::string path = write_temp("msa_lead.fa", seqdb::to_fasta("h", "ACG-TACGT---") +
                                        seqdb::to_fasta("r", "ACGATACGTACG") +
                                        seqdb::to_fasta("a", "ACGATACGTACG"));
    const seqdb::Record ref{"r", "", "ACGATACGTACG"};
    const seqdb::Record alt{"a", "", "ACGATACGTACG"};
    const auto table = ftable::parse_table_string(">Feature r\n4\t12\tgene\n");

    auto r = multichr::transfer_msa(table, aln::load_msa(path, ref.name), ref, alt, TransferOpts(), path);
    EXPECT_EQ(r.table.seqid, "a");
    ASSERT_EQ(r.table.features.size(), 1u);
    EXPECT_EQ(r.table.features[0].location(), "4..12");
    EXPECT_TRUE(r.diags.empty());
}

TEST(TransferMsa, Rejects) {
    const seqdb::SeqDB msa = msa_with_leading_row();
    const seqdb::Record ref{"r", "", "ACGATACGTACG"};
    const seqdb::Record alt{"a", "", "ACGATACGTACG"};
    const auto table = ftable::parse_table_string(">Feature r\n4\t12\tgene\n");

    // projected on another row
    EXPECT_THROW(multichr::transfer_msa(table, aln::project_msa(msa, "h"), ref, alt, TransferOpts(), "msa"),
                 tblift::ParseError);

    const auto alns = aln::project_msa(msa, "r");
    const seqdb::Record missing{"z", "", "ACGATACGTACG"};
    EXPECT_THROW(multichr::transfer_msa(table, alns, ref, missing, TransferOpts(), "msa"), tblift::ParseError);
    const seqdb::Record shorter{"a", "", "ACGATACG"};
    EXPECT_THROW(multichr::transfer_msa(table, alns, ref, shorter, TransferOpts(), "msa"), tblift::ParseError);
}
