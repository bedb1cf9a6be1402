#include "gtest/gtest.h"

#include "alignment.hpp"
#include "coordmap.hpp"
#include "errors.hpp"

using coordmap::CoordMapper;
using coordmap::MapKind;

static CoordMapper mapper_of(const std::string& ref_row, const std::string& alt_row, int max_hops = 3) {
    CoordMapper cm(max_hops);
    cm.add(aln::make_alignment("ref", ref_row, "alt", alt_row));
    return cm;
}

TEST(CoordMapper, IdentityMapsEveryBaseOntoItself) {
    CoordMapper cm = mapper_of("ACGTACGTTA", "ACGTACGTTA");
    for (uint32_t p = 1; p <= 10; ++p) {
        auto m = cm.map_point("ref", "alt", p);
        EXPECT_EQ(m.pos, p);
        EXPECT_EQ(m.kind, MapKind::Exact);
    }
    auto self = cm.map_point("ref", "ref", 4);
    EXPECT_EQ(self.pos, 4u);
    EXPECT_TRUE(self.exact());
}

TEST(CoordMapper, GapMapsToUpstreamBase) {
    CoordMapper cm = mapper_of("ACGTACGT", "ACGT-CGT");
    auto m = cm.map_point("ref", "alt", 5);
    EXPECT_EQ(m.kind, MapKind::Upstream);
    EXPECT_EQ(m.pos, 4u);

    EXPECT_EQ(cm.map_point("ref", "alt", 4).pos, 4u);
    EXPECT_EQ(cm.map_point("ref", "alt", 6).pos, 5u);
    EXPECT_EQ(cm.map_point("ref", "alt", 8).pos, 7u);
    EXPECT_EQ(cm.map_point("ref", "alt", 8).kind, MapKind::Exact);
}

TEST(CoordMapper, BothDirections) {
    CoordMapper cm = mapper_of("ACGTACGT", "ACGT-CGT");
    EXPECT_EQ(cm.map_point("alt", "ref", 5).pos, 6u);
    EXPECT_EQ(cm.map_point("alt", "ref", 4).pos, 4u);
    EXPECT_EQ(cm.map_point("alt", 5).pos, 6u);  // unique partner
    EXPECT_EQ(cm.partners("alt"), std::vector<std::string>{"ref"});
}

TEST(CoordMapper, InsertionInTargetSkipsBases) {
    CoordMapper cm = mapper_of("ACG--TACGT", "ACGTTTACGT");
    EXPECT_EQ(cm.map_point("ref", "alt", 3).pos, 3u);
    EXPECT_EQ(cm.map_point("ref", "alt", 4).pos, 6u);
    // target bases inside the insertion go to the upstream reference base
    auto back = cm.map_point("alt", "ref", 5);
    EXPECT_EQ(back.kind, MapKind::Upstream);
    EXPECT_EQ(back.pos, 3u);
}

TEST(CoordMapper, PastEndAndUnmapped) {
    CoordMapper tail = mapper_of("ACGTACGTAC", "ACGTA-----");
    auto m = tail.map_point("ref", "alt", 7);
    EXPECT_EQ(m.kind, MapKind::PastEnd);
    EXPECT_EQ(m.pos, 5u);

    CoordMapper head = mapper_of("ACGTACGT", "--GTACGT");
    auto u = head.map_point("ref", "alt", 1);
    EXPECT_EQ(u.kind, MapKind::Unmapped);
    EXPECT_EQ(u.pos, 0u);
    EXPECT_EQ(head.map_point("ref", "alt", 3).pos, 1u);
}

TEST(CoordMapper, Monotonic) {
    CoordMapper cm = mapper_of("AC-GTAC--GTTAGGCA-T", "ACTG--CAAGT-AG--ACT");
    const uint32_t n = cm.seq_length("ref");
    uint32_t prev = 0;
    for (uint32_t p = 1; p <= n; ++p) {
        auto m = cm.map_point("ref", "alt", p);
        EXPECT_GE(m.pos, prev) << "at " << p;
        prev = m.pos;
    }
}

TEST(CoordMapper, Errors) {
    CoordMapper cm = mapper_of("ACGTACGT", "ACGT-CGT");
    EXPECT_THROW(cm.map_point("ref", "alt", 0), tblift::OutOfRange);
    EXPECT_THROW(cm.map_point("ref", "alt", 9), tblift::OutOfRange);
    EXPECT_THROW(cm.map_interval("ref", "alt", 3, 9), tblift::OutOfRange);
    EXPECT_THROW(cm.map_point("ref", "chrX", 1), tblift::NoAlignment);
    EXPECT_THROW(cm.seq_length("chrX"), tblift::NoAlignment);

    cm.add(aln::make_alignment("x", "ACGT", "y", "ACGT"));
    EXPECT_FALSE(cm.joined("ref", "y"));
    EXPECT_THROW(cm.map_point("ref", "y", 1), tblift::NoAlignment);
}

TEST(CoordMapper, RejectsInconsistentAlignments) {
    CoordMapper cm = mapper_of("ACGTACGT", "ACGT-CGT");
    EXPECT_THROW(cm.add(aln::make_alignment("alt", "ACGTCGT", "ref", "ACGTCGT")), tblift::ParseError);  // length of ref differs
    EXPECT_THROW(cm.add(aln::make_alignment("ref", "ACGTACGT", "alt", "ACGTCGT-")), tblift::ParseError);  // pair twice
    EXPECT_THROW(cm.add(aln::make_alignment("ref", "ACGT", "ref", "ACGT")), tblift::ParseError);
}

TEST(CoordMapper, IntervalSpan) {
    CoordMapper cm = mapper_of("ACGTACGT", "ACGT-CGT");
    auto h = cm.map_interval("ref", "alt", 2, 7);
    EXPECT_EQ(h.first, 2u);
    EXPECT_EQ(h.last, 6u);
    EXPECT_EQ(h.n_target, 5u);
    EXPECT_EQ(h.src_len, 6u);
    EXPECT_EQ(h.tgt_seq_len, 7u);
    EXPECT_TRUE(h.lo.exact());
    EXPECT_TRUE(h.hi.exact());

    auto d = cm.map_interval("ref", "alt", 5, 5);
    EXPECT_EQ(d.n_target, 0u);
    EXPECT_EQ(d.lo.kind, MapKind::Upstream);
}

// hub h aligned to a and to b; a and b share no alignment
static CoordMapper hub_mapper(int max_hops) {
    CoordMapper cm(max_hops);
    cm.add(aln::make_alignment("h", "ACGTACGT", "a", "ACGT-CGT"));
    cm.add(aln::make_alignment("h", "ACGTAC-GT", "b", "ACGTACTGT"));
    return cm;
}

TEST(CoordMapper, RoutesThroughHub) {
    CoordMapper cm = hub_mapper(3);
    EXPECT_EQ(cm.num_seqs(), 3u);
    EXPECT_EQ(cm.num_alignments(), 2u);
    EXPECT_TRUE(cm.joined("a", "b"));

    auto m = cm.map_point("a", "b", 5);
    EXPECT_EQ(m.pos, 6u);
    EXPECT_TRUE(m.exact());
    EXPECT_EQ(cm.map_point("a", "b", 6).pos, 8u);

    // b's inserted T is a gap in the hub; the worst kind along the chain wins
    auto back = cm.map_point("b", "a", 7);
    EXPECT_EQ(back.kind, MapKind::Upstream);
    EXPECT_EQ(back.pos, 5u);

    auto span = cm.map_interval("a", "b", 4, 6);
    EXPECT_EQ(span.first, 4u);
    EXPECT_EQ(span.last, 8u);

    EXPECT_THROW(cm.map_point("h", 1), tblift::NoAlignment);  // two partners
}

TEST(CoordMapper, ChainedPastEndLandsOnTargetEnd) {
    CoordMapper cm;
    cm.add(aln::make_alignment("h", "ACGT--", "a", "ACGTAC"));
    cm.add(aln::make_alignment("h", "ACGT--", "b", "ACGTAA"));

    auto m = cm.map_point("a", "b", 5);
    EXPECT_EQ(m.kind, MapKind::PastEnd);
    EXPECT_EQ(m.pos, 6u);
    EXPECT_TRUE(cm.map_point("a", "b", 3).exact());

    auto span = cm.map_interval("a", "b", 3, 6);
    EXPECT_EQ(span.hi.pos, 6u);
    EXPECT_EQ(span.last, 4u);
}

TEST(CoordMapper, HopLimit) {
    CoordMapper cm = hub_mapper(1);
    EXPECT_FALSE(cm.joined("a", "b"));
    EXPECT_THROW(cm.map_point("a", "b", 1), tblift::NoAlignment);
    EXPECT_EQ(cm.map_point("a", "h", 5).pos, 6u);
}
