// test_range.cpp - block ranges, bundle keys and gap detection

#include "test_framework.h"
#include "../block_range.h"
#include "../bundle.h"
#include "../errors.h"
#include "../gap_detector.h"

namespace mbk {
namespace test {

MBK_TEST_SUITE(Range);

// =============================================================================
// BlockRange
// =============================================================================

MBK_TEST(Range, ParseClosed) {
    BlockRange r = BlockRange::parse("100:400");
    MBK_TEST_ASSERT(r.is_resolved());
    MBK_TEST_ASSERT(r.is_closed());
    MBK_TEST_ASSERT_EQ(r.start, 100);
    MBK_TEST_ASSERT_EQ(*r.stop, 400u);
}

MBK_TEST(Range, ParseRelativeStop) {
    BlockRange r = BlockRange::parse("250:+50");
    MBK_TEST_ASSERT(r.is_closed());
    MBK_TEST_ASSERT_EQ(*r.stop, 300u);
}

MBK_TEST(Range, ParseOpenEnded) {
    BlockRange r = BlockRange::parse("5000:");
    MBK_TEST_ASSERT(r.is_resolved());
    MBK_TEST_ASSERT(!r.is_closed());
    MBK_TEST_ASSERT(r.open);
    MBK_TEST_ASSERT_EQ(r.stop_block_or(0), 0u);
}

MBK_TEST(Range, BareStartIsUnresolved) {
    BlockRange r = BlockRange::parse("100");
    MBK_TEST_ASSERT(!r.is_resolved());
}

MBK_TEST(Range, HeadRelativeStartIsUnresolved) {
    BlockRange r = BlockRange::parse("-100:500");
    MBK_TEST_ASSERT(!r.is_resolved());
    MBK_TEST_ASSERT_EQ(r.start, -100);
    MBK_TEST_ASSERT_EQ(r.start_block(), 0u);
}

MBK_TEST(Range, ClosedNeedsStopAboveStart) {
    MBK_TEST_ASSERT(BlockRange::closed(5, 6).is_resolved());
    MBK_TEST_ASSERT(!BlockRange::closed(5, 5).is_resolved());
    MBK_TEST_ASSERT(!BlockRange::closed(5, 0).is_resolved());
}

MBK_TEST(Range, RejectsGarbage) {
    MBK_TEST_ASSERT_THROWS(BlockRange::parse(""), PreconditionError);
    MBK_TEST_ASSERT_THROWS(BlockRange::parse("abc"), PreconditionError);
    MBK_TEST_ASSERT_THROWS(BlockRange::parse("10:x"), PreconditionError);
    MBK_TEST_ASSERT_THROWS(BlockRange::parse("10:5"), PreconditionError);
    MBK_TEST_ASSERT_THROWS(BlockRange::parse("10:10"), PreconditionError);
    MBK_TEST_ASSERT_THROWS(BlockRange::parse("-10:+5"), PreconditionError);
}

MBK_TEST(Range, ToString) {
    MBK_TEST_ASSERT_EQ(BlockRange::closed(1, 9).to_string(), std::string("[1, 9)"));
    MBK_TEST_ASSERT_EQ(BlockRange::open_ended(7).to_string(), std::string("[7, +inf)"));
}

// =============================================================================
// Bundle arithmetic and keys
// =============================================================================

MBK_TEST(Range, RoundToBundle) {
    MBK_TEST_ASSERT_EQ(round_to_bundle_start(0, 100), 0u);
    MBK_TEST_ASSERT_EQ(round_to_bundle_start(199, 100), 100u);
    MBK_TEST_ASSERT_EQ(round_to_bundle_start(200, 100), 200u);
    MBK_TEST_ASSERT_EQ(round_to_bundle_end(200, 100), 299u);
    MBK_TEST_ASSERT_EQ(round_to_bundle_end(0, 1), 0u);
}

MBK_TEST(Range, FormatBaseNumber) {
    MBK_TEST_ASSERT_EQ(format_base_number(0), std::string("0000000000"));
    MBK_TEST_ASSERT_EQ(format_base_number(12300), std::string("0000012300"));
}

MBK_TEST(Range, BundleIndexParse) {
    auto idx = BundleIndex::parse("0000012300");
    MBK_TEST_ASSERT(idx.has_value());
    MBK_TEST_ASSERT_EQ(idx->base_number, 12300u);
    MBK_TEST_ASSERT_EQ(idx->key(), std::string("0000012300"));

    MBK_TEST_ASSERT(!BundleIndex::parse("0000012300.broken").has_value());
    MBK_TEST_ASSERT(!BundleIndex::parse("0000012300.tmp").has_value());
    MBK_TEST_ASSERT(!BundleIndex::parse("000001230").has_value());
    MBK_TEST_ASSERT(!BundleIndex::parse("00000123ab").has_value());
    MBK_TEST_ASSERT(!BundleIndex::parse("README").has_value());
}

MBK_TEST(Range, MarkerKeys) {
    MBK_TEST_ASSERT_EQ((Marker{200, MarkerKind::Missing}).key(), std::string("0000000200.missing"));
    MBK_TEST_ASSERT_EQ((Marker{0, MarkerKind::Broken}).key(), std::string("0000000000.broken"));
}

// =============================================================================
// GapDetector
// =============================================================================

MBK_TEST(Range, GapDetectorContiguous) {
    GapDetector g(100, 100);
    MBK_TEST_ASSERT(g.observe(100).empty());
    g.processed(100);
    MBK_TEST_ASSERT(g.observe(200).empty());
    g.processed(200);
    MBK_TEST_ASSERT_EQ(g.expected(), 300u);
}

MBK_TEST(Range, GapDetectorReportsEverySkippedBase) {
    GapDetector g(0, 100);
    g.processed(0);
    auto gaps = g.observe(400);
    MBK_TEST_ASSERT_EQ(gaps.size(), 3u);
    MBK_TEST_ASSERT_EQ(gaps[0], 100u);
    MBK_TEST_ASSERT_EQ(gaps[1], 200u);
    MBK_TEST_ASSERT_EQ(gaps[2], 300u);
}

MBK_TEST(Range, GapDetectorRejectsGoingBackwards) {
    GapDetector g(0, 100);
    g.processed(0);
    g.processed(100);
    MBK_TEST_ASSERT_THROWS(g.observe(100), OrderingError);
}

} // namespace test
} // namespace mbk
