// test_scanner.cpp - archive walk, chain checks and marker emission

#include "test_framework.h"
#include "test_util.h"
#include "../bundle_walker.h"
#include "../cancel.h"
#include "../chain_validator.h"
#include "../logging.h"
#include "../marker_writer.h"
#include "../scanner.h"

#include <filesystem>
#include <fstream>

namespace mbk {
namespace test {

MBK_TEST_SUITE(Scanner);

static ScanReport scan(MemoryObjectStore& src, MemoryObjectStore& dst, const std::string& range,
                       uint64_t size = 100) {
    ScanOptions opts;
    opts.range = BlockRange::parse(range);
    opts.bundle_size = size;
    Scanner s(src, dst, opts);
    return s.run();
}

static std::set<std::string> markers_in(MemoryObjectStore& dst) {
    std::set<std::string> out;
    for (const auto& k : dst.keys()) {
        if (!BundleIndex::parse(k)) out.insert(k);
    }
    return out;
}

// Lists a fixed sequence of keys, whatever their order.
class FixedOrderStore : public MemoryObjectStore {
public:
    std::vector<std::string> order;

    void walk_from(const std::string&, const std::string&, const Visitor& visit) override {
        for (const auto& k : order) {
            if (!visit(k)) return;
        }
    }
};

// =============================================================================
// Clean archives
// =============================================================================

MBK_TEST(Scanner, ContiguousArchiveHasNoMarkers) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 900, 100);

    ScanReport r = scan(src, dst, "0:1000");
    MBK_TEST_ASSERT(r.clean());
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 10u);
    MBK_TEST_ASSERT_EQ(r.blocks_read, 1000u);
    MBK_TEST_ASSERT(markers_in(dst).empty());
}

MBK_TEST(Scanner, SubRangeOfContiguousArchiveHasNoMarkers) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 900, 100);

    ScanReport r = scan(src, dst, "250:620");
    MBK_TEST_ASSERT(r.clean());
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 5u);  // 200 .. 600
    MBK_TEST_ASSERT(dst.keys().empty());
}

MBK_TEST(Scanner, StopsAtBundleHoldingLastBlock) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 500, 100);

    ScanReport r = scan(src, dst, "0:300");
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 3u);

    r = scan(src, dst, "0:301");
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 4u);
}

// =============================================================================
// Missing bundles
// =============================================================================

MBK_TEST(Scanner, SingleGapProducesOneMissingMarker) {
    MemoryObjectStore src, dst;
    src.put(format_base_number(100), linked_bundle(100, 100));
    src.put(format_base_number(300), linked_bundle(300, 100));

    ScanReport r = scan(src, dst, "100:400");
    MBK_TEST_ASSERT_EQ(r.missing, 1u);
    MBK_TEST_ASSERT_EQ(r.broken, 0u);
    std::set<std::string> expected = {"0000000200.missing"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
    MBK_TEST_ASSERT(dst.get("0000000200.missing").empty());
}

MBK_TEST(Scanner, LeadingGapIsReported) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 300, 400, 100);

    ScanReport r = scan(src, dst, "100:500");
    std::set<std::string> expected = {"0000000100.missing", "0000000200.missing"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
    MBK_TEST_ASSERT_EQ(r.missing, 2u);
}

MBK_TEST(Scanner, OpenRangeDoesNotReportTail) {
    MemoryObjectStore src, dst;
    src.put(format_base_number(100), linked_bundle(100, 100));
    src.put(format_base_number(300), linked_bundle(300, 100));

    ScanReport r = scan(src, dst, "100:");
    std::set<std::string> expected = {"0000000200.missing"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 2u);
}

// =============================================================================
// Broken bundles
// =============================================================================

MBK_TEST(Scanner, EmptyIdBreaksOnlyItsBundle) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 200, 100);

    std::vector<Block> blocks;
    for (uint64_t n = 100; n < 200; ++n) blocks.push_back(make_block(n));
    blocks[0].id.clear();
    src.put(format_base_number(100), bundle_of(blocks));

    ScanReport r = scan(src, dst, "0:300");
    std::set<std::string> expected = {"0000000100.broken"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
    MBK_TEST_ASSERT_EQ(r.broken, 1u);
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 3u);
}

MBK_TEST(Scanner, ParentMismatchInsideBundle) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 300, 100);

    std::vector<Block> blocks;
    for (uint64_t n = 100; n < 200; ++n) blocks.push_back(make_block(n));
    blocks[50].parent_id = "forked";
    src.put(format_base_number(100), bundle_of(blocks));

    scan(src, dst, "0:400");
    std::set<std::string> expected = {"0000000100.broken"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
}

MBK_TEST(Scanner, LinkAcrossBundleBoundaryIsChecked) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 100, 100);

    std::vector<Block> blocks;
    for (uint64_t n = 200; n < 300; ++n) blocks.push_back(make_block(n));
    blocks[0].parent_id = "somewhere-else";
    src.put(format_base_number(200), bundle_of(blocks));
    src.put(format_base_number(300), linked_bundle(300, 100));

    scan(src, dst, "0:400");
    std::set<std::string> expected = {"0000000200.broken"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
}

MBK_TEST(Scanner, RepeatedRunsProduceSameMarkers) {
    MemoryObjectStore src, dst1, dst2;
    put_linked_bundles(src, 0, 100, 100);
    put_linked_bundles(src, 400, 600, 100);
    std::vector<Block> blocks;
    for (uint64_t n = 500; n < 600; ++n) blocks.push_back(make_block(n));
    blocks[99].id.clear();
    src.put(format_base_number(500), bundle_of(blocks));

    ScanReport a = scan(src, dst1, "0:700");
    ScanReport b = scan(src, dst2, "0:700");
    MBK_TEST_ASSERT(markers_in(dst1) == markers_in(dst2));
    MBK_TEST_ASSERT(a.markers == b.markers);
    MBK_TEST_ASSERT_EQ(markers_in(dst1).size(), 3u);  // 200, 300 missing, 500 broken

    // Markers already present do not change a rerun
    ScanReport c = scan(src, dst1, "0:700");
    MBK_TEST_ASSERT(c.markers == a.markers);
}

// =============================================================================
// Preconditions and fatal errors
// =============================================================================

MBK_TEST(Scanner, UnresolvedRangeRejectedBeforeAnyAccess) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 100, 100);

    ScanOptions opts;
    opts.range = BlockRange::parse("100");
    MBK_TEST_ASSERT_THROWS(Scanner(src, dst, opts), PreconditionError);
    opts.range = BlockRange::parse("-50:100");
    MBK_TEST_ASSERT_THROWS(Scanner(src, dst, opts), PreconditionError);
    opts.range = BlockRange::parse("0:100");
    opts.bundle_size = 0;
    MBK_TEST_ASSERT_THROWS(Scanner(src, dst, opts), PreconditionError);

    MBK_TEST_ASSERT_EQ(src.accesses.load(), 0);
    MBK_TEST_ASSERT_EQ(dst.accesses.load(), 0);

    MBK_TEST_ASSERT_THROWS(
        check_merged_blocks("/nonexistent/mbk/src", "/nonexistent/mbk/dst", 100,
                            BlockRange::parse("100")),
        PreconditionError);
}

MBK_TEST(Scanner, EmptyClosedRangeRejected) {
    MemoryObjectStore src, dst;
    ScanOptions opts;
    opts.range = BlockRange::closed(200, 0);
    MBK_TEST_ASSERT_THROWS(Scanner(src, dst, opts), PreconditionError);
    opts.range = BlockRange::closed(0, 0);
    MBK_TEST_ASSERT_THROWS(Scanner(src, dst, opts), PreconditionError);
    MBK_TEST_ASSERT_EQ(src.accesses.load(), 0);
}

MBK_TEST(Scanner, BundleSizeMismatchAbortsWithoutMarkers) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 300, 100);

    MBK_TEST_ASSERT_THROWS(scan(src, dst, "0:400", 50), PreconditionError);
    MBK_TEST_ASSERT(dst.keys().empty());
}

MBK_TEST(Scanner, UnalignedBundleKeyAbortsWithoutMarkers) {
    MemoryObjectStore src, dst;
    src.put(format_base_number(0), linked_bundle(0, 50));
    src.put(format_base_number(50), linked_bundle(50, 50));
    src.put(format_base_number(200), linked_bundle(200, 100));

    MBK_TEST_ASSERT_THROWS(scan(src, dst, "0:300"), PreconditionError);
    MBK_TEST_ASSERT(dst.keys().empty());
}

MBK_TEST(Scanner, UnopenableBundleWritesBrokenThenAborts) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 300, 100);
    src.unreadable.insert(format_base_number(200));

    MBK_TEST_ASSERT_THROWS(scan(src, dst, "0:400"), StoreError);
    std::set<std::string> expected = {"0000000200.broken"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
}

MBK_TEST(Scanner, ForeignHeaderWritesBrokenThenAborts) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 0, 100);
    src.put(format_base_number(100), {'j', 'u', 'n', 'k', 0, 0, 0, 0, 1});

    MBK_TEST_ASSERT_THROWS(scan(src, dst, "0:200"), StoreError);
    MBK_TEST_ASSERT(dst.exists("0000000100.broken"));
}

MBK_TEST(Scanner, TruncatedBundleIsFatalWithoutMarker) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 0, 100);
    auto data = linked_bundle(100, 100);
    data.resize(data.size() - 3);
    src.put(format_base_number(100), data);

    MBK_TEST_ASSERT_THROWS(scan(src, dst, "0:200"), DecodeError);
    MBK_TEST_ASSERT(markers_in(dst).empty());
}

MBK_TEST(Scanner, ListingFailureIsFatal) {
    MemoryObjectStore src, dst;
    src.fail_listing = true;
    MBK_TEST_ASSERT_THROWS(scan(src, dst, "0:200"), StoreError);
}

MBK_TEST(Scanner, OutOfOrderListingIsOrderingError) {
    FixedOrderStore src;
    MemoryObjectStore dst;
    put_linked_bundles(src, 0, 300, 100);
    src.order = {"0000000000", "0000000200", "0000000100", "0000000300"};

    MBK_TEST_ASSERT_THROWS(scan(src, dst, "0:400"), OrderingError);
    std::set<std::string> expected = {"0000000100.missing"};
    MBK_TEST_ASSERT(markers_in(dst) == expected);
}

MBK_TEST(Scanner, MarkerWriteFailureDoesNotAbort) {
    MemoryObjectStore src, dst;
    src.put(format_base_number(0), linked_bundle(0, 100));
    src.put(format_base_number(200), linked_bundle(200, 100));
    src.put(format_base_number(300), linked_bundle(300, 100));
    dst.fail_writes = true;

    ScanReport r = scan(src, dst, "0:400");
    MBK_TEST_ASSERT_EQ(r.missing, 1u);
    MBK_TEST_ASSERT_EQ(r.marker_write_failures, 1u);
    MBK_TEST_ASSERT(r.markers.empty());
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 3u);
}

MBK_TEST(Scanner, CancellationStopsTheWalk) {
    MemoryObjectStore src, dst;
    put_linked_bundles(src, 0, 300, 100);
    CancelToken cancel;
    cancel.cancel();

    ScanOptions opts;
    opts.range = BlockRange::parse("0:400");
    Scanner s(src, dst, opts, &cancel);
    MBK_TEST_ASSERT_THROWS(s.run(), CancelledError);
}

// =============================================================================
// Components
// =============================================================================

MBK_TEST(Scanner, WalkerSkipsTemporaryAndForeignKeys) {
    MemoryObjectStore src;
    put_linked_bundles(src, 0, 200, 100);
    src.put("0000000100.tmp", {1, 2});
    src.put("0000000100.broken", {});
    src.put("README", {});

    BundleWalker walker(src, 0);
    std::vector<uint64_t> seen;
    walker.walk([&](const BundleIndex& idx, const std::string&) {
        seen.push_back(idx.base_number);
        return true;
    });
    MBK_TEST_ASSERT_EQ(seen.size(), 3u);
    MBK_TEST_ASSERT_EQ(seen[2], 200u);
    MBK_TEST_ASSERT_EQ(walker.skipped(), 3u);
}

MBK_TEST(Scanner, ValidatorSeedsFromFirstParentAndCarriesLastId) {
    MemoryObjectStore src;
    put_linked_bundles(src, 0, 100, 100);

    ChainValidator v;
    ChainState state;
    BundleCheck c = v.check(src, format_base_number(100), state);
    MBK_TEST_ASSERT(!c.broken);
    MBK_TEST_ASSERT_EQ(c.blocks_read, 100u);
    MBK_TEST_ASSERT_EQ(state.last_block_id, std::string("id199"));

    state.last_block_id = "id42";
    c = v.check(src, format_base_number(100), state);
    MBK_TEST_ASSERT(c.broken);
    MBK_TEST_ASSERT(state.last_block_id.empty());
}

MBK_TEST(Scanner, ValidatorRejectsBlocksOutsideBundleSpan) {
    MemoryObjectStore src;
    put_linked_bundles(src, 0, 0, 100);

    ChainState state;
    BundleCheck c = ChainValidator(50).check(src, format_base_number(0), state);
    MBK_TEST_ASSERT(c.failure == BundleCheck::Failure::SPAN);
    MBK_TEST_ASSERT(!c.broken);
    MBK_TEST_ASSERT_EQ(c.blocks_read, 51u);

    state = ChainState();
    c = ChainValidator(100).check(src, format_base_number(0), state);
    MBK_TEST_ASSERT(c.failure == BundleCheck::Failure::NONE);
}

MBK_TEST(Scanner, MarkerWriterLogsEachFinding) {
    MemoryObjectStore dst;
    MarkerWriter w(dst);

    auto& logger = logging::Logger::instance();
    std::vector<std::string> lines;
    logger.set_level(logging::Level::INFO);
    logger.set_console_output(false);
    logger.add_callback([&lines](const logging::LogEntry& e) { lines.push_back(e.message); });

    bool ok = w.write(Marker{700, MarkerKind::Missing});

    logger.clear_callbacks();
    logger.set_console_output(true);
    logger.set_level(logging::Level::WARN);

    MBK_TEST_ASSERT(ok);
    MBK_TEST_ASSERT_EQ(w.written().size(), 1u);
    bool found = false;
    for (const auto& l : lines) {
        if (l.find("found missing file, writing 0000000700.missing") != std::string::npos) found = true;
    }
    MBK_TEST_ASSERT(found);
}

// =============================================================================
// Directory-backed stores
// =============================================================================

MBK_TEST(Scanner, LocalStoreEndToEnd) {
    TempDir src_dir("src"), dst_dir("dst");
    LocalObjectStore src(src_dir.path(), false);
    std::string err;
    for (uint64_t base : {0u, 100u, 300u}) {
        MBK_TEST_ASSERT(src.write(format_base_number(base), linked_bundle(base, 100), err));
    }
    MBK_TEST_ASSERT(!std::filesystem::exists(src_dir.path() + "/0000000000.tmp"));

    // Leftover of an interrupted write
    std::ofstream(src_dir.path() + "/0000000200.tmp") << "partial";

    ScanReport r = check_merged_blocks(src_dir.path(), "file://" + dst_dir.path(), 100,
                                       BlockRange::parse("0:400"));
    MBK_TEST_ASSERT_EQ(r.missing, 1u);
    MBK_TEST_ASSERT_EQ(r.bundles_checked, 3u);
    std::string marker = dst_dir.path() + "/0000000200.missing";
    MBK_TEST_ASSERT(std::filesystem::exists(marker));
    MBK_TEST_ASSERT_EQ(std::filesystem::file_size(marker), 0u);
}

MBK_TEST(Scanner, LocalStoreWalksSortedFromStartKey) {
    TempDir dir("walk");
    LocalObjectStore store(dir.path(), false);
    std::string err;
    for (uint64_t base : {500u, 100u, 400u, 0u, 200u}) {
        MBK_TEST_ASSERT(store.write(format_base_number(base), {1}, err));
    }

    std::vector<std::string> seen;
    store.walk_from("", format_base_number(200), [&](const std::string& key) {
        seen.push_back(key);
        return seen.size() < 2;
    });
    std::vector<std::string> expected = {"0000000200", "0000000400"};
    MBK_TEST_ASSERT(seen == expected);
}

MBK_TEST(Scanner, OpenStoreRejectsUnknownScheme) {
    MBK_TEST_ASSERT_THROWS(open_store("gs://bucket/path"), PreconditionError);
    MBK_TEST_ASSERT_THROWS(open_store(""), PreconditionError);
    MBK_TEST_ASSERT_THROWS(open_store("file://"), PreconditionError);
}

MBK_TEST(Scanner, MissingSourceDirectoryIsStoreError) {
    TempDir dst_dir("dst");
    MBK_TEST_ASSERT_THROWS(check_merged_blocks("/nonexistent/mbk/source", dst_dir.path(), 100,
                                               BlockRange::parse("0:100")),
                           StoreError);
}

} // namespace test
} // namespace mbk
