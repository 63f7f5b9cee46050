/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

/*
 * This test file is for GTest tests which test the internal API: the
 * block manager, page and cell decoding and the B-tree walker.
 *
 * This is in contrast to gtest_tests.cc which runs tests using
 * just the external API.
 */

#include <folly/portability/GTest.h>

#include "wtreadertest.h"

#include <fmt/format.h>
#include <libwtreader/page_cache.h>

#include "src/bson.h"
#include "src/btree.h"
#include "src/cell.h"
#include "src/config_parser.h"
#include "src/crc32.h"
#include "src/exception.h"
#include "src/intpack.h"
#include "src/internal.h"
#include "src/metadata.h"
#include "src/page.h"
#include "src/program_getopt.h"
#include "src/struct_pack.h"

#include <atomic>
#include <limits>

using namespace testing;
using wtreader::BlockAddress;
using wtreader::ChildKind;
using wtreader::Compressor;
using wtreader::PageType;

/// @return the error code of the Exception thrown by call (or success)
template <typename Callable>
static wtreader_error_t error_of(Callable&& call) {
    try {
        call();
    } catch (const wtreader::Exception& e) {
        return e.errcode;
    }
    return WTREADER_SUCCESS;
}

static std::vector<WtRecord> make_records(int count) {
    std::vector<WtRecord> ret;
    for (int ii = 1; ii <= count; ++ii) {
        ret.push_back({wtreader::pack_record_id(ii),
                       "value-" + std::to_string(ii)});
    }
    return ret;
}

TEST_F(WtReaderInternalTest, open_verifies_descriptor) {
    open_file(WtFileBuilder{});
    EXPECT_EQ(WT_BLOCK_MAJOR_VERSION, file.major_version);
    EXPECT_EQ(WT_BLOCK_MINOR_VERSION, file.minor_version);
    EXPECT_EQ(WT_DEFAULT_ALLOCATION_SIZE, file.size);
}

TEST_F(WtReaderInternalTest, open_rejects_foreign_file) {
    std::string content(WT_DEFAULT_ALLOCATION_SIZE, 'x');
    write_file(filePath, content);
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([this] {
                  wtreader::wt_file_open(&file, filePath, &ops, {});
              }));
}

TEST_F(WtReaderInternalTest, open_detects_descriptor_damage) {
    WtFileBuilder builder;
    // Inside the first allocation unit but after the descriptor fields
    builder.corrupt(100);
    EXPECT_EQ(WTREADER_ERROR_CHECKSUM_FAIL,
              error_of([this, &builder] { open_file(builder); }));
}

TEST_F(WtReaderInternalTest, open_short_file) {
    write_file(filePath, std::string(100, '\0'));
    EXPECT_EQ(WTREADER_ERROR_TRUNCATED_FILE, error_of([this] {
                  wtreader::wt_file_open(&file, filePath, &ops, {});
              }));
}

TEST_F(WtReaderInternalTest, open_missing_file) {
    EXPECT_EQ(WTREADER_ERROR_NO_SUCH_FILE, error_of([this] {
                  wtreader::wt_file_open(&file, filePath, &ops, {});
              }));
}

TEST_F(WtReaderInternalTest, open_invalid_allocation_size) {
    WtFileBuilder builder;
    builder.save(filePath);
    wtreader::wt_file_options options;
    options.allocation_size = 1000;
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([this, &options] {
                  wtreader::wt_file_open(&file, filePath, &ops, options);
              }));
}

TEST_F(WtReaderInternalTest, open_fails_in_fileops) {
    WtFileBuilder{}.save(filePath);
    EXPECT_CALL(ops, open(_, _, _, _))
            .WillOnce(Return(WTREADER_ERROR_OPEN_FILE));
    EXPECT_EQ(WTREADER_ERROR_OPEN_FILE, error_of([this] {
                  wtreader::wt_file_open(&file, filePath, &ops, {});
              }));
}

TEST_F(WtReaderInternalTest, read_fails_in_fileops) {
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("a") + value_cell("b"));
    open_file(builder);

    EXPECT_CALL(ops, pread(_, _, _, _, _)).WillOnce(Return(-1));
    EXPECT_EQ(WTREADER_ERROR_READ,
              error_of([this, &address] { read_block(file, address); }));
}

TEST_F(WtReaderInternalTest, read_block) {
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("key") + value_cell("value"));
    open_file(builder);

    EXPECT_EQ(WT_DEFAULT_ALLOCATION_SIZE, address.offset);
    EXPECT_EQ(WT_DEFAULT_ALLOCATION_SIZE, address.size);
    const auto block = wtreader::read_block(file, address);
    EXPECT_EQ(address.size, block.size());
}

TEST_F(WtReaderInternalTest, read_block_validates_address) {
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("key") + value_cell("value"));
    open_file(builder);

    auto wrongChecksum = address;
    wrongChecksum.checksum ^= 1;
    EXPECT_EQ(WTREADER_ERROR_CHECKSUM_FAIL, error_of([&] {
                  wtreader::read_block(file, wrongChecksum);
              }));

    auto wrongSize = address;
    wrongSize.size = 2 * WT_DEFAULT_ALLOCATION_SIZE;
    EXPECT_EQ(WTREADER_ERROR_TRUNCATED_FILE,
              error_of([&] { wtreader::read_block(file, wrongSize); }));

    auto descriptor = address;
    descriptor.offset = 0;
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              error_of([&] { wtreader::read_block(file, descriptor); }));

    auto tiny = address;
    tiny.size = 16;
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              error_of([&] { wtreader::read_block(file, tiny); }));
}

TEST_F(WtReaderInternalTest, read_block_detects_damage) {
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("key") + value_cell("value"));
    // A byte of the padding is covered by the checksum as well
    builder.corrupt(address.offset + 1000);
    open_file(builder);

    EXPECT_EQ(WTREADER_ERROR_CHECKSUM_FAIL,
              error_of([&] { wtreader::read_block(file, address); }));
}

TEST_F(WtReaderInternalTest, header_only_checksum) {
    WtFileBuilder builder;
    builder.setDataChecksum(false);
    const auto first = builder.writePage(
            PageType::RowLeaf, 2, key_cell("key") + value_cell("value"));
    const auto second = builder.writePage(
            PageType::RowLeaf, 2, key_cell("key") + value_cell("value"));
    // Only the first 64 bytes are covered
    builder.corrupt(first.offset + 1000);
    builder.corrupt(second.offset + 10);
    open_file(builder);

    EXPECT_EQ(WTREADER_SUCCESS,
              error_of([&] { wtreader::read_block(file, first); }));
    EXPECT_EQ(WTREADER_ERROR_CHECKSUM_FAIL,
              error_of([&] { wtreader::read_block(file, second); }));
}

TEST(ChecksumTest, crc32c) {
    const std::string data{"123456789"};
    EXPECT_EQ(0xe3069283,
              get_checksum(reinterpret_cast<const uint8_t*>(data.data()),
                           data.size()));
}

TEST(ChecksumTest, checksum_field_is_ignored) {
    std::string block(64, 'a');
    const auto* p = reinterpret_cast<const uint8_t*>(block.data());
    const auto expected = get_block_checksum(p, block.size(), 32);
    block[33] = 'z';
    EXPECT_EQ(expected, get_block_checksum(p, block.size(), 32));
    EXPECT_TRUE(perform_integrity_check(p, block.size(), 32, expected));
    block[40] = 'z';
    EXPECT_FALSE(perform_integrity_check(p, block.size(), 32, expected));
}

TEST(IntPackTest, encodings) {
    std::string out;
    wtreader::vpack_uint(out, 0);
    EXPECT_EQ(std::string("\x80", 1), out);
    out.clear();
    wtreader::vpack_uint(out, 63);
    EXPECT_EQ("\xbf", out);
    out.clear();
    wtreader::vpack_uint(out, 64);
    EXPECT_EQ(std::string("\xc0\x00", 2), out);
    out.clear();
    wtreader::vpack_uint(out, 8256);
    EXPECT_EQ("\xe0", out);
    out.clear();
    wtreader::vpack_uint(out, 8257);
    EXPECT_EQ("\xe1\x01", out);
    out.clear();
    wtreader::vpack_int(out, -1);
    EXPECT_EQ("\x7f", out);
}

TEST(IntPackTest, unpack) {
    for (uint64_t value : {uint64_t(0),
                           uint64_t(63),
                           uint64_t(64),
                           uint64_t(8255),
                           uint64_t(8256),
                           uint64_t(1) << 40,
                           UINT64_MAX}) {
        std::string out;
        wtreader::vpack_uint(out, value);
        const auto* p = reinterpret_cast<const uint8_t*>(out.data());
        const auto* end = p + out.size();
        EXPECT_EQ(value, wtreader::vunpack_uint(p, end));
        EXPECT_EQ(end, p) << "vunpack_uint left bytes behind for " << value;
    }
    for (int64_t value : {int64_t(-1),
                          int64_t(-64),
                          int64_t(-65),
                          int64_t(-10000),
                          INT64_MIN,
                          INT64_MAX}) {
        std::string out;
        wtreader::vpack_int(out, value);
        const auto* p = reinterpret_cast<const uint8_t*>(out.data());
        EXPECT_EQ(value, wtreader::vunpack_int(p, p + out.size()));
    }
}

TEST(IntPackTest, order_preserving) {
    // Collections rely on packed record ids sorting like the numbers
    EXPECT_LT(wtreader::pack_record_id(-5), wtreader::pack_record_id(3));
    EXPECT_LT(wtreader::pack_record_id(63), wtreader::pack_record_id(64));
    EXPECT_LT(wtreader::pack_record_id(8000), wtreader::pack_record_id(9000));
    EXPECT_LT(wtreader::pack_record_id(9000),
              wtreader::pack_record_id(int64_t(1) << 33));
}

TEST(IntPackTest, malformed) {
    const std::string truncated{"\xe3\x01", 2};
    const auto* p = reinterpret_cast<const uint8_t*>(truncated.data());
    EXPECT_EQ(WTREADER_ERROR_MALFORMED_VARINT, error_of([&] {
                  wtreader::vunpack_uint(p, p + truncated.size());
              }));

    const std::string tooLong{"\xe9\x01\x02\x03\x04\x05\x06\x07\x08\x09", 10};
    p = reinterpret_cast<const uint8_t*>(tooLong.data());
    EXPECT_EQ(WTREADER_ERROR_MALFORMED_VARINT, error_of([&] {
                  wtreader::vunpack_uint(p, p + tooLong.size());
              }));

    p = nullptr;
    EXPECT_EQ(WTREADER_ERROR_MALFORMED_VARINT,
              error_of([&] { wtreader::vunpack_uint(p, p); }));
}

TEST(AddressTest, unpack_cookie) {
    WtFileBuilder builder;
    BlockAddress address;
    address.offset = 5 * 4096;
    address.size = 2 * 4096;
    address.checksum = 0xdeadbeef;
    EXPECT_EQ(address,
              wtreader::unpack_address(builder.cookie(address), 4096));
    EXPECT_TRUE(wtreader::unpack_address(builder.cookie({}), 4096).isEmpty());

    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([&] {
                  wtreader::unpack_address(builder.cookie(address) + "x",
                                           4096);
              }));
}

/**
 * Fixture for tests of the page and cell decoders: pages are written to
 * the file and read back
 */
class PageDecodeTest : public WtReaderInternalTest {
protected:
    std::shared_ptr<const wtreader::Page> page(const BlockAddress& address) {
        return wtreader::read_page(file, address, nullptr);
    }

    std::vector<wtreader::Cell> cells(const BlockAddress& address) {
        return wtreader::decode_cells(*page(address), file.options.allocation_size);
    }
};

TEST_F(PageDecodeTest, leaf_page) {
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 4,
            key_cell("apple") + value_cell("red") + key_cell("ricot", 2) +
                    value_cell("orange"));
    open_file(builder);

    const auto leaf = page(address);
    EXPECT_EQ(PageType::RowLeaf, leaf->type);
    EXPECT_EQ(4, leaf->entries);
    EXPECT_FALSE(leaf->compressed);

    const auto decoded = cells(address);
    ASSERT_EQ(4, decoded.size());
    const auto& first = std::get<wtreader::KeyCell>(decoded[0]);
    EXPECT_EQ(0, first.prefix);
    EXPECT_EQ("apple", first.suffix);
    EXPECT_EQ("red", std::get<wtreader::ValueCell>(decoded[1]).data);
    const auto& second = std::get<wtreader::KeyCell>(decoded[2]);
    EXPECT_EQ(2, second.prefix);
    EXPECT_EQ("ricot", second.suffix);
    EXPECT_EQ("orange", std::get<wtreader::ValueCell>(decoded[3]).data);
}

TEST_F(PageDecodeTest, long_cells) {
    const std::string key(100, 'k');
    const std::string suffix(70, 's');
    const std::string value(1000, 'v');
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 4,
            key_cell(key) + value_cell(value) + key_cell(suffix, 3) +
                    value_cell(std::string(64, 'w')));
    open_file(builder);

    const auto decoded = cells(address);
    ASSERT_EQ(4, decoded.size());
    EXPECT_EQ(key, std::get<wtreader::KeyCell>(decoded[0]).suffix);
    EXPECT_EQ(value, std::get<wtreader::ValueCell>(decoded[1]).data);
    EXPECT_EQ(3, std::get<wtreader::KeyCell>(decoded[2]).prefix);
    EXPECT_EQ(suffix, std::get<wtreader::KeyCell>(decoded[2]).suffix);
    EXPECT_EQ(64, std::get<wtreader::ValueCell>(decoded[3]).data.size());
}

TEST_F(PageDecodeTest, time_windows) {
    wtreader::TimeWindow tw;
    tw.start_ts = 100;
    tw.start_txn = 7;
    tw.durable_start_ts = 105;
    tw.stop_ts = 200;
    tw.stop_txn = 9;
    tw.durable_stop_ts = 210;

    wtreader::TimeWindow deleted;
    deleted.stop_txn = 12;

    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 4,
            key_cell("a") + value_cell("old", tw) + key_cell("b") +
                    deleted_cell(deleted));
    open_file(builder);

    const auto decoded = cells(address);
    ASSERT_EQ(4, decoded.size());
    const auto& value = std::get<wtreader::ValueCell>(decoded[1]);
    EXPECT_EQ("old", value.data);
    EXPECT_EQ(100, value.window.start_ts);
    EXPECT_EQ(7, value.window.start_txn);
    EXPECT_EQ(105, value.window.durable_start_ts);
    EXPECT_EQ(200, value.window.stop_ts);
    EXPECT_EQ(9, value.window.stop_txn);
    EXPECT_EQ(210, value.window.durable_stop_ts);
    EXPECT_TRUE(value.window.hasStop());

    const auto& tombstone = std::get<wtreader::DeletedValueCell>(decoded[3]);
    EXPECT_EQ(12, tombstone.window.stop_txn);
    EXPECT_EQ(WT_TS_MAX, tombstone.window.stop_ts);
}

TEST_F(PageDecodeTest, value_copy) {
    const auto first = key_cell("a");
    const auto shared = value_cell("shared value");
    const auto second = key_cell("b");
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 4,
            first + shared + second +
                    value_copy_cell(shared.size() + second.size()));
    open_file(builder);

    const auto decoded = cells(address);
    ASSERT_EQ(4, decoded.size());
    EXPECT_EQ("shared value", std::get<wtreader::ValueCell>(decoded[3]).data);
}

TEST_F(PageDecodeTest, value_copy_outside_page) {
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("a") + value_copy_cell(100));
    open_file(builder);
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([&] { cells(address); }));
}

TEST_F(PageDecodeTest, cell_count_mismatch) {
    WtFileBuilder builder;
    const auto cellData = key_cell("a") + value_cell("b") + key_cell("c");
    const auto tooMany = builder.writePage(PageType::RowLeaf, 4, cellData);
    const auto tooFew = builder.writePage(PageType::RowLeaf, 2, cellData);
    open_file(builder);

    EXPECT_EQ(WTREADER_ERROR_CELL_COUNT_MISMATCH,
              error_of([&] { cells(tooMany); }));
    EXPECT_EQ(WTREADER_ERROR_CELL_COUNT_MISMATCH,
              error_of([&] { cells(tooFew); }));
}

TEST_F(PageDecodeTest, truncated_cell) {
    WtFileBuilder builder;
    // A long value cell claiming more data than the page holds
    std::string cell{char(WT_CELL_VALUE)};
    wtreader::vpack_uint(cell, 500);
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("a") + cell + "short");
    open_file(builder);
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([&] { cells(address); }));
}

TEST_F(PageDecodeTest, unsupported_page_type) {
    WtFileBuilder builder;
    const auto address =
            builder.writePage(PageType::ColumnVariable, 1, value_cell("x"));
    open_file(builder);
    EXPECT_EQ(WTREADER_ERROR_UNSUPPORTED_PAGE_TYPE,
              error_of([&] { page(address); }));
}

TEST_F(PageDecodeTest, encrypted_page) {
    WtFileBuilder builder;
    const auto address = builder.writePage(PageType::RowLeaf,
                                           2,
                                           key_cell("a") + value_cell("b"),
                                           WT_PAGE_ENCRYPTED);
    open_file(builder);
    EXPECT_EQ(WTREADER_ERROR_ENCRYPTED, error_of([&] { page(address); }));
}

TEST_F(PageDecodeTest, overflow_page) {
    const std::string data(10000, 'o');
    WtFileBuilder builder;
    const auto address = builder.writeOverflow(data);
    open_file(builder);

    const auto overflow = page(address);
    EXPECT_EQ(PageType::Overflow, overflow->type);
    EXPECT_EQ(data, overflow->payload());
    EXPECT_EQ(data, wtreader::read_overflow(file, address, nullptr));
}

TEST_F(PageDecodeTest, overflow_reference_to_leaf) {
    WtFileBuilder builder;
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("a") + value_cell("b"));
    open_file(builder);
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([&] {
                  wtreader::read_overflow(file, address, nullptr);
              }));
}

/**
 * Compressed pages are decompressed after the first 64 bytes; run with
 * both block compressors we support
 */
class CompressedPageTest : public PageDecodeTest,
                           public ::testing::WithParamInterface<Compressor> {
};

TEST_P(CompressedPageTest, leaf_page) {
    std::string cellData;
    for (int ii = 0; ii < 50; ++ii) {
        cellData.append(key_cell(fmt::format("key-{:04}", ii)));
        cellData.append(value_cell(std::string(200, char('a' + ii % 26))));
    }

    WtFileBuilder builder(WT_DEFAULT_ALLOCATION_SIZE, GetParam());
    const auto address = builder.writePage(PageType::RowLeaf, 100, cellData);
    open_file(builder);

    // Repetitive data compresses to a single allocation unit
    EXPECT_EQ(WT_DEFAULT_ALLOCATION_SIZE, address.size);
    const auto leaf = page(address);
    EXPECT_TRUE(leaf->compressed);
    EXPECT_EQ(WT_PAGE_HEADER_BYTE_SIZE + cellData.size(), leaf->mem_size);
    EXPECT_EQ(cellData, leaf->payload());

    const auto decoded = cells(address);
    ASSERT_EQ(100, decoded.size());
    EXPECT_EQ("key-0049", std::get<wtreader::KeyCell>(decoded[98]).suffix);
}

TEST_P(CompressedPageTest, small_pages_are_not_compressed) {
    WtFileBuilder builder(WT_DEFAULT_ALLOCATION_SIZE, GetParam());
    const auto address = builder.writePage(
            PageType::RowLeaf, 2, key_cell("a") + value_cell("b"));
    open_file(builder);
    EXPECT_FALSE(page(address)->compressed);
}

TEST_P(CompressedPageTest, damaged_stream) {
    std::string cellData;
    for (int ii = 0; ii < 20; ++ii) {
        cellData.append(key_cell(fmt::format("key-{:04}", ii)));
        cellData.append(value_cell(fmt::format("value-{}", ii)));
    }

    WtFileBuilder builder(WT_DEFAULT_ALLOCATION_SIZE, GetParam());
    builder.setDataChecksum(false);
    const auto address = builder.writePage(PageType::RowLeaf, 40, cellData);
    // The snappy length prefix or the zlib stream header, which aren't
    // covered by the checksum
    builder.corrupt(address.offset + WT_BLOCK_COMPRESS_SKIP);
    open_file(builder);

    const auto errcode = error_of([&] { page(address); });
    EXPECT_TRUE(errcode == WTREADER_ERROR_CORRUPT ||
                errcode == WTREADER_ERROR_DECOMPRESSION_MISMATCH)
            << wtreader_strerror(errcode);
}

TEST_P(CompressedPageTest, compressed_page_without_compressor) {
    std::string cellData;
    for (int ii = 0; ii < 20; ++ii) {
        cellData.append(key_cell(fmt::format("key-{:04}", ii)));
        cellData.append(value_cell(fmt::format("value-{}", ii)));
    }
    WtFileBuilder builder(WT_DEFAULT_ALLOCATION_SIZE, GetParam());
    const auto address = builder.writePage(PageType::RowLeaf, 40, cellData);
    builder.save(filePath);
    wtreader::wt_file_open(&file, filePath, &ops, {});
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([&] { page(address); }));
}

INSTANTIATE_TEST_SUITE_P(Compressors,
                         CompressedPageTest,
                         ::testing::Values(Compressor::Snappy, Compressor::Zlib),
                         [](const ::testing::TestParamInfo<Compressor>& info) {
                             return wtreader::to_string(info.param);
                         });

/**
 * Fixture for the B-tree walker. Trees are written with WtFileBuilder and
 * walked in full with walk().
 */
class TreeWalkerTest : public WtReaderInternalTest {
protected:
    std::vector<wtreader::Record> walk(const BlockAddress& root,
                                       wtreader::ScanOptions options = {}) {
        std::vector<wtreader::Record> ret;
        wtreader::TreeWalker walker(file, root, options, diagnostics);
        wtreader::Record record;
        while (walker.next(record)) {
            ret.push_back(record);
        }
        pagesRead = walker.getPagesRead();
        return ret;
    }

    static std::vector<std::string> values(
            const std::vector<wtreader::Record>& records) {
        std::vector<std::string> ret;
        for (const auto& record : records) {
            ret.push_back(record.value);
        }
        return ret;
    }

    static std::vector<std::string> value_range(int first, int last) {
        std::vector<std::string> ret;
        for (int ii = first; ii <= last; ++ii) {
            ret.push_back("value-" + std::to_string(ii));
        }
        return ret;
    }

    std::vector<wtreader::Diagnostic> diagnostics;
    uint64_t pagesRead{0};
};

TEST_F(TreeWalkerTest, empty_tree) {
    WtFileBuilder builder;
    const auto root = builder.writeTree({});
    open_file(builder);
    EXPECT_TRUE(root.isEmpty());
    EXPECT_TRUE(walk(root).empty());
    EXPECT_EQ(0, pagesRead);
}

TEST_F(TreeWalkerTest, single_leaf) {
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(3));
    open_file(builder);

    EXPECT_EQ(value_range(1, 3), values(walk(root)));
    EXPECT_EQ(1, pagesRead);
    EXPECT_TRUE(diagnostics.empty());
}

/// The walk returns the records in key order whatever the depth of the tree
class TreeDepthTest : public TreeWalkerTest,
                      public ::testing::WithParamInterface<size_t> {};

TEST_P(TreeDepthTest, key_order) {
    TreeShape shape;
    shape.leafEntries = GetParam();
    shape.fanout = 3;

    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(100), shape);
    open_file(builder);

    const auto records = walk(root);
    EXPECT_EQ(value_range(1, 100), values(records));
    EXPECT_EQ(builder.getTreePages(), pagesRead);
    EXPECT_TRUE(diagnostics.empty());
    for (size_t ii = 1; ii < records.size(); ++ii) {
        EXPECT_LT(records[ii - 1].key, records[ii].key);
    }
}

// A single leaf, then trees of three and four levels
INSTANTIATE_TEST_SUITE_P(Depths, TreeDepthTest, ::testing::Values(100, 25, 10));

TEST_F(TreeWalkerTest, prefix_compression) {
    std::vector<WtRecord> records;
    for (const auto* key : {"apple", "apricot", "apricots", "banana", "band"}) {
        records.push_back({key, std::string{"fruit:"} + key});
    }
    WtFileBuilder builder;
    const auto root = builder.writeTree(records);
    open_file(builder);

    const auto walked = walk(root);
    ASSERT_EQ(5, walked.size());
    EXPECT_EQ("apricots", walked[2].key);
    EXPECT_EQ("fruit:apricots", walked[2].value);
    EXPECT_EQ("band", walked[4].key);
}

TEST_F(TreeWalkerTest, empty_values_and_tombstones) {
    wtreader::TimeWindow removed;
    removed.stop_ts = 50;
    WtFileBuilder builder;
    const auto root = builder.writePage(
            PageType::RowLeaf, 5,
            key_cell("a") + key_cell("b") + value_cell("2") + key_cell("c") +
                    deleted_cell(removed));
    open_file(builder);

    const auto records = walk(root);
    ASSERT_EQ(2, records.size());
    EXPECT_EQ("a", records[0].key);
    EXPECT_EQ("", records[0].value);
    EXPECT_EQ("b", records[1].key);
    EXPECT_TRUE(diagnostics.empty());
}

TEST_F(TreeWalkerTest, overflow_values) {
    auto records = make_records(20);
    records[4].value = std::string(20000, 'x');
    records[15].value = std::string(5000, 'y');
    TreeShape shape;
    shape.overflowThreshold = 1000;

    WtFileBuilder builder;
    const auto root = builder.writeTree(records, shape);
    open_file(builder);

    auto walked = walk(root);
    ASSERT_EQ(20, walked.size());
    EXPECT_EQ(records[4].value, walked[4].value);
    EXPECT_EQ(records[15].value, walked[15].value);
    EXPECT_TRUE(walked[4].valueResolved);
    // Overflow pages aren't tree pages
    EXPECT_EQ(1, pagesRead);

    wtreader::ScanOptions options;
    options.resolveOverflow = false;
    walked = walk(root, options);
    ASSERT_EQ(20, walked.size());
    EXPECT_FALSE(walked[4].valueResolved);
    EXPECT_TRUE(walked[4].value.empty());
    EXPECT_TRUE(walked[5].valueResolved);
}

TEST_F(TreeWalkerTest, overflow_keys) {
    const std::string longKey(3000, 'k');
    WtFileBuilder builder;
    const auto overflow = builder.writeOverflow(longKey);
    const auto root = builder.writePage(
            PageType::RowLeaf, 4,
            key_cell("a") + value_cell("1") +
                    overflow_key_cell(builder.cookie(overflow)) +
                    value_cell("2"));
    open_file(builder);

    const auto records = walk(root);
    ASSERT_EQ(2, records.size());
    EXPECT_EQ(longKey, records[1].key);
    EXPECT_EQ("2", records[1].value);
}

TEST_F(TreeWalkerTest, removed_overflow_value) {
    WtFileBuilder builder;
    const auto overflow = builder.writeOverflow(std::string(2000, 'z'));
    const auto root = builder.writePage(
            PageType::RowLeaf, 4,
            key_cell("a") +
                    overflow_value_cell(builder.cookie(overflow), true) +
                    key_cell("b") + value_cell("2"));
    open_file(builder);

    const auto records = walk(root);
    ASSERT_EQ(1, records.size());
    EXPECT_EQ("b", records[0].key);
    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, diagnostics[0].error);
    EXPECT_EQ(overflow, diagnostics[0].address);
}

TEST_F(TreeWalkerTest, damaged_leaf_is_skipped) {
    TreeShape shape;
    shape.leafEntries = 10;
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(50), shape);
    ASSERT_EQ(5, builder.getLeaves().size());
    const auto damaged = builder.getLeaves()[2];
    builder.corrupt(damaged.offset + 100);
    open_file(builder);

    auto expected = value_range(1, 20);
    const auto tail = value_range(31, 50);
    expected.insert(expected.end(), tail.begin(), tail.end());
    EXPECT_EQ(expected, values(walk(root)));

    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(WTREADER_ERROR_CHECKSUM_FAIL, diagnostics[0].error);
    EXPECT_EQ(damaged, diagnostics[0].address);
    EXPECT_EQ(filePath, diagnostics[0].file);
}

TEST_F(TreeWalkerTest, damaged_leaf_strict) {
    TreeShape shape;
    shape.leafEntries = 10;
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(50), shape);
    builder.corrupt(builder.getLeaves()[2].offset + 100);
    open_file(builder);

    wtreader::ScanOptions options;
    options.tolerateCorruption = false;
    wtreader::TreeWalker walker(file, root, options, diagnostics);
    wtreader::Record record;
    int count = 0;
    EXPECT_EQ(WTREADER_ERROR_CHECKSUM_FAIL, error_of([&] {
                  while (walker.next(record)) {
                      ++count;
                  }
              }));
    EXPECT_EQ(20, count);
}

TEST_F(TreeWalkerTest, damaged_root) {
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(10));
    builder.corrupt(root.offset + 50);
    open_file(builder);

    EXPECT_TRUE(walk(root).empty());
    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(root, diagnostics[0].address);
}

TEST_F(TreeWalkerTest, child_referenced_twice) {
    WtFileBuilder builder;
    const auto leaf = builder.writeTree(make_records(5));
    const auto cookie = builder.cookie(leaf);
    const auto root = builder.writePage(
            PageType::RowInternal, 4,
            key_cell("") + child_cell(ChildKind::Leaf, cookie) +
                    key_cell("\xff") + child_cell(ChildKind::Leaf, cookie));
    open_file(builder);

    EXPECT_EQ(value_range(1, 5), values(walk(root)));
    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(WTREADER_ERROR_CORRUPT_TREE, diagnostics[0].error);
}

TEST_F(TreeWalkerTest, child_kind_mismatch) {
    WtFileBuilder builder;
    const auto leaf = builder.writeTree(make_records(5));
    const auto root = builder.writePage(
            PageType::RowInternal, 2,
            key_cell("") +
                    child_cell(ChildKind::Internal, builder.cookie(leaf)));
    open_file(builder);

    EXPECT_TRUE(walk(root).empty());
    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, diagnostics[0].error);
    EXPECT_EQ(leaf, diagnostics[0].address);
}

TEST_F(TreeWalkerTest, deleted_child_is_skipped) {
    WtFileBuilder builder;
    const auto left = builder.writeTree(make_records(5));
    std::vector<WtRecord> more{{wtreader::pack_record_id(6), "value-6"}};
    const auto right = builder.writeTree(more);
    const auto root = builder.writePage(
            PageType::RowInternal, 4,
            key_cell("") + child_cell(ChildKind::Leaf, builder.cookie(left)) +
                    key_cell(more[0].key) +
                    child_cell(ChildKind::Deleted, builder.cookie(right)));
    open_file(builder);

    EXPECT_EQ(value_range(1, 5), values(walk(root)));
    EXPECT_TRUE(diagnostics.empty());
    EXPECT_EQ(2, pagesRead);
}

TEST_F(TreeWalkerTest, too_deep) {
    WtFileBuilder builder;
    auto address = builder.writeTree(make_records(1));
    auto kind = ChildKind::Leaf;
    for (int ii = 0; ii <= WT_MAX_TREE_DEPTH; ++ii) {
        address = builder.writePage(
                PageType::RowInternal, 2,
                key_cell("") + child_cell(kind, builder.cookie(address)));
        kind = ChildKind::Internal;
    }
    open_file(builder);

    EXPECT_TRUE(walk(address).empty());
    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(WTREADER_ERROR_CORRUPT_TREE, diagnostics[0].error);
}

TEST_F(TreeWalkerTest, keys_out_of_order) {
    WtFileBuilder builder;
    const auto root = builder.writePage(
            PageType::RowLeaf, 4,
            key_cell("b") + value_cell("1") + key_cell("a") + value_cell("2"));
    open_file(builder);

    // The records are still returned
    EXPECT_EQ(2, walk(root).size());
    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(WTREADER_ERROR_CORRUPT_TREE, diagnostics[0].error);
}

TEST_F(TreeWalkerTest, cancel) {
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(10));
    open_file(builder);

    std::atomic<bool> cancel{true};
    wtreader::ScanOptions options;
    options.cancel = &cancel;
    EXPECT_EQ(WTREADER_ERROR_CANCEL, error_of([&] { walk(root, options); }));
    EXPECT_TRUE(diagnostics.empty());
}

TEST_F(TreeWalkerTest, seek) {
    TreeShape shape;
    shape.leafEntries = 10;
    shape.fanout = 3;
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(100), shape);
    open_file(builder);

    wtreader::ScanOptions options;
    for (int id : {1, 10, 11, 57, 100}) {
        const auto record = wtreader::btree_seek(
                file, root, wtreader::pack_record_id(id), options, diagnostics);
        ASSERT_TRUE(record) << "record " << id;
        EXPECT_EQ("value-" + std::to_string(id), record->value);
    }
    for (int id : {0, 101, -3}) {
        EXPECT_FALSE(wtreader::btree_seek(file,
                                          root,
                                          wtreader::pack_record_id(id),
                                          options,
                                          diagnostics));
    }
    EXPECT_TRUE(diagnostics.empty());
}

TEST_F(TreeWalkerTest, seek_reads_one_path) {
    TreeShape shape;
    shape.leafEntries = 10;
    shape.fanout = 3;
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(100), shape);
    open_file(builder);

    // Depth 4: root, two internal levels, leaf
    EXPECT_CALL(ops, pread(_, _, _, _, _)).Times(4);
    wtreader::ScanOptions options;
    EXPECT_TRUE(wtreader::btree_seek(
            file, root, wtreader::pack_record_id(42), options, diagnostics));
}

TEST_F(TreeWalkerTest, page_cache) {
    TreeShape shape;
    shape.leafEntries = 10;
    WtFileBuilder builder;
    const auto root = builder.writeTree(make_records(50), shape);
    open_file(builder);

    wtreader::PageCache cache(100);
    wtreader::ScanOptions options;
    options.cache = &cache;
    EXPECT_EQ(value_range(1, 50), values(walk(root, options)));
    EXPECT_EQ(builder.getTreePages(), cache.size());
    EXPECT_EQ(builder.getTreePages(), cache.getMisses());

    // All pages come from the cache the second time
    EXPECT_CALL(ops, pread(_, _, _, _, _)).Times(0);
    EXPECT_EQ(value_range(1, 50), values(walk(root, options)));
    EXPECT_EQ(builder.getTreePages(), cache.getHits());
}

TEST(PageCacheTest, evicts_least_recently_used) {
    wtreader::PageCache cache(2);
    auto page = std::make_shared<const wtreader::Page>();
    BlockAddress a{4096, 4096, 1};
    BlockAddress b{8192, 4096, 2};
    BlockAddress c{12288, 4096, 3};

    cache.insert("f.wt", a, page);
    cache.insert("f.wt", b, page);
    EXPECT_TRUE(cache.find("f.wt", a));
    cache.insert("f.wt", c, page);

    EXPECT_EQ(2, cache.size());
    EXPECT_TRUE(cache.find("f.wt", a));
    EXPECT_FALSE(cache.find("f.wt", b));
    EXPECT_TRUE(cache.find("f.wt", c));
    // Same offset in another file, or another checksum, is another page
    EXPECT_FALSE(cache.find("g.wt", a));
    EXPECT_FALSE(cache.find("f.wt", BlockAddress{4096, 4096, 9}));
}

TEST(ConfigTest, parse) {
    const auto config = wtreader::ConfigMap::from_string(
            "key_format=q, value_format=u,app_metadata=(formatVersion=1),"
            "checkpoint=(WiredTigerCheckpoint.3=(addr=\"01c0\",order=3)),"
            "columns=[a,b],readonly,key_format=S");
    EXPECT_EQ("q", config.getString("key_format"));
    EXPECT_EQ("u", config.getString("value_format"));
    EXPECT_EQ("formatVersion=1", config.getString("app_metadata"));
    EXPECT_EQ(1, *config.getMap("app_metadata").getUint64("formatVersion"));
    EXPECT_EQ("a,b", config.getString("columns"));
    EXPECT_EQ("true", config.getString("readonly"));
    EXPECT_FALSE(config.contains("collator"));
    EXPECT_EQ("none", config.getString("collator", "none"));
    EXPECT_TRUE(config.getMap("collator").items().empty());

    const auto checkpoint = config.getMap("checkpoint")
                                    .getMap("WiredTigerCheckpoint.3");
    EXPECT_EQ("01c0", checkpoint.getString("addr"));
    EXPECT_EQ(3, *checkpoint.getUint64("order"));
}

TEST(ConfigTest, quoted_strings) {
    const auto config = wtreader::ConfigMap::from_string(
            R"cfg(name="a,b=(c)",escaped="x\"y",nested=(v="("))cfg");
    EXPECT_EQ("a,b=(c)", config.getString("name"));
    EXPECT_EQ("x\"y", config.getString("escaped"));
    EXPECT_EQ("(", config.getMap("nested").getString("v"));
}

TEST(ConfigTest, malformed) {
    for (const char* text : {"a=(b", "a=b)", "a=\"b", "=b", "a=(b]"}) {
        EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([text] {
                      (void)wtreader::ConfigMap::from_string(text);
                  })) << text;
    }
    const auto config = wtreader::ConfigMap::from_string("order=x");
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              error_of([&config] { (void)config.getUint64("order"); }));
}

TEST(ConfigTest, sizes) {
    EXPECT_EQ(512, wtreader::parse_size("512"));
    EXPECT_EQ(512, wtreader::parse_size("512B"));
    EXPECT_EQ(4096, wtreader::parse_size("4KB"));
    EXPECT_EQ(4096, wtreader::parse_size("4k"));
    EXPECT_EQ(32ULL << 20, wtreader::parse_size("32MB"));
    EXPECT_EQ(1ULL << 30, wtreader::parse_size("1GB"));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              error_of([] { (void)wtreader::parse_size("4XB"); }));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              error_of([] { (void)wtreader::parse_size("KB"); }));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              error_of([] { (void)wtreader::parse_size("99999999999TB"); }));
}

TEST(TurtleTest, parse) {
    const auto turtle = wtreader::parse_turtle(
            "WiredTiger version string\n"
            "WiredTiger 11.2.0: (July 10, 2023)\n"
            "WiredTiger version\n"
            "major=11,minor=2,patch=0\n"
            "file:WiredTiger.wt\n"
            "allocation_size=4KB,checkpoint=()\n",
            "WiredTiger.turtle");
    EXPECT_EQ(11, turtle.major);
    EXPECT_EQ(2, turtle.minor);
    EXPECT_EQ(0, turtle.patch);
    EXPECT_EQ("allocation_size=4KB,checkpoint=()", turtle.metadataConfig);
    EXPECT_EQ(3, turtle.entries.size());
}

TEST(TurtleTest, errors) {
    auto parse = [](std::string content) {
        return error_of([&content] {
            (void)wtreader::parse_turtle(content, "WiredTiger.turtle");
        });
    };
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, parse("WiredTiger version\n"));
    EXPECT_EQ(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION,
              parse("file:WiredTiger.wt\nallocation_size=4KB\n"));
    EXPECT_EQ(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION,
              parse("WiredTiger version\nmajor=1,minor=0,patch=0\n"
                    "file:WiredTiger.wt\nallocation_size=4KB\n"));
    EXPECT_EQ(WTREADER_ERROR_NO_BOOTSTRAP,
              parse("WiredTiger version\nmajor=10,minor=0,patch=2\n"));
}

TEST(FileMetadataTest, most_recent_checkpoint) {
    WtFileBuilder builder(512);
    const auto first = builder.writePage(
            PageType::RowLeaf, 2, key_cell("a") + value_cell("1"));
    const auto second = builder.writePage(
            PageType::RowLeaf, 2, key_cell("b") + value_cell("2"));

    const auto meta = wtreader::parse_file_metadata(fmt::format(
            "allocation_size=512,block_compressor=zlib,"
            "checkpoint=(WiredTigerCheckpoint.2=(addr=\"{}\",order=2),"
            "WiredTigerCheckpoint.1=(addr=\"{}\",order=1)),"
            "key_format=q,value_format=u",
            builder.checkpointCookie(second),
            builder.checkpointCookie(first)));
    EXPECT_EQ(second, meta.root);
    EXPECT_EQ("WiredTigerCheckpoint.2", meta.checkpoint);
    EXPECT_EQ(512, meta.allocationSize);
    EXPECT_EQ("zlib", meta.blockCompressor);
}

TEST(FileMetadataTest, defaults_and_errors) {
    const auto empty = wtreader::parse_file_metadata("key_format=q");
    EXPECT_TRUE(empty.root.isEmpty());
    EXPECT_EQ(WT_DEFAULT_ALLOCATION_SIZE, empty.allocationSize);
    EXPECT_TRUE(empty.blockCompressor.empty());

    EXPECT_TRUE(wtreader::parse_checkpoint_cookie("", 4096).isEmpty());
    EXPECT_EQ(WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION, error_of([] {
                  (void)wtreader::parse_checkpoint_cookie("02818181", 4096);
              }));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, error_of([] {
                  (void)wtreader::parse_file_metadata("allocation_size=0");
              }));
}

TEST(StructPackTest, unpack) {
    std::string data;
    wtreader::vpack_int(data, -7);
    data.append("abc", 4);
    wtreader::vpack_uint(data, 2);
    data.append("hi");
    data.push_back(char(0x85));
    data.append("tail");

    const auto values = wtreader::unpack_struct(data, "qSubu");
    ASSERT_EQ(5, values.size());
    EXPECT_EQ(wtreader::PackedValue{int64_t(-7)}, values[0]);
    EXPECT_EQ(wtreader::PackedValue{std::string("abc")}, values[1]);
    EXPECT_EQ(wtreader::PackedValue{std::string("hi")}, values[2]);
    EXPECT_EQ(wtreader::PackedValue{int64_t(5)}, values[3]);
    // A trailing raw column takes the rest of the data
    EXPECT_EQ(wtreader::PackedValue{std::string("tail")}, values[4]);
}

TEST(StructPackTest, counts) {
    EXPECT_EQ(2, wtreader::count_columns("2q"));
    EXPECT_EQ("qS", wtreader::column_types("xqS"));
    EXPECT_EQ("s", wtreader::column_types("5s"));

    std::string data = "pad";
    wtreader::vpack_int(data, 1);
    wtreader::vpack_int(data, 2);
    const auto values = wtreader::unpack_struct(data, "3x2q");
    ASSERT_EQ(2, values.size());
    EXPECT_EQ(wtreader::PackedValue{int64_t(2)}, values[1]);

    const auto fixed = wtreader::unpack_struct(std::string("ab\0\0", 4), "4S");
    EXPECT_EQ(wtreader::PackedValue{std::string("ab")}, fixed.front());
}

TEST(StructPackTest, malformed) {
    auto unpack = [](std::string data, std::string format) {
        return error_of([&data, &format] {
            (void)wtreader::unpack_struct(data, format);
        });
    };
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, unpack("abc", "S"));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, unpack("ab", "3s"));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, unpack("abcd", "3s"));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, unpack("a", "5"));
    EXPECT_EQ(WTREADER_ERROR_NOT_SUPPORTED, unpack("a", "z"));
    EXPECT_EQ(WTREADER_ERROR_MALFORMED_VARINT, unpack("\xe8\x01", "q"));
}

TEST(BsonTest, all_types) {
    std::string decimal;
    append_le64(decimal, 15);
    append_le64(decimal, 0x303E000000000000ULL);
    std::string code;
    append_le32(code, 5);
    code.append("f()", 4);
    code.insert(code.size() - 1, "x");

    BsonBuilder doc;
    doc.appendDouble("nan", std::numeric_limits<double>::quiet_NaN());
    doc.appendDate("before", -1);
    doc.appendDate("day", 86400000);
    doc.appendRaw(0x13, "dec", decimal);
    doc.appendRaw(0x0b, "re", std::string("^a\0i\0", 5));
    doc.appendRaw(0x0d, "js", code);
    doc.appendRaw(0x06, "undef", "");

    const auto document = wtreader::decode_bson(doc.finish());
    ASSERT_EQ(7, document.size());
    EXPECT_EQ("f()x", document.find("js")->get<wtreader::JavaScript>().code);
    EXPECT_EQ(wtreader::BsonType::Decimal128, document.find("dec")->type());
    EXPECT_EQ(
            R"({"nan":{"$numberDouble":"NaN"},)"
            R"("before":{"$date":{"$numberLong":"-1"}},)"
            R"("day":{"$date":"1970-01-02T00:00:00.000Z"},)"
            R"("dec":{"$numberDecimal":"1.5"},)"
            R"("re":{"$regularExpression":{"pattern":"^a","options":"i"}},)"
            R"("js":{"$code":"f()x"},"undef":{"$undefined":true}})",
            wtreader::to_json(document).dump());
}

TEST(BsonTest, wide_decimal) {
    auto decimal = [](uint64_t high, uint64_t low) {
        std::string bytes;
        append_le64(bytes, low);
        append_le64(bytes, high);
        BsonBuilder doc;
        doc.appendRaw(0x13, "d", bytes);
        return wtreader::to_json(wtreader::decode_bson(doc.finish()))["d"]
                                ["$numberDecimal"]
                                        .get<std::string>();
    };

    // 2^64
    EXPECT_EQ("18446744073709551616", decimal(0x3040000000000001ULL, 0));
    // 10^34 - 1, the largest canonical significand
    EXPECT_EQ(std::string(34, '9'),
              decimal(0x3041ed09bead87c0ULL, 0x378d8e63ffffffffULL));
    // Larger significands are non-canonical and read as zero
    EXPECT_EQ("0", decimal(0x3041ed09bead87c0ULL, 0x378d8e6400000000ULL));
    EXPECT_EQ("-1.5", decimal(0xb03e000000000000ULL, 15));
}

TEST(BsonTest, malformed) {
    auto decode = [](const std::string& bytes) {
        return error_of([&bytes] { (void)wtreader::decode_bson(bytes); });
    };

    auto valid = BsonBuilder().appendInt32("a", 1).finish();
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, decode(valid.substr(0, 4)));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, decode(valid + "x"));
    auto truncated = valid.substr(0, valid.size() - 3);
    truncated[0] = char(truncated.size());
    EXPECT_EQ(WTREADER_ERROR_CORRUPT, decode(truncated));

    std::string unterminated;
    append_le32(unterminated, 2);
    unterminated.append("ab");
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              decode(BsonBuilder().appendRaw(0x02, "s", unterminated).finish()));
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              decode(BsonBuilder().appendRaw(0x08, "b", "\x02").finish()));
    EXPECT_EQ(WTREADER_ERROR_UNKNOWN_FIELD_TYPE,
              decode(BsonBuilder()
                             .appendRaw(0x0c, "dbref", std::string(17, 'x'))
                             .finish()));
}

TEST(BsonTest, nesting_limit) {
    BsonBuilder inner;
    inner.appendInt32("leaf", 1);
    for (int ii = 0; ii < 150; ++ii) {
        BsonBuilder outer;
        outer.appendDocument("d", inner);
        inner = outer;
    }
    EXPECT_EQ(WTREADER_ERROR_CORRUPT,
              error_of([&inner] { (void)wtreader::decode_bson(inner.finish()); }));
}

TEST(ProgramOptionsTest, numeric_values) {
    EXPECT_EQ(10, wtreader::parse_unsigned_option("10").value_or(0));
    EXPECT_EQ(UINT64_MAX,
              wtreader::parse_unsigned_option("18446744073709551615")
                      .value_or(0));
    EXPECT_EQ(-3, wtreader::parse_signed_option("-3").value_or(0));
    EXPECT_EQ(42, wtreader::parse_signed_option("42").value_or(0));

    for (const char* bad :
         {"", "ten", "5x", " 5", "-1", "+1", "18446744073709551616"}) {
        EXPECT_FALSE(wtreader::parse_unsigned_option(bad)) << bad;
    }
    for (const char* bad : {"", "id", "7.5", "9223372036854775808"}) {
        EXPECT_FALSE(wtreader::parse_signed_option(bad)) << bad;
    }
}
