#include "patch-builder.hxx"

#include <zipatch-reader/entry-table.hxx>
#include <zipatch-reader/entry.hxx>
#include <zipatch-reader/error.hxx>
#include <zipatch-reader/inflate.hxx>
#include <zipatch-reader/sha1.hxx>

#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace zr = zipatch_reader;
using namespace zipatch_test;

namespace {
zr::Errc error_of(const std::function<void()> &action) {
  try {
    action();
  } catch (const zr::ZipatchError &e) {
    return e.code();
  }
  ADD_FAILURE() << "no ZipatchError thrown";
  return zr::Errc::IoError;
}

zr::Entry entry_from(const std::string &path,
                     const std::vector<TestChunk> &chunks) {
  const auto payload = entry_payload(path, chunks);
  return zr::parse_entry(payload.data(), payload.size());
}

/**
 * @brief Fixture with a scratch output root and a quiet logger.
 */
class ApplyEntryTest : public ::testing::Test {
protected:
  ApplyEntryTest() : log(zr::Severity::error) {
    options.output_root = scratch.path();
  }

  ScratchDir scratch;
  zr::Options options;
  zr::Logger log;
};
} // unnamed namespace

TEST(EntryParser, DecodesPathAndChunks) {
  auto first = stored_chunk("abc");
  first.prev_size = 11;
  TestChunk second;
  second.mode = zr::ChunkMode::Add;
  second.compression = zr::CompressionMode::Zlib;
  second.data = zlib_compress("defdefdef");
  second.next_size = 9;

  const auto entry = entry_from("sqpack/ffxiv/data.dat", {first, second});
  EXPECT_EQ(entry.path, "sqpack/ffxiv/data.dat");
  ASSERT_EQ(entry.chunks.size(), 2u);
  EXPECT_EQ(entry.mode(), zr::ChunkMode::Add);

  const auto &c0 = entry.chunks[0];
  EXPECT_EQ(c0.compression, zr::CompressionMode::None);
  EXPECT_EQ(c0.declared_size, 3u);
  EXPECT_EQ(c0.prev_size, 11u);
  EXPECT_EQ(c0.next_hash, digest_of("abc"));
  EXPECT_EQ(std::string(c0.data.begin(), c0.data.end()), "abc");

  const auto &c1 = entry.chunks[1];
  EXPECT_EQ(c1.compression, zr::CompressionMode::Zlib);
  EXPECT_EQ(c1.declared_size, second.data.size());
  EXPECT_EQ(c1.next_size, 9u);
}

/**
 * @brief Chunks are a 60-byte header (size field at offset 48) followed
 * directly by their data, so consecutive chunks sit back to back.
 */
TEST(EntryParser, ChunkHeaderIsSixtyBytes) {
  EXPECT_EQ(zr::chunk_header_size, 60u);

  const auto digest = digest_of("hello");
  std::string header("A\0\0\0", 4);
  header += std::string(20, '\0');
  header.append(digest.begin(), digest.end());
  header += std::string("N\0\0\0", 4);
  header += be32(5) + be32(0) + be32(5);
  ASSERT_EQ(header.size(), 60u);
  ASSERT_EQ(header.substr(48, 4), be32(5));

  const auto payload = be32(10) + "test/path1" + be32(2) + header + "hello" +
                       header + "hello";
  ASSERT_EQ(payload.size(), 4u + 10 + 4 + 2 * (60 + 5));

  const auto entry = zr::parse_entry(payload.data(), payload.size());
  EXPECT_EQ(entry.path, "test/path1");
  ASSERT_EQ(entry.chunks.size(), 2u);
  for (const auto &chunk : entry.chunks) {
    EXPECT_EQ(chunk.mode, zr::ChunkMode::Add);
    EXPECT_EQ(chunk.compression, zr::CompressionMode::None);
    EXPECT_EQ(chunk.declared_size, 5u);
    EXPECT_EQ(chunk.next_size, 5u);
    EXPECT_EQ(chunk.next_hash, digest);
    EXPECT_EQ(std::string(chunk.data.begin(), chunk.data.end()), "hello");
  }
}

TEST(EntryParser, WireConstantsMapToModes) {
  EXPECT_EQ(zr::chunk_mode_from_wire(0x41000000), zr::ChunkMode::Add);
  EXPECT_EQ(zr::chunk_mode_from_wire(0x44000000), zr::ChunkMode::Delete);
  EXPECT_EQ(zr::chunk_mode_from_wire(0x4D000000), zr::ChunkMode::Modify);
  EXPECT_EQ(zr::chunk_mode_from_wire(0x41), zr::ChunkMode::Unknown);
  EXPECT_EQ(zr::compression_mode_from_wire(0x4E000000),
            zr::CompressionMode::None);
  EXPECT_EQ(zr::compression_mode_from_wire(0x5A000000),
            zr::CompressionMode::Zlib);
  EXPECT_EQ(zr::compression_mode_from_wire(0), zr::CompressionMode::Unknown);
}

TEST(EntryParser, RejectsOversizedPath) {
  const auto payload = be32(1025);
  EXPECT_EQ(error_of([&] {
              zr::parse_entry(payload.data(), payload.size());
            }),
            zr::Errc::PathSizeTooLarge);

  const std::string longest(1024, 'p');
  const auto ok = entry_payload(longest, {});
  EXPECT_EQ(zr::parse_entry(ok.data(), ok.size()).path, longest);
}

TEST(EntryParser, DeclaredSizeBeyondPayloadIsTruncation) {
  auto chunk = stored_chunk("abc");
  chunk.declared_size = 100;
  const auto payload = entry_payload("file", {chunk});
  EXPECT_EQ(error_of([&] {
              zr::parse_entry(payload.data(), payload.size());
            }),
            zr::Errc::UnexpectedEndOfFile);
}

TEST(EntryParser, ImpossibleChunkCountIsTruncation) {
  const auto payload = path_payload("file") + be32(0xFFFFFFFF);
  EXPECT_EQ(error_of([&] {
              zr::parse_entry(payload.data(), payload.size());
            }),
            zr::Errc::UnexpectedEndOfFile);
}

TEST(ChunkDecoder, InflatesZlibChunks) {
  const std::string content(5000, 'z');
  zr::Chunk chunk;
  chunk.compression = zr::CompressionMode::Zlib;
  const auto compressed = zlib_compress(content);
  chunk.data.assign(compressed.begin(), compressed.end());
  chunk.next_size = static_cast<std::uint32_t>(content.size());

  zr::Logger log(zr::Severity::error);
  const auto out = zr::decode_chunk_data(chunk, log);
  EXPECT_EQ(std::string(out.begin(), out.end()), content);
}

/**
 * @brief next_size only bounds the output; storage follows the bytes the
 * DEFLATE stream really produces.
 */
TEST(ChunkDecoder, OversizedNextSizeInflatesAvailableData) {
  std::string content;
  for (int i = 0; i < 1000; ++i)
    content += "block " + std::to_string(i) + ";";
  zr::Chunk chunk;
  chunk.compression = zr::CompressionMode::Zlib;
  const auto compressed = zlib_compress(content);
  chunk.data.assign(compressed.begin(), compressed.end());
  chunk.next_size = 0xFFFFFFFF;

  zr::Logger log(zr::Severity::fatal);
  const auto out = zr::decode_chunk_data(chunk, log);
  EXPECT_EQ(std::string(out.begin(), out.end()), content);
}

TEST(Inflate, StopsAtExpectedSize) {
  const std::string content(200000, 'q');
  const auto compressed = zlib_compress(content);
  const auto out =
      zr::inflate_zlib_chunk(compressed.data(), compressed.size(), 70000);
  EXPECT_EQ(std::string(out.begin(), out.end()), content.substr(0, 70000));
}

TEST(ChunkDecoder, CorruptZlibFallsBackToRawBytes) {
  const std::string raw = std::string("\x78\x9C", 2) + "not deflate data" +
                          std::string(4, '\0');
  zr::Chunk chunk;
  chunk.compression = zr::CompressionMode::Zlib;
  chunk.data.assign(raw.begin(), raw.end());
  chunk.next_size = 64;

  zr::Logger log(zr::Severity::fatal);
  const auto out = zr::decode_chunk_data(chunk, log);
  EXPECT_EQ(std::string(out.begin(), out.end()), raw);
}

TEST(ChunkDecoder, UnknownCompressionThrows) {
  zr::Chunk chunk;
  chunk.compression = zr::CompressionMode::Unknown;
  chunk.data = {'x'};
  zr::Logger log(zr::Severity::fatal);
  EXPECT_EQ(error_of([&] { zr::decode_chunk_data(chunk, log); }),
            zr::Errc::UnknownCompressionMode);
}

TEST(Inflate, RejectsTooShortInput) {
  EXPECT_EQ(error_of([] { zr::inflate_zlib_chunk("\x78\x9C\x01", 3, 1); }),
            zr::Errc::DecompressionFailed);
}

TEST(Sha1, KnownDigestAndHex) {
  const auto digest = digest_of("abc");
  EXPECT_EQ(zr::to_hex(digest), "A9993E364706816ABA3E25717850C26C9CD0D89D");
  EXPECT_FALSE(zr::is_zero_digest(digest));
  EXPECT_TRUE(zr::is_zero_digest(zr::Sha1Digest{}));

  zr::Sha1 incremental;
  incremental.update("a", 1);
  incremental.update("bc", 2);
  EXPECT_EQ(incremental.finish(), digest);
}

TEST(Sha1, MissingFileIsIoError) {
  EXPECT_EQ(error_of([] { zr::sha1_file("/nonexistent/zipatch/file"); }),
            zr::Errc::IoError);
}

TEST_F(ApplyEntryTest, AddWritesFileAndVerifiesHash) {
  const auto entry = entry_from("test/path1", {stored_chunk("hello world")});
  zr::apply_entry(entry, options, log);

  const auto written = scratch / "test" / "path1";
  ASSERT_TRUE(fs::is_regular_file(written));
  EXPECT_EQ(read_file(written), "hello world");
}

TEST_F(ApplyEntryTest, LeadingSeparatorStaysInsideOutputRoot) {
  const auto entry = entry_from("/abs/file", {stored_chunk("x")});
  zr::apply_entry(entry, options, log);
  EXPECT_EQ(read_file(scratch / "abs" / "file"), "x");
}

TEST_F(ApplyEntryTest, PathAboveOutputRootIsRejected) {
  const auto root = scratch / "out";
  options.output_root = root;
  EXPECT_EQ(error_of([&] {
              zr::apply_entry(entry_from("../escape.txt", {stored_chunk("x")}),
                              options, log);
            }),
            zr::Errc::UnsafePath);
  EXPECT_FALSE(fs::exists(scratch / "escape.txt"));

  write_file(scratch / "keep.txt", "mine");
  TestChunk remove;
  remove.mode = zr::ChunkMode::Delete;
  EXPECT_EQ(error_of([&] {
              zr::apply_entry(entry_from("sub/../../keep.txt", {remove}),
                              options, log);
            }),
            zr::Errc::UnsafePath);
  EXPECT_EQ(read_file(scratch / "keep.txt"), "mine");
}

TEST_F(ApplyEntryTest, UnopenableOutputIsIoError) {
  fs::create_directories(scratch / "target");
  EXPECT_EQ(error_of([&] {
              zr::apply_entry(entry_from("target", {stored_chunk("data")}),
                              options, log);
            }),
            zr::Errc::IoError);
  EXPECT_TRUE(fs::is_directory(scratch / "target"));
}

TEST_F(ApplyEntryTest, ConcatenatesChunksAndChecksLastHash) {
  auto first = stored_chunk("abc");
  first.next_hash = {};
  auto second = stored_chunk("def");
  second.next_hash = digest_of("abcdef");
  TestChunk compressed;
  compressed.compression = zr::CompressionMode::Zlib;
  compressed.data = zlib_compress("ghi");
  compressed.next_size = 3;
  compressed.next_hash = digest_of("abcdefghi");

  zr::apply_entry(entry_from("multi.bin", {first, second, compressed}),
                  options, log);
  EXPECT_EQ(read_file(scratch / "multi.bin"), "abcdefghi");
}

TEST_F(ApplyEntryTest, HashMismatchKeepsWrittenFile) {
  auto chunk = stored_chunk("hello");
  chunk.next_hash = digest_of("something else");
  const auto entry = entry_from("bad/hash.txt", {chunk});

  try {
    zr::apply_entry(entry, options, log);
    FAIL() << "corrupted hash accepted";
  } catch (const zr::ZipatchError &e) {
    EXPECT_EQ(e.code(), zr::Errc::HashVerificationFailed);
    EXPECT_NE(std::string(e.what()).find(zr::to_hex(chunk.next_hash)),
              std::string::npos);
  }
  EXPECT_EQ(read_file(scratch / "bad" / "hash.txt"), "hello");
}

TEST_F(ApplyEntryTest, EmptyFileMatchesZeroHash) {
  TestChunk empty;
  const auto entry = entry_from("empty.dat", {empty});
  zr::apply_entry(entry, options, log);
  EXPECT_TRUE(fs::exists(scratch / "empty.dat"));
  EXPECT_EQ(fs::file_size(scratch / "empty.dat"), 0u);
}

TEST_F(ApplyEntryTest, EntryWithoutChunksIsSkipped) {
  zr::apply_entry(entry_from("nothing", {}), options, log);
  EXPECT_FALSE(fs::exists(scratch / "nothing"));
}

TEST_F(ApplyEntryTest, ModifyReplacesVerifiedContent) {
  write_file(scratch / "game" / "data.bin", "old content");
  auto chunk = stored_chunk("new content", zr::ChunkMode::Modify);
  chunk.prev_hash = digest_of("old content");

  zr::apply_entry(entry_from("game/data.bin", {chunk}), options, log);
  EXPECT_EQ(read_file(scratch / "game" / "data.bin"), "new content");
}

TEST_F(ApplyEntryTest, ModifyProceedsWhenPreviousHashDiffers) {
  write_file(scratch / "game" / "data.bin", "unexpected");
  auto chunk = stored_chunk("patched", zr::ChunkMode::Modify);
  chunk.prev_hash = digest_of("old content");

  zr::apply_entry(entry_from("game/data.bin", {chunk}), options, log);
  EXPECT_EQ(read_file(scratch / "game" / "data.bin"), "patched");
}

TEST_F(ApplyEntryTest, DeleteRemovesFile) {
  write_file(scratch / "old" / "file.txt", "bye");
  TestChunk chunk;
  chunk.mode = zr::ChunkMode::Delete;

  zr::apply_entry(entry_from("old/file.txt", {chunk}), options, log);
  EXPECT_FALSE(fs::exists(scratch / "old" / "file.txt"));
  EXPECT_TRUE(fs::is_directory(scratch / "old"));
}

TEST_F(ApplyEntryTest, DeleteOfMissingFileSucceeds) {
  TestChunk chunk;
  chunk.mode = zr::ChunkMode::Delete;
  EXPECT_NO_THROW(
      zr::apply_entry(entry_from("never/existed", {chunk}), options, log));
  EXPECT_FALSE(fs::exists(scratch / "never"));
}

TEST_F(ApplyEntryTest, UnknownCompressionFailsEntry) {
  auto chunk = stored_chunk("data");
  chunk.compression = zr::CompressionMode::Unknown;
  EXPECT_EQ(error_of([&] {
              zr::apply_entry(entry_from("weird", {chunk}), options, log);
            }),
            zr::Errc::UnknownCompressionMode);
}

TEST(EntryTable, ListsEveryChunk) {
  auto first = stored_chunk("abc");
  TestChunk second;
  second.compression = zr::CompressionMode::Zlib;
  second.data = zlib_compress("xyz");
  second.next_size = 3;

  std::ostringstream out;
  zr::print_entry_table(out, entry_from("table/file", {first, second}));
  const auto text = out.str();

  EXPECT_EQ(text.rfind("table/file  [add, 2 chunk(s)]\n", 0), 0u);
  EXPECT_NE(text.find("next_hash"), std::string::npos);
  EXPECT_NE(text.find("none"), std::string::npos);
  EXPECT_NE(text.find("zlib"), std::string::npos);
  EXPECT_NE(text.find(zr::to_hex(digest_of("abc")).substr(0, 16)),
            std::string::npos);
}
