#include "patch-builder.hxx"

#include <zipatch-reader/block-header.hxx>
#include <zipatch-reader/block-stream-driver.hxx>
#include <zipatch-reader/error.hxx>
#include <zipatch-reader/metadata-blocks.hxx>
#include <zipatch-reader/zipatch-sink.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>

#include <algorithm>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace io = boost::iostreams;
namespace zr = zipatch_reader;
using namespace zipatch_test;

namespace {
/**
 * @brief Records what the driver reports so tests can check the order of
 * dispatched blocks.
 */
class RecordingObserver : public zr::BlockObserver {
public:
  void on_block(const zr::BlockHeader &header) override {
    blocks.push_back(header.block_type);
  }
  void on_file_header(const zr::FileHeaderRecord &record) override {
    file_headers.push_back(record);
  }
  void on_apply(const zr::ApplyRecord &) override { ++applies; }
  void on_directory(zr::BlockType type, const zr::DirectoryOp &op) override {
    directories.push_back(std::string(zr::to_string(type)) + ":" + op.path);
  }
  void on_entry(const zr::Entry &entry) override {
    entries.push_back(entry.path);
  }

  std::vector<zr::BlockType> blocks;
  std::vector<zr::FileHeaderRecord> file_headers;
  int applies = 0;
  std::vector<std::string> directories;
  std::vector<std::string> entries;
};

zr::Options decode_only() {
  zr::Options options;
  options.extract = false;
  options.verbosity = zr::Severity::warning;
  return options;
}

/**
 * @brief A patch with one block of every known type.
 */
std::string sample_patch() {
  return magic() + block(zr::BlockType::FHDR, file_header_payload(1, 1, 1)) +
         block(zr::BlockType::APLY, std::string(12, '\x01')) +
         block(zr::BlockType::APFS, std::string(5, '\x00')) +
         block(zr::BlockType::ADIR, path_payload("data/new")) +
         block(zr::BlockType::ETRY,
               entry_payload("data/new/file.bin", {stored_chunk("payload")})) +
         block(zr::BlockType::DELD, path_payload("data/old"));
}

zr::Errc error_of(const std::function<void()> &action) {
  try {
    action();
  } catch (const zr::ZipatchError &e) {
    return e.code();
  }
  ADD_FAILURE() << "no ZipatchError thrown";
  return zr::Errc::IoError;
}
} // unnamed namespace

/**
 * @brief Every known block type survives a tag round trip.
 */
TEST(BlockHeaderCodec, TagIdentityForKnownTypes) {
  for (auto type : {zr::BlockType::FHDR, zr::BlockType::APLY,
                    zr::BlockType::APFS, zr::BlockType::ETRY,
                    zr::BlockType::ADIR, zr::BlockType::DELD}) {
    EXPECT_EQ(zr::block_type_from_tag(zr::block_type_to_tag(type)), type)
        << zr::to_string(type);
  }
}

TEST(BlockHeaderCodec, UnrecognizedTagIsUnknown) {
  EXPECT_EQ(zr::block_type_from_tag({'A', 'B', 'C', 'D'}),
            zr::BlockType::Unknown);
  EXPECT_EQ(zr::block_type_from_tag({'f', 'h', 'd', 'r'}),
            zr::BlockType::Unknown);
  EXPECT_EQ(zr::to_string(zr::BlockType::Unknown), "unknown");
}

TEST(BlockHeaderCodec, EncodesSizeBigEndianFollowedByTag) {
  zr::BlockHeader header;
  header.payload_size = 256;
  header.block_type = zr::BlockType::FHDR;
  const auto bytes = zr::encode_block_header(header);
  const std::string expected("\x00\x00\x01\x00"
                             "FHDR",
                             8);
  EXPECT_EQ(std::string(bytes.begin(), bytes.end()), expected);

  const auto decoded = zr::decode_block_header(bytes.data());
  EXPECT_EQ(decoded.payload_size, 256u);
  EXPECT_EQ(decoded.block_type, zr::BlockType::FHDR);
}

TEST(BlockHeaderCodec, ReadsHeadersFromStream) {
  std::istringstream empty;
  EXPECT_FALSE(zr::read_block_header(empty).has_value());

  std::istringstream full(be32(20) + "ETRY");
  const auto header = zr::read_block_header(full);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->payload_size, 20u);
  EXPECT_EQ(header->block_type, zr::BlockType::ETRY);

  std::istringstream partial(std::string("\x00\x00\x01", 3));
  EXPECT_EQ(error_of([&] { zr::read_block_header(partial); }),
            zr::Errc::UnexpectedEndOfFile);
}

TEST(MagicValidator, AcceptsSignatureAndRejectsOthers) {
  std::istringstream good(magic() + "trailing");
  EXPECT_NO_THROW(zr::verify_magic(good));

  auto bad = magic();
  bad[1] = 'X';
  std::istringstream bad_in(bad);
  try {
    zr::verify_magic(bad_in);
    FAIL() << "invalid signature accepted";
  } catch (const zr::ZipatchError &e) {
    EXPECT_EQ(e.code(), zr::Errc::InvalidMagicNumber);
    EXPECT_NE(std::string(e.what()).find("915A49504154434"),
              std::string::npos);
  }

  std::istringstream short_in(magic().substr(0, 5));
  EXPECT_EQ(error_of([&] { zr::verify_magic(short_in); }),
            zr::Errc::UnexpectedEndOfFile);
}

TEST(MetadataBlocks, ParsesFileHeaderAndApply) {
  const auto payload = file_header_payload(7, 2, 3);
  const auto record = zr::parse_file_header(payload.data(), payload.size());
  EXPECT_EQ(record.result, zr::FileHeaderResult::Diff);
  EXPECT_EQ(record.entry_file_count, 7u);
  EXPECT_EQ(record.add_dir_count, 2u);
  EXPECT_EQ(record.delete_dir_count, 3u);

  std::ostringstream text;
  text << record;
  EXPECT_EQ(text.str(),
            "version=00000300 result=diff entry_files=7 add_dirs=2 "
            "delete_dirs=3");

  const std::string apply("\x00\x00\x00\x01\x00\x00\x00\x02\xAB\xCD\xEF\x00",
                          12);
  const auto aply = zr::parse_apply(apply.data(), apply.size());
  EXPECT_EQ(aply.value3[0], '\xAB');
  std::ostringstream apply_text;
  apply_text << aply;
  EXPECT_EQ(apply_text.str(),
            "value1=00000001 value2=00000002 value3=ABCDEF00");
}

TEST(MetadataBlocks, ShortPayloadsAreTruncation) {
  const auto payload = file_header_payload().substr(0, 19);
  EXPECT_EQ(error_of([&] {
              zr::parse_file_header(payload.data(), payload.size());
            }),
            zr::Errc::UnexpectedEndOfFile);
  EXPECT_EQ(error_of([&] { zr::parse_apply("12345678", 8); }),
            zr::Errc::UnexpectedEndOfFile);
}

/**
 * @brief Parameterized over the size of the slices handed to the driver, to
 * exercise every partial-read path of the framing state machine.
 */
class BlockStreamDriverTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(BlockStreamDriverTest, DispatchesEveryBlockInOrder) {
  const auto patch = sample_patch();
  RecordingObserver observer;
  zr::BlockStreamDriver driver(decode_only(), &observer);

  const auto slice = GetParam();
  for (std::size_t offset = 0; offset < patch.size(); offset += slice)
    driver.feed(patch.data() + offset,
                std::min(slice, patch.size() - offset));
  driver.finish();

  const std::vector<zr::BlockType> expected = {
      zr::BlockType::FHDR, zr::BlockType::APLY, zr::BlockType::APFS,
      zr::BlockType::ADIR, zr::BlockType::ETRY, zr::BlockType::DELD};
  EXPECT_EQ(observer.blocks, expected);
  ASSERT_EQ(observer.file_headers.size(), 1u);
  EXPECT_EQ(observer.file_headers[0].entry_file_count, 1u);
  EXPECT_EQ(observer.applies, 1);
  EXPECT_EQ(observer.directories,
            (std::vector<std::string>{"ADIR:data/new", "DELD:data/old"}));
  EXPECT_EQ(observer.entries,
            std::vector<std::string>{"data/new/file.bin"});
  EXPECT_EQ(driver.bytes_consumed(), patch.size());
  EXPECT_EQ(driver.summary().blocks, 6u);
  EXPECT_EQ(driver.summary().entries_applied, 0u);
}

TEST_P(BlockStreamDriverTest, RunReadsFromStream) {
  const auto patch = sample_patch();
  std::istringstream in(patch);
  zr::BlockStreamDriver driver(decode_only());
  driver.run(in, GetParam());
  EXPECT_EQ(driver.bytes_consumed(), patch.size());
  EXPECT_EQ(driver.summary().blocks, 6u);
}

INSTANTIATE_TEST_SUITE_P(SliceSizes, BlockStreamDriverTest,
                         ::testing::Values(1, 3, 7, 12, 64, 4096));

TEST(BlockStreamDriver, SinkAdaptsDriverToIostreams) {
  const auto patch = sample_patch();
  auto driver = std::make_shared<zr::BlockStreamDriver>(decode_only());
  io::copy(io::array_source(patch.data(), patch.size()),
           zr::ZipatchSink(driver));
  driver->finish();
  EXPECT_EQ(driver->bytes_consumed(), patch.size());
  EXPECT_EQ(driver->summary().blocks, 6u);
}

TEST(BlockStreamDriver, MagicOnlyIsAnEmptyPatch) {
  const auto patch = magic();
  zr::BlockStreamDriver driver(decode_only());
  driver.feed(patch.data(), patch.size());
  EXPECT_NO_THROW(driver.finish());
  EXPECT_EQ(driver.summary().blocks, 0u);
}

TEST(BlockStreamDriver, RejectsBadSignature) {
  auto patch = sample_patch();
  patch[0] = 'P';
  zr::BlockStreamDriver driver(decode_only());
  EXPECT_EQ(error_of([&] { driver.feed(patch.data(), patch.size()); }),
            zr::Errc::InvalidMagicNumber);
}

/**
 * @brief Cutting the stream anywhere except a block boundary is an
 * unexpected end of file.
 */
TEST(BlockStreamDriver, TruncationAtEveryStageIsReported) {
  const auto patch =
      magic() + block(zr::BlockType::APLY, std::string(12, '\x02'));
  for (std::size_t cut : {std::size_t{5}, zr::magic_size + 3,
                          zr::magic_size + zr::block_header_size + 4,
                          patch.size() - 2}) {
    zr::BlockStreamDriver driver(decode_only());
    driver.feed(patch.data(), cut);
    EXPECT_EQ(error_of([&] { driver.finish(); }),
              zr::Errc::UnexpectedEndOfFile)
        << "cut at " << cut;
  }
}

TEST(BlockStreamDriver, UnknownTagStopsProcessing) {
  RecordingObserver observer;
  const auto patch = magic() + block(zr::BlockType::APLY, std::string(12, 0)) +
                     block(zr::BlockTag{'X', 'Y', 'Z', 'W'}, "abc") +
                     block(zr::BlockType::APLY, std::string(12, 0));
  zr::BlockStreamDriver driver(decode_only(), &observer);
  try {
    driver.feed(patch.data(), patch.size());
    FAIL() << "unknown tag accepted";
  } catch (const zr::ZipatchError &e) {
    EXPECT_EQ(e.code(), zr::Errc::UnknownBlockType);
    EXPECT_NE(std::string(e.what()).find("XYZW"), std::string::npos);
  }
  EXPECT_EQ(observer.applies, 1);
}

TEST(BlockStreamDriver, CrcIsIgnoredUnlessRequested) {
  auto patch = magic() + block(zr::BlockType::APLY, std::string(12, 0));
  patch.back() ^= 0x5A;

  zr::BlockStreamDriver lenient(decode_only());
  lenient.feed(patch.data(), patch.size());
  EXPECT_NO_THROW(lenient.finish());

  auto options = decode_only();
  options.verify_crc = true;
  RecordingObserver observer;
  zr::BlockStreamDriver strict(options, &observer);
  EXPECT_EQ(error_of([&] { strict.feed(patch.data(), patch.size()); }),
            zr::Errc::CrcMismatch);
  EXPECT_EQ(observer.applies, 0);
}

TEST(BlockStreamDriver, ValidCrcPassesVerification) {
  const auto patch = sample_patch();
  auto options = decode_only();
  options.verify_crc = true;
  zr::BlockStreamDriver driver(options);
  driver.feed(patch.data(), patch.size());
  EXPECT_NO_THROW(driver.finish());
  EXPECT_EQ(driver.summary().blocks, 6u);
}
