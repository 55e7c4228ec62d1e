#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace zipatch_reader {
/** @enum FileHeaderResult Result tag of an FHDR block ("DIFF" or "HIST"). */
enum class FileHeaderResult { Diff, Hist, Unknown };

std::string_view to_string(FileHeaderResult result) noexcept;

/**
 * @struct FileHeaderRecord
 * @brief Informational contents of an FHDR block.
 */
struct FileHeaderRecord {
  std::array<char, 4> version{};
  FileHeaderResult result = FileHeaderResult::Unknown;
  std::uint32_t entry_file_count = 0;
  std::uint32_t add_dir_count = 0;
  std::uint32_t delete_dir_count = 0;
};

/**
 * @struct ApplyRecord
 * @brief Three opaque values carried by an APLY block.
 */
struct ApplyRecord {
  std::array<char, 4> value1{};
  std::array<char, 4> value2{};
  std::array<char, 4> value3{};
};

/// Minimum FHDR payload: version, result tag and three u32 counters.
inline constexpr std::size_t file_header_payload_size = 20;
/// Minimum APLY payload.
inline constexpr std::size_t apply_payload_size = 12;

/**
 * @brief Decode an FHDR payload.
 * @throws ZipatchError UnexpectedEndOfFile if size < 20.
 */
FileHeaderRecord parse_file_header(const char *data, std::size_t size);

/**
 * @brief Decode an APLY payload.
 * @throws ZipatchError UnexpectedEndOfFile if size < 12.
 */
ApplyRecord parse_apply(const char *data, std::size_t size);

std::ostream &operator<<(std::ostream &out, const FileHeaderRecord &record);
std::ostream &operator<<(std::ostream &out, const ApplyRecord &record);
} // namespace zipatch_reader
