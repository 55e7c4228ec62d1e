#pragma once

#include <zipatch-reader/logging.hxx>

#include <cstdint>
#include <filesystem>

namespace zipatch_reader {
/**
 * @struct Options
 * @brief Settings threaded through the block-stream driver and the appliers.
 */
struct Options {
  /// Directory under which every patch path is resolved.
  std::filesystem::path output_root = "output";
  /// Apply directory and entry operations; when false blocks are only decoded.
  bool extract = true;
  /// Lowest severity that is logged.
  Severity verbosity = Severity::info;
  /// Check each block's CRC-32 trailer before dispatching the block.
  bool verify_crc = false;
  /// Report a failed entry and move on instead of aborting the file.
  bool continue_on_entry_error = false;
  /// Existing files larger than this are not hashed for Modify entries.
  std::uintmax_t prev_hash_size_limit = 100 * 1024 * 1024;
};
} // namespace zipatch_reader
