#pragma once

#include <zipatch-reader/block-observer.hxx>
#include <zipatch-reader/block-stream-driver.hxx>
#include <zipatch-reader/options.hxx>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace zipatch_reader {
/**
 * @brief Process one patch file through a fresh BlockStreamDriver.
 *
 * The file is streamed through a ZipatchSink; afterwards the number of
 * bytes consumed is compared with the file size.
 *
 * @throws ZipatchError for any failure, including FileSizeMismatch.
 */
PatchSummary process_patch_file(const std::filesystem::path &path,
                                const Options &options,
                                BlockObserver *observer = nullptr);

/**
 * @brief Process a patch read from an arbitrary stream.
 *
 * @p expected_size plays the role of the file size: once the stream is
 * exhausted the bytes consumed must match it. @p name only labels log lines
 * and error messages.
 *
 * @throws ZipatchError for any failure, including FileSizeMismatch.
 */
PatchSummary process_patch_stream(std::istream &in,
                                  std::uint64_t expected_size,
                                  const std::string &name,
                                  const Options &options,
                                  BlockObserver *observer = nullptr);

/**
 * @brief List the regular files with a ".patch" extension in a directory,
 * sorted by path.
 */
std::vector<std::filesystem::path>
find_patch_files(const std::filesystem::path &directory, bool recursive);

/**
 * @brief Process every patch file found in a directory.
 *
 * A file that fails is logged and counted in files_failed; the remaining
 * files are still processed.
 *
 * @throws ZipatchError IoError if the directory cannot be listed.
 */
PatchSummary process_patch_directory(const std::filesystem::path &directory,
                                     const Options &options, bool recursive,
                                     BlockObserver *observer = nullptr);
} // namespace zipatch_reader
