#include <zipatch-reader/error.hxx>
#include <zipatch-reader/patch-runner.hxx>
#include <zipatch-reader/zipatch-sink.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/file.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <ios>
#include <istream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace zipatch_reader {
namespace {
bool is_patch_file(const fs::directory_entry &entry) {
  std::error_code ec;
  return entry.is_regular_file(ec) && entry.path().extension() == ".patch";
}

/**
 * @brief Stream a patch from @p source through a fresh driver and check that
 * every one of @p expected_size bytes was consumed.
 */
template <typename Source>
PatchSummary run_patch(Source &source, std::uint64_t expected_size,
                       const std::string &name, const Options &options,
                       BlockObserver *observer) {
  auto driver = std::make_shared<BlockStreamDriver>(options, observer);
  auto &log = driver->logger();
  ZIPATCH_READER_LOG(log, info) << "Processing file: " << name;

  io::copy(source, ZipatchSink(driver));
  driver->finish();

  if (driver->bytes_consumed() != expected_size)
    throw ZipatchError(Errc::FileSizeMismatch,
                       name + ": consumed " +
                           std::to_string(driver->bytes_consumed()) +
                           " bytes, file size is " +
                           std::to_string(expected_size));

  auto summary = driver->summary();
  summary.files_processed = 1;
  ZIPATCH_READER_LOG(log, info) << "Finished processing file: " << name;
  return summary;
}

template <typename Iterator>
void collect_patch_files(const fs::path &directory,
                         std::vector<fs::path> &out) {
  std::error_code ec;
  Iterator it(directory, fs::directory_options::skip_permission_denied, ec);
  for (Iterator end; !ec && it != end; it.increment(ec))
    if (is_patch_file(*it))
      out.push_back(it->path());
  if (ec)
    throw ZipatchError(Errc::IoError,
                       "failed to list directory " + directory.string(), ec);
}
} // unnamed namespace

/**
 * @brief Process one patch file from disk.
 *
 * @param path Patch file to read.
 * @param options Extraction and logging settings.
 * @param observer Optional receiver of decoded records.
 * @return PatchSummary Counters for this file.
 * @throws ZipatchError IoError when the file cannot be sized or opened, and
 * every error raised while decoding or applying it.
 */
PatchSummary process_patch_file(const fs::path &path, const Options &options,
                                BlockObserver *observer) {
  std::error_code ec;
  const auto file_size = fs::file_size(path, ec);
  if (ec)
    throw ZipatchError(Errc::IoError, "failed to open file " + path.string(),
                       ec);
  io::file_source source(path.string(), std::ios::binary);
  if (!source.is_open())
    throw ZipatchError(Errc::IoError, "failed to open file " + path.string());

  return run_patch(source, file_size, path.string(), options, observer);
}

PatchSummary process_patch_stream(std::istream &in,
                                  std::uint64_t expected_size,
                                  const std::string &name,
                                  const Options &options,
                                  BlockObserver *observer) {
  return run_patch(in, expected_size, name, options, observer);
}

std::vector<fs::path> find_patch_files(const fs::path &directory,
                                       bool recursive) {
  std::vector<fs::path> files;
  if (recursive)
    collect_patch_files<fs::recursive_directory_iterator>(directory, files);
  else
    collect_patch_files<fs::directory_iterator>(directory, files);
  std::sort(files.begin(), files.end());
  return files;
}

PatchSummary process_patch_directory(const fs::path &directory,
                                     const Options &options, bool recursive,
                                     BlockObserver *observer) {
  Logger log(options.verbosity);
  ZIPATCH_READER_LOG(log, info)
      << "Searching for .patch files in directory: " << directory.string();

  const auto files = find_patch_files(directory, recursive);
  PatchSummary total;
  for (const auto &file : files) {
    ZIPATCH_READER_LOG(log, info) << "Found patch file: " << file.string();
    try {
      total += process_patch_file(file, options, observer);
    } catch (const ZipatchError &e) {
      ++total.files_failed;
      ZIPATCH_READER_LOG(log, error) << "Failed to process patch file: "
                                     << file.string() << ", error: "
                                     << e.what();
    } catch (const std::exception &e) {
      ++total.files_failed;
      ZIPATCH_READER_LOG(log, error) << "Failed to read patch file: "
                                     << file.string() << ", error: "
                                     << e.what();
    }
  }

  ZIPATCH_READER_LOG(log, info)
      << "Processed " << files.size() << " patch files from directory: "
      << directory.string();
  if (files.empty())
    ZIPATCH_READER_LOG(log, warning)
        << "No .patch files found in directory: " << directory.string();
  return total;
}
} // namespace zipatch_reader
