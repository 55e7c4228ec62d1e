#include <zipatch-reader/detail/payload-cursor.hxx>
#include <zipatch-reader/directory-ops.hxx>
#include <zipatch-reader/error.hxx>

#include <vector>

namespace fs = std::filesystem;

namespace zipatch_reader {
namespace {
bool is_not_found(const std::error_code &ec) {
  return ec == std::errc::no_such_file_or_directory;
}

[[noreturn]] void throw_io(const std::string &what, const fs::path &path,
                           std::error_code ec) {
  throw ZipatchError(Errc::IoError, what + ": " + path.string(), ec);
}

/**
 * @brief Remove a non-directory entry, tolerating it having vanished.
 */
void remove_leaf(const fs::path &path, Logger &log) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec && !is_not_found(ec))
    throw_io("failed to delete file", path, ec);
  ZIPATCH_READER_LOG(log, trace) << "Deleted " << path.string();
}

/**
 * @brief Depth-first removal of a directory tree.
 *
 * Each frame is first expanded (children pushed, leaves removed) and then
 * removed itself once every child frame above it has been popped.
 */
void remove_tree(const fs::path &root, Logger &log) {
  struct Frame {
    fs::path dir;
    bool expanded;
  };
  std::vector<Frame> worklist{{root, false}};

  while (!worklist.empty()) {
    if (worklist.back().expanded) {
      const fs::path dir = std::move(worklist.back().dir);
      worklist.pop_back();
      std::error_code ec;
      fs::remove(dir, ec);
      if (ec && !is_not_found(ec))
        throw_io("failed to delete directory after emptying it", dir, ec);
      ZIPATCH_READER_LOG(log, trace) << "Deleted directory " << dir.string();
      continue;
    }

    worklist.back().expanded = true;
    const fs::path dir = worklist.back().dir;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec && is_not_found(ec))
      continue;
    for (fs::directory_iterator end; !ec && it != end;
         it.increment(ec)) {
      std::error_code status_ec;
      const auto status = it->symlink_status(status_ec);
      if (status_ec && !is_not_found(status_ec))
        throw_io("failed to stat", it->path(), status_ec);
      if (fs::is_directory(status))
        worklist.push_back({it->path(), false});
      else
        remove_leaf(it->path(), log);
    }
    if (ec && !is_not_found(ec))
      throw_io("failed to list directory", dir, ec);
  }
}
} // unnamed namespace

/**
 * @brief Decode the length-prefixed path of an ADIR or DELD payload.
 *
 * @throws ZipatchError PathSizeTooLarge or UnexpectedEndOfFile.
 */
DirectoryOp parse_directory_op(const char *data, std::size_t size) {
  detail::PayloadCursor cursor(data, size, "directory block");
  return DirectoryOp{cursor.read_path()};
}

/**
 * @brief Join a patch path under the output root.
 *
 * @param root Output root directory.
 * @param patch_path Path as stored in the patch.
 * @return fs::path Location below @p root.
 * @throws ZipatchError UnsafePath when the path climbs out of @p root.
 */
fs::path resolve_output_path(const fs::path &root,
                             const std::string &patch_path) {
  const auto relative =
      fs::path(patch_path).relative_path().lexically_normal();
  if (!relative.empty() && *relative.begin() == "..")
    throw ZipatchError(Errc::UnsafePath,
                       "patch path " + patch_path + " escapes " +
                           root.string());
  return root / relative;
}

/**
 * @brief Create the directory named by an ADIR block, parents included.
 *
 * @param op Decoded ADIR payload.
 * @param output_root Root the path is resolved against.
 * @param log Logger for progress messages.
 * @throws ZipatchError UnsafePath, or IoError when the path exists as a
 * non-directory or cannot be created.
 */
void create_directory(const DirectoryOp &op, const fs::path &output_root,
                      Logger &log) {
  const auto target = resolve_output_path(output_root, op.path);
  ZIPATCH_READER_LOG(log, debug) << "Creating directory: " << target.string();

  std::error_code ec;
  if (!fs::create_directories(target, ec) && !ec) {
    ZIPATCH_READER_LOG(log, debug)
        << "Directory already exists: " << target.string();
    return;
  }
  if (ec) {
    if (ec == std::errc::file_exists && fs::is_directory(target))
      return;
    throw_io("failed to create directory", target, ec);
  }
}

/**
 * @brief Remove the file or directory tree named by a DELD block.
 *
 * The target is inspected with symlink_status, so a link is removed as a
 * leaf even when it points at a directory. A missing target is logged and
 * ignored.
 *
 * @param op Decoded DELD payload.
 * @param output_root Root the path is resolved against.
 * @param log Logger for progress messages.
 * @throws ZipatchError UnsafePath, or IoError for failures other than
 * "not found".
 */
void delete_directory(const DirectoryOp &op, const fs::path &output_root,
                      Logger &log) {
  const auto target = resolve_output_path(output_root, op.path);
  ZIPATCH_READER_LOG(log, debug) << "Deleting path: " << target.string();

  std::error_code ec;
  const auto status = fs::symlink_status(target, ec);
  if (ec && !is_not_found(ec))
    throw_io("failed to stat", target, ec);
  if (!fs::exists(status)) {
    ZIPATCH_READER_LOG(log, info) << "Directory not found: "
                                  << target.string();
    return;
  }

  if (!fs::is_directory(status)) {
    ZIPATCH_READER_LOG(log, info)
        << "Path is a file, deleting file: " << target.string();
    remove_leaf(target, log);
    return;
  }

  remove_tree(target, log);
  ZIPATCH_READER_LOG(log, info)
      << "Deleted directory and its contents: " << target.string();
}
} // namespace zipatch_reader
