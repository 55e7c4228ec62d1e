#pragma once

#include <zipatch-reader/logging.hxx>

#include <cstddef>
#include <filesystem>
#include <string>

namespace zipatch_reader {
/// Largest path length accepted in ADIR, DELD and ETRY payloads.
inline constexpr std::size_t max_path_size = 1024;

/**
 * @struct DirectoryOp
 * @brief Path carried by an ADIR or DELD block.
 */
struct DirectoryOp {
  std::string path;
};

/**
 * @brief Decode an ADIR/DELD payload: `path_len[4] | path[path_len]`.
 *
 * @throws ZipatchError PathSizeTooLarge when path_len > 1024 (checked before
 * the path is allocated), UnexpectedEndOfFile on a short payload.
 */
DirectoryOp parse_directory_op(const char *data, std::size_t size);

/**
 * @brief Join a patch path under the output root.
 *
 * Leading separators are dropped and the remainder is normalized lexically,
 * so "a/../b" lands on "b" below the root.
 * @throws ZipatchError UnsafePath when the normalized path starts with "..".
 */
std::filesystem::path resolve_output_path(const std::filesystem::path &root,
                                          const std::string &patch_path);

/**
 * @brief Apply an ADIR block: create the directory chain under the root.
 *
 * An existing directory is not an error.
 * @throws ZipatchError IoError for any other filesystem failure.
 */
void create_directory(const DirectoryOp &op,
                      const std::filesystem::path &output_root, Logger &log);

/**
 * @brief Apply a DELD block: remove a file or a whole directory tree.
 *
 * A missing target is a no-op. Directories are emptied depth-first through
 * an explicit worklist before being removed; symbolic links are removed, not
 * followed.
 * @throws ZipatchError IoError for failures other than "not found".
 */
void delete_directory(const DirectoryOp &op,
                      const std::filesystem::path &output_root, Logger &log);
} // namespace zipatch_reader
