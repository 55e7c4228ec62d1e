#pragma once

#include <zipatch-reader/block-header.hxx>
#include <zipatch-reader/directory-ops.hxx>
#include <zipatch-reader/entry.hxx>
#include <zipatch-reader/error.hxx>
#include <zipatch-reader/metadata-blocks.hxx>

namespace zipatch_reader {
/**
 * @class BlockObserver
 * @brief Read-only notifications about decoded blocks.
 *
 * Every callback runs synchronously while the block is being processed; the
 * references are only valid for the duration of the call. The default
 * implementations do nothing.
 */
class BlockObserver {
public:
  virtual ~BlockObserver() = default;

  /// A known block header was read.
  virtual void on_block(const BlockHeader &) {}
  virtual void on_file_header(const FileHeaderRecord &) {}
  virtual void on_apply(const ApplyRecord &) {}
  /// An ADIR or DELD block was decoded (before it is applied).
  virtual void on_directory(BlockType, const DirectoryOp &) {}
  /// An ETRY block was decoded (before it is applied).
  virtual void on_entry(const Entry &) {}
  /// An entry failed and processing continues with the next block.
  virtual void on_entry_failed(const Entry &, const ZipatchError &) {}
};
} // namespace zipatch_reader
