#pragma once

#include <zipatch-reader/entry.hxx>

#include <ostream>

namespace zipatch_reader {
/**
 * @brief Render a decoded entry as a text table.
 *
 * The first line names the path, whole-entry mode and chunk count; one row
 * per chunk follows with its index, mode, compression, sizes and the
 * leading bytes of its next_hash.
 */
void print_entry_table(std::ostream &out, const Entry &entry);
} // namespace zipatch_reader
