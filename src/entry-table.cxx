#include <zipatch-reader/entry-table.hxx>

#include <boost/format.hpp>

#include <string>

namespace zipatch_reader {
namespace {
const char *const row_format = "  %|4| %|-7| %|-5| %|10| %|10| %|10|  %s\n";
}

void print_entry_table(std::ostream &out, const Entry &entry) {
  out << boost::format("%s  [%s, %d chunk(s)]\n") % entry.path %
             to_string(entry.mode()) % entry.chunks.size();
  out << boost::format(row_format) % "#" % "mode" % "comp" % "size" %
             "prev_size" % "next_size" % "next_hash";

  std::size_t index = 0;
  for (const auto &chunk : entry.chunks) {
    out << boost::format(row_format) % ++index % to_string(chunk.mode) %
               to_string(chunk.compression) % chunk.declared_size %
               chunk.prev_size % chunk.next_size %
               to_hex(chunk.next_hash).substr(0, 16);
  }
}
} // namespace zipatch_reader
