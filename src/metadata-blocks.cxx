#include <zipatch-reader/detail/payload-cursor.hxx>
#include <zipatch-reader/metadata-blocks.hxx>

#include <boost/algorithm/hex.hpp>

#include <cstring>
#include <iterator>

namespace zipatch_reader {
namespace {
template <std::size_t N>
void read_opaque(detail::PayloadCursor &cursor, std::array<char, N> &out,
                 std::string_view field) {
  std::memcpy(out.data(), cursor.take(N, field), N);
}

void write_hex(std::ostream &out, const std::array<char, 4> &value) {
  boost::algorithm::hex(value.begin(), value.end(),
                        std::ostreambuf_iterator<char>(out));
}
} // unnamed namespace

std::string_view to_string(FileHeaderResult result) noexcept {
  switch (result) {
  case FileHeaderResult::Diff:
    return "diff";
  case FileHeaderResult::Hist:
    return "hist";
  case FileHeaderResult::Unknown:
    break;
  }
  return "unknown";
}

FileHeaderRecord parse_file_header(const char *data, std::size_t size) {
  detail::PayloadCursor cursor(data, size, "FHDR");
  cursor.require(file_header_payload_size, "the fixed header");

  FileHeaderRecord record;
  read_opaque(cursor, record.version, "version");
  const std::string_view result(cursor.take(4, "result tag"), 4);
  if (result == "DIFF")
    record.result = FileHeaderResult::Diff;
  else if (result == "HIST")
    record.result = FileHeaderResult::Hist;
  record.entry_file_count = cursor.read_u32("entry file count");
  record.add_dir_count = cursor.read_u32("add directory count");
  record.delete_dir_count = cursor.read_u32("delete directory count");
  return record;
}

ApplyRecord parse_apply(const char *data, std::size_t size) {
  detail::PayloadCursor cursor(data, size, "APLY");
  cursor.require(apply_payload_size, "the fixed header");

  ApplyRecord record;
  read_opaque(cursor, record.value1, "value 1");
  read_opaque(cursor, record.value2, "value 2");
  read_opaque(cursor, record.value3, "value 3");
  return record;
}

std::ostream &operator<<(std::ostream &out, const FileHeaderRecord &record) {
  out << "version=";
  write_hex(out, record.version);
  return out << " result=" << to_string(record.result)
             << " entry_files=" << record.entry_file_count
             << " add_dirs=" << record.add_dir_count
             << " delete_dirs=" << record.delete_dir_count;
}

std::ostream &operator<<(std::ostream &out, const ApplyRecord &record) {
  out << "value1=";
  write_hex(out, record.value1);
  out << " value2=";
  write_hex(out, record.value2);
  out << " value3=";
  write_hex(out, record.value3);
  return out;
}
} // namespace zipatch_reader
