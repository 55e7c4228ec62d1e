#include <zipatch-reader/entry-table.hxx>
#include <zipatch-reader/error.hxx>
#include <zipatch-reader/logging.hxx>
#include <zipatch-reader/options.hxx>
#include <zipatch-reader/patch-runner.hxx>

#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/program_options.hpp>

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
namespace po = boost::program_options;
namespace logging = boost::log;
namespace expr = boost::log::expressions;

namespace {
constexpr int exit_ok = 0;
constexpr int exit_failure = 1;
constexpr int exit_usage = 2;

/**
 * @brief Prints a table for every entry as soon as it is decoded.
 */
class EntryTablePrinter : public zipatch_reader::BlockObserver {
public:
  void on_entry(const zipatch_reader::Entry &entry) override {
    zipatch_reader::print_entry_table(std::cout, entry);
  }
};

void init_console_log() {
  logging::add_console_log(
      std::clog, logging::keywords::format =
                     (expr::stream << "[" << logging::trivial::severity
                                   << "] " << expr::smessage));
}

po::options_description make_options() {
  po::options_description desc("Usage: zipatch-reader [options]\n\nOptions");
  desc.add_options()
      ("help,h", "Display this help message and exit.")
      ("file,f",
       po::value<std::string>()->default_value("D2010.09.18.0000.patch"),
       "Path to the ZiPatch file to process.")
      ("output,o", po::value<std::string>()->default_value("output"),
       "Output directory for extracted files.")
      ("extract,x", "Extract files from the patch (enabled by default).")
      ("no-extract", "Only decode and report blocks.")
      ("list,l", "Print a table of every decoded entry.")
      ("verbose,v", "Enable verbose output.")
      ("directory,d", po::value<std::string>(),
       "Process all .patch files in the specified directory.")
      ("recursive,r",
       "Recursively search for .patch files in subdirectories.")
      ("verify-crc", "Validate the CRC-32 trailer of every block.")
      ("keep-going",
       "Report a failed entry and continue with the next block.");
  return desc;
}
} // unnamed namespace

int main(int argc, char **argv) {
  const auto desc = make_options();
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << e.what() << "\n\n" << desc << '\n';
    return exit_usage;
  }

  if (vm.count("help")) {
    std::cout << desc << '\n';
    return exit_ok;
  }
  if (vm.count("extract") && vm.count("no-extract")) {
    std::cerr << "--extract and --no-extract are mutually exclusive\n";
    return exit_usage;
  }

  zipatch_reader::Options options;
  options.output_root = vm["output"].as<std::string>();
  options.extract = vm.count("no-extract") == 0;
  options.verbosity = vm.count("verbose") ? zipatch_reader::Severity::debug
                                          : zipatch_reader::Severity::info;
  options.verify_crc = vm.count("verify-crc") != 0;
  options.continue_on_entry_error = vm.count("keep-going") != 0;

  init_console_log();
  zipatch_reader::Logger log(options.verbosity);

  if (options.extract) {
    ZIPATCH_READER_LOG(log, info)
        << "Extracting files to: " << options.output_root.string();
    std::error_code ec;
    fs::create_directories(options.output_root, ec);
    if (ec) {
      ZIPATCH_READER_LOG(log, error)
          << "Failed to create output directory: "
          << options.output_root.string() << " (" << ec.message() << ")";
      return exit_failure;
    }
  }

  EntryTablePrinter printer;
  zipatch_reader::BlockObserver *observer =
      vm.count("list") ? &printer : nullptr;

  zipatch_reader::PatchSummary summary;
  try {
    if (vm.count("directory"))
      summary = zipatch_reader::process_patch_directory(
          vm["directory"].as<std::string>(), options,
          vm.count("recursive") != 0, observer);
    else
      summary = zipatch_reader::process_patch_file(
          vm["file"].as<std::string>(), options, observer);
  } catch (const zipatch_reader::ZipatchError &e) {
    ZIPATCH_READER_LOG(log, error) << e.what();
    return exit_failure;
  } catch (const std::exception &e) {
    ZIPATCH_READER_LOG(log, error) << "Fatal error: " << e.what();
    return exit_failure;
  }

  ZIPATCH_READER_LOG(log, info)
      << "Files: " << summary.files_processed << " processed, "
      << summary.files_failed << " failed; blocks: " << summary.blocks
      << "; entries: " << summary.entries_applied << " applied, "
      << summary.entries_failed << " failed; directories: "
      << summary.directories_created << " created, "
      << summary.directories_deleted << " deleted";

  if (summary.files_failed != 0 || summary.entries_failed != 0)
    return exit_failure;
  ZIPATCH_READER_LOG(log, info) << "All operations completed successfully.";
  return exit_ok;
}
