#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "dupscan.hh"
#include "errors.hh"
#include "generator.hh"
#include "log.hh"
#include "manager.hh"
#include "report.hh"
#include "scan_index.hh"
#include "web_console.hh"

using namespace std::literals;

namespace fs = std::filesystem;

namespace {

constexpr auto usage =
    "usage: dupscan <command> [options]\n"
    "\n"
    "  scan [dir] [-r/--recursive] [-n/--no-web] [-p/--port port]\n"
    "       [-i/--index file] [--incomplete] [-e/--exclude glob]...\n"
    "       [-j jobs] [-q/--quiet]\n"
    "  serve <index_file> [-p/--port port]\n"
    "  shutdown [-d/--delete-index] [-p/--port port]\n"
    "  generate-test [dir] [-c/--count n] [-d/--duplicates n]\n"
    "  -h/--help\n";

// value of the option at argv[i], advances i
const char *next_arg(int &i, int argc, char *argv[], std::string_view what) {
  ++i;
  if (i >= argc) {
    throw std::invalid_argument("missing " + std::string(what));
  }
  return argv[i];
}

uint16_t parse_port(const char *arg) {
  auto port = std::stoi(arg);
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("port must be > 0 and <= 65535");
  }
  return (uint16_t)port;
}

// prints at most once per second
class progress_printer_t {
  std::chrono::steady_clock::time_point _last;
  bool _printed = false;

 public:
  void operator()(uint64_t files_scanned, uint64_t groups_found,
                  dupscan::phase_t phase) {
    auto now = std::chrono::steady_clock::now();
    if (_printed && now - _last < 1s) {
      return;
    }
    _last = now;
    _printed = true;
    dupscan::log_line(dupscan::lvl_t::log)
        << dupscan::phase_name(phase) << ": " << files_scanned
        << " files, " << groups_found << " groups" << '\n';
  }
};

void print_session(const dupscan::scan_info_t &info) {
  std::cout << "\nScan session:\n"
            << "Base directory: " << info.base_directory.string() << '\n'
            << "Files scanned: " << info.files_scanned << '\n'
            << "Groups found: " << info.groups_found << '\n'
            << "Status: " << (info.complete() ? "complete" : "incomplete")
            << '\n';
}

// serve until shutdown, then drop the index if asked to
void run_console(std::unique_ptr<dupscan::scan_index_t> index,
                 const int64_t scan_id, const uint16_t port) {
  const auto index_path = index->path();
  bool delete_index = false;
  {
    dupscan::manager_t mgr(*index, scan_id);
    delete_index = dupscan::serve_console(mgr, port);
  }
  index.reset();
  if (delete_index) {
    std::error_code ec;
    for (const auto *suffix : dupscan::index_side_suffixes) {
      fs::remove(index_path.string() + suffix, ec);
    }
    std::cout << "Index file deleted: " << index_path.string() << '\n';
  }
}

int cmd_scan(int argc, char *argv[]) {
  dupscan::scan_opts_t opts;
  opts.root = ".";
  bool web = true;
  uint16_t port = dupscan::default_port;

  for (int i = 2; i < argc; ++i) {
    if (argv[i] == "-r"sv || argv[i] == "--recursive"sv) {
      opts.recursive = true;
    } else if (argv[i] == "-n"sv || argv[i] == "--no-web"sv) {
      web = false;
    } else if (argv[i] == "-p"sv || argv[i] == "--port"sv) {
      port = parse_port(next_arg(i, argc, argv, "port"));
    } else if (argv[i] == "-i"sv || argv[i] == "--index"sv) {
      opts.index_path = next_arg(i, argc, argv, "index file");
    } else if (argv[i] == "--incomplete"sv) {
      opts.resume = true;
    } else if (argv[i] == "-e"sv || argv[i] == "--exclude"sv) {
      opts.exclude.emplace_back(next_arg(i, argc, argv, "exclude glob"));
    } else if (argv[i] == "-j"sv) {
      auto jobs = std::stoi(next_arg(i, argc, argv, "jobs"));
      if (jobs <= 0 || jobs > (int)dupscan::max_thread_limit) {
        throw std::invalid_argument("jobs must be > 0 and <= 256");
      }
      opts.max_thread = (uint32_t)jobs;
    } else if (argv[i] == "-q"sv || argv[i] == "--quiet"sv) {
      dupscan::set_quiet(true);
    } else if (argv[i][0] == '-') {
      throw std::invalid_argument("unknown option: "s + argv[i]);
    } else {
      opts.root = argv[i];
    }
  }

  // a generated index is always new, there is nothing to resume from
  if (opts.resume && opts.index_path.empty()) {
    throw std::invalid_argument("--incomplete requires -i/--index");
  }
  // the console needs somewhere to record deletes and renames
  if (web && opts.index_path.empty()) {
    opts.index_path = dupscan::scan_index_t::generate_index_path(
        fs::absolute(opts.root).lexically_normal());
  }
  if (!opts.index_path.empty()) {
    std::cout << "Using index file: " << opts.index_path.string() << '\n';
  }

  progress_printer_t printer;
  auto result = dupscan::scan(opts, std::ref(printer));
  std::cout << "Found " << result.groups.size() << " groups of duplicate files"
            << " in " << result.files_scanned << " files\n";

  if (!web) {
    dupscan::print_report(std::cout, result.groups);
    return 0;
  }
  auto index = std::make_unique<dupscan::scan_index_t>(result.index_path);
  run_console(std::move(index), *result.scan_id, port);
  return 0;
}

int cmd_serve(int argc, char *argv[]) {
  std::optional<fs::path> index_path;
  uint16_t port = dupscan::default_port;

  for (int i = 2; i < argc; ++i) {
    if (argv[i] == "-p"sv || argv[i] == "--port"sv) {
      port = parse_port(next_arg(i, argc, argv, "port"));
    } else if (argv[i][0] == '-') {
      throw std::invalid_argument("unknown option: "s + argv[i]);
    } else {
      index_path = argv[i];
    }
  }
  if (!index_path) {
    throw std::invalid_argument("missing index file");
  }
  if (!fs::is_regular_file(*index_path)) {
    throw std::runtime_error("Invalid or corrupted index file");
  }

  std::unique_ptr<dupscan::scan_index_t> index;
  std::optional<int64_t> scan_id;
  try {
    index = std::make_unique<dupscan::scan_index_t>(*index_path);
    scan_id = index->latest_scan_id();
  } catch (const dupscan::index_error &e) {
    dupscan::log_line(dupscan::lvl_t::err) << e.what() << '\n';
  }
  if (!scan_id) {
    throw std::runtime_error("Invalid or corrupted index file");
  }
  if (auto info = index->get_scan_info(*scan_id)) {
    print_session(*info);
  }
  run_console(std::move(index), *scan_id, port);
  return 0;
}

int cmd_shutdown(int argc, char *argv[]) {
  bool delete_index = false;
  uint16_t port = dupscan::default_port;

  for (int i = 2; i < argc; ++i) {
    if (argv[i] == "-d"sv || argv[i] == "--delete-index"sv) {
      delete_index = true;
    } else if (argv[i] == "-p"sv || argv[i] == "--port"sv) {
      port = parse_port(next_arg(i, argc, argv, "port"));
    } else {
      throw std::invalid_argument("unknown option: "s + argv[i]);
    }
  }
  dupscan::request_shutdown(port, delete_index);
  std::cout << "Server shutdown requested\n";
  return 0;
}

int cmd_generate(int argc, char *argv[]) {
  fs::path dir = "./test-dir";
  int count = 20;
  int duplicates = 2;

  for (int i = 2; i < argc; ++i) {
    if (argv[i] == "-c"sv || argv[i] == "--count"sv) {
      count = std::stoi(next_arg(i, argc, argv, "count"));
    } else if (argv[i] == "-d"sv || argv[i] == "--duplicates"sv) {
      duplicates = std::stoi(next_arg(i, argc, argv, "duplicates"));
    } else if (argv[i][0] == '-') {
      throw std::invalid_argument("unknown option: "s + argv[i]);
    } else {
      dir = argv[i];
    }
  }
  dupscan::generate_test_files(dir, count, duplicates);
  std::cout << "Generated " << count * duplicates << " files in "
            << dir.string() << '\n';
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  if (argc < 2 || argv[1] == "-h"sv || argv[1] == "--help"sv) {
    std::cerr << usage;
    return argc < 2 ? 1 : 0;
  }

  try {
    if (argv[1] == "scan"sv) {
      return cmd_scan(argc, argv);
    } else if (argv[1] == "serve"sv) {
      return cmd_serve(argc, argv);
    } else if (argv[1] == "shutdown"sv) {
      return cmd_shutdown(argc, argv);
    } else if (argv[1] == "generate-test"sv) {
      return cmd_generate(argc, argv);
    }
    std::cerr << "unknown command: " << argv[1] << '\n' << usage;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
