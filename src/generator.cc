#include "generator.hh"

#include <array>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hh"

namespace dupscan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

struct file_type_t {
  const char *ext;
  const char *prefix;
};

constexpr std::array<file_type_t, 8> file_types{{
    {".txt", "document_"},
    {".pdf", "report__"},
    {".jpg", "IMG__"},
    {".png", "DSC__"},
    {".doc", "backup_"},
    {".pdf", "meeting_notes_"},
    {".pdf", "screenshot_"},
    {".txt", "vacation_photo_"},
}};

constexpr auto min_content_sz = 1024UL;
constexpr auto max_content_sz = 1024UL * 1024UL;

// 2023-01-01T00:00:00Z, dates are drawn from the following two years
constexpr std::time_t date_base = 1672531200;
constexpr int date_span_days = 730;

std::vector<char> random_content(std::mt19937_64 &rng) {
  std::uniform_int_distribution<std::size_t> size_dist(min_content_sz,
                                                       max_content_sz);
  std::uniform_int_distribution<int> byte_dist(0, 255);
  std::vector<char> content(size_dist(rng));
  for (auto &c : content) {
    c = (char)byte_dist(rng);
  }
  return content;
}

std::string random_date(std::mt19937_64 &rng) {
  std::uniform_int_distribution<int> day_dist(0, date_span_days);
  const std::time_t t = date_base + (std::time_t)day_dist(rng) * 86400;
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
  return buf;
}

fs::path unused_name(const fs::path &dir, const file_type_t &type,
                     std::mt19937_64 &rng) {
  std::uniform_int_distribution<int> num_dist(0, 999);
  while (true) {
    std::ostringstream name;
    name << type.prefix << random_date(rng) << '_' << std::setw(3)
         << std::setfill('0') << num_dist(rng) << type.ext;
    auto path = dir / name.str();
    if (!fs::exists(path)) {
      return path;
    }
  }
}

}  // namespace

void DUPSCAN_EXPORT generate_test_files(const fs::path &base_dir,
                                        const int count, const int duplicates,
                                        std::ostream &log) {
  if (count < 1) {
    throw std::invalid_argument("count must be greater than 0");
  }
  if (duplicates < 1) {
    throw std::invalid_argument("duplicates must be greater than 0");
  }

  fs::create_directories(base_dir);
  const std::array<fs::path, 3> subdirs{base_dir / "documents",
                                        base_dir / "photos",
                                        base_dir / "downloads"};
  for (const auto &dir : subdirs) {
    fs::create_directories(dir);
  }

  std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::size_t> type_dist(0,
                                                       file_types.size() - 1);
  std::uniform_int_distribution<std::size_t> dir_dist(0, subdirs.size() - 1);

  for (auto i = 0; i < count; ++i) {
    const auto content = random_content(rng);
    const auto &type = file_types[type_dist(rng)];
    for (auto j = 0; j < duplicates; ++j) {
      const auto &dir = j == 0 ? base_dir : subdirs[dir_dist(rng)];
      const auto path = unused_name(dir, type, rng);
      std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
      ofs.write(content.data(), (std::streamsize)content.size());
      if (!ofs) {
        throw std::runtime_error("failed to create " + path.string());
      }
      log << "Created: " << path.string() << '\n';
    }
  }
}

}  // namespace detail_v1

}  // namespace dupscan
