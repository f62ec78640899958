#include "report.hh"

#include <algorithm>
#include <array>
#include <string>

namespace dupscan {

inline namespace detail_v1 {

namespace {

constexpr auto hash_prefix_len = 8UL;

struct row_t {
  std::string group;
  std::string size;
  std::string hash;
  std::vector<std::string> files;
};

void print_rule(std::ostream &os, const std::array<std::size_t, 4> &width) {
  for (auto w : width) {
    os << '+' << std::string(w + 2, '-');
  }
  os << "+\n";
}

void print_cells(std::ostream &os, const std::array<std::size_t, 4> &width,
                 const std::array<std::string, 4> &cells) {
  for (auto i = 0UL; i < cells.size(); ++i) {
    os << "| " << cells[i] << std::string(width[i] - cells[i].size(), ' ')
       << ' ';
  }
  os << "|\n";
}

}  // namespace

report_stats_t report_stats(const std::vector<dupe_group_t> &dupe_list) {
  report_stats_t stats;
  stats.groups = dupe_list.size();
  for (const auto &group : dupe_list) {
    if (group.empty()) {
      continue;
    }
    const auto n = (uint64_t)group.size();
    stats.files += n;
    stats.total_size += group.front().size * n;
    stats.savings += group.front().size * (n - 1);
  }
  return stats;
}

void print_report(std::ostream &os, const std::vector<dupe_group_t> &dupe_list) {
  if (dupe_list.empty()) {
    os << "\nNo duplicate files found\n";
    return;
  }

  const auto stats = report_stats(dupe_list);
  os << "\nSummary:\n"
     << "==========================================\n"
     << "Total duplicate groups: " << stats.groups << '\n'
     << "Total duplicate files: " << stats.files << '\n'
     << "Total size: " << format_size(stats.total_size) << '\n'
     << "Potential space savings: " << format_size(stats.savings) << '\n'
     << "==========================================\n\n";

  std::vector<row_t> rows;
  rows.reserve(dupe_list.size());
  for (auto i = 0UL; i < dupe_list.size(); ++i) {
    const auto &group = dupe_list[i];
    auto &row = rows.emplace_back();
    row.group = "Group " + std::to_string(i + 1);
    row.size = group.front().formatted_size();
    row.hash = group.front().full_hash.value_or("").substr(0, hash_prefix_len);
    for (const auto &rec : group) {
      row.files.emplace_back(rec.path.string());
    }
  }

  const std::array<std::string, 4> head{"Group", "Size", "Hash", "Files"};
  std::array<std::size_t, 4> width{};
  for (auto i = 0UL; i < head.size(); ++i) {
    width[i] = head[i].size();
  }
  for (const auto &row : rows) {
    width[0] = std::max(width[0], row.group.size());
    width[1] = std::max(width[1], row.size.size());
    width[2] = std::max(width[2], row.hash.size());
    for (const auto &file : row.files) {
      width[3] = std::max(width[3], file.size());
    }
  }

  print_rule(os, width);
  print_cells(os, width, head);
  print_rule(os, width);
  for (const auto &row : rows) {
    for (auto i = 0UL; i < row.files.size(); ++i) {
      if (i == 0) {
        print_cells(os, width, {row.group, row.size, row.hash, row.files[i]});
      } else {
        print_cells(os, width, {"", "", "", row.files[i]});
      }
    }
    print_rule(os, width);
  }
}

}  // namespace detail_v1

}  // namespace dupscan
