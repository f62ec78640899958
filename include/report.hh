#pragma once

#include <cstdint>
#include <iostream>
#include <vector>

#include "file_record.hh"

namespace dupscan {

inline namespace detail_v1 {

struct report_stats_t {
  uint64_t groups = 0;
  uint64_t files = 0;
  // bytes held by every member of every group
  uint64_t total_size = 0;
  // bytes freed by keeping one member per group
  uint64_t savings = 0;
};

report_stats_t report_stats(const std::vector<dupe_group_t> &dupe_list);

/**
 * @brief print summary and a Group | Size | Hash | Files table
 */
void print_report(std::ostream &os, const std::vector<dupe_group_t> &dupe_list);

}  // namespace detail_v1

}  // namespace dupscan
