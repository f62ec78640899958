#include "file_record.hh"

#include <array>
#include <iomanip>
#include <sstream>

namespace dupscan {

inline namespace detail_v1 {

std::string format_size(const uint64_t bytes) {
  constexpr std::array<const char *, 5> units{"B", "KB", "MB", "GB", "TB"};
  auto size = (double)bytes;
  auto unit_idx = 0UL;
  while (size >= 1024.0 && unit_idx < units.size() - 1) {
    size /= 1024.0;
    ++unit_idx;
  }
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << size << ' ' << units[unit_idx];
  return os.str();
}

std::string file_record_t::formatted_size() const { return format_size(size); }

}  // namespace detail_v1

}  // namespace dupscan
