#pragma once

#include <filesystem>
#include <iostream>

namespace dupscan {

inline namespace detail_v1 {

/**
 * @brief write count random files with duplicates copies each
 *
 * first copy goes to base_dir, the rest to random subdirectories
 * (documents, photos, downloads). names never collide, exactly
 * count * duplicates files are written.
 *
 * @param log receives one "Created: <path>" line per file
 * @throws std::invalid_argument count < 1 or duplicates < 1
 * @throws std::runtime_error a file could not be written
 */
void generate_test_files(const std::filesystem::path &base_dir, int count = 20,
                         int duplicates = 2, std::ostream &log = std::cout);

}  // namespace detail_v1

}  // namespace dupscan
