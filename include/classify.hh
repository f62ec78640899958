#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "config.hh"
#include "file_record.hh"
#include "progress.hh"

namespace dupscan {

inline namespace detail_v1 {

/**
 * @brief detects byte-identical files, size -> quick hash -> full hash
 *
 * full hashing only happens for records sharing both size and quick hash
 * with at least one other record. those records get full_hash filled in
 * place, every other record keeps full_hash empty. records whose full
 * hash could not be read are logged and left out.
 *
 * @param records files in discovery order
 * @param progress receives one increment per group found
 * @param max_thread maximum number of threads used for full hashing
 * @return groups of >= 2 members, by descending size then discovery order
 * of the first member, members in discovery order
 */
std::vector<dupe_group_t> classify(std::span<file_record_t> records,
                                   progress_t &progress,
                                   uint32_t max_thread = default_max_thread);

}  // namespace detail_v1

}  // namespace dupscan
