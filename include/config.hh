#pragma once

#include <cstdint>

#define DUPSCAN_EXPORT __attribute__((visibility("default")))

namespace dupscan {

// 64KiB, window of the quick digest
constexpr auto quick_digest_sz = 64UL * 1024UL;
// 64KiB read buffer for streaming digests
constexpr auto buf_sz = 64UL * 1024UL;

// digest algorithm name understood by libcrypto
constexpr auto digest_name = "sha256";

constexpr uint32_t default_max_thread = 4;
constexpr uint32_t max_thread_limit = 256;

constexpr uint16_t default_port = 8080;

// index files are named <prefix><8 hex chars>
constexpr auto index_prefix = ".dupscan.";
// the index file and the files sqlite keeps beside it
constexpr const char *index_side_suffixes[] = {"", "-journal", "-wal", "-shm"};

}  // namespace dupscan
