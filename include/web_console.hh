#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hh"
#include "file_record.hh"
#include "manager.hh"
#include "scan_index.hh"

namespace dupscan {

inline namespace detail_v1 {

// JSON shapes served by the console

nlohmann::json record_json(const file_record_t &rec);
nlohmann::json groups_json(const std::vector<dupe_group_t> &dupe_list);
nlohmann::json info_json(const scan_info_t &info);

/**
 * @brief content type by extension, application/octet-stream if unknown
 */
std::string mime_type(const std::filesystem::path &path);

// text, image, audio, video and pdf are shown in the browser
bool is_inline(const std::string &mime);

/**
 * @brief Content-Disposition value, file name percent-encoded (RFC 5987)
 *
 * @return e.g. inline; filename*=UTF-8''a%20b.txt
 */
std::string content_disposition(const std::filesystem::path &path);

/**
 * @brief serve the management console on 127.0.0.1 until shutdown
 *
 * @param out receives the start banner
 * @return whether the shutdown request asked to delete the index
 * @throws std::runtime_error port already in use
 */
bool serve_console(manager_t &mgr, uint16_t port = default_port,
                   std::ostream &out = std::cout);

/**
 * @brief ask a running console to shut down
 *
 * @throws std::runtime_error no console answered
 */
void request_shutdown(uint16_t port = default_port, bool delete_index = false);

}  // namespace detail_v1

}  // namespace dupscan
