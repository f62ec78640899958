#include "web_console.hh"

#include <httplib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "errors.hh"
#include "log.hh"
#include "report.hh"

namespace dupscan {

inline namespace detail_v1 {

namespace fs = std::filesystem;
namespace cn = std::chrono;

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 18>
    mime_table{{
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".doc", "application/msword"},
        {".zip", "application/zip"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
    }};

int64_t to_ms(const file_time_t t) {
  return cn::duration_cast<cn::milliseconds>(t.time_since_epoch()).count();
}

std::string html_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (auto c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string render_index(const std::vector<dupe_group_t> &dupe_list) {
  const auto stats = report_stats(dupe_list);
  std::string html =
      "<!doctype html><html><head><meta charset=\"utf-8\">"
      "<title>dupscan</title></head><body><h1>Duplicate files</h1>";
  html += "<p>" + std::to_string(stats.groups) + " groups, " +
          std::to_string(stats.files) + " files, potential savings " +
          format_size(stats.savings) + "</p>";
  for (auto i = 0UL; i < dupe_list.size(); ++i) {
    const auto &group = dupe_list[i];
    html += "<h2>Group " + std::to_string(i + 1) + " (" +
            group.front().formatted_size() + ")</h2><ul>";
    for (const auto &rec : group) {
      html += "<li>" + html_escape(rec.path.string()) + "</li>";
    }
    html += "</ul>";
  }
  html += "</body></html>";
  return html;
}

void send_json(httplib::Response &res, const json &body, const int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response &res, const int status,
                const std::string &error, const std::string &details) {
  send_json(res, {{"error", error}, {"details", details}}, status);
}

// parse the body, on failure answer 400 and return discarded
json parse_body(const httplib::Request &req, httplib::Response &res) {
  auto body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    send_error(res, 400, "Invalid request", "body must be a JSON object");
    return json(json::value_t::discarded);
  }
  return body;
}

// run a mutation, map its failure to a status code
template <typename Fn>
void run_mutation(httplib::Response &res, const std::string &error, Fn &&fn) {
  try {
    fn();
  } catch (const mutation_conflict_error &e) {
    send_error(res, 409, error, e.what());
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, error, e.what());
  } catch (const index_error &e) {
    log_line(lvl_t::err) << e.what() << '\n';
    send_error(res, 500, error, e.what());
  } catch (const fs::filesystem_error &e) {
    send_error(res, 500, error, e.code().message());
  }
}

}  // namespace

json record_json(const file_record_t &rec) {
  return {
      {"path", rec.path.string()},
      {"name", rec.name},
      {"size", rec.size},
      {"formattedSize", rec.formatted_size()},
      {"created", to_ms(rec.created)},
      {"modified", to_ms(rec.modified)},
      {"quickHash", rec.quick_hash},
      {"hash", rec.full_hash ? json(*rec.full_hash) : json(nullptr)},
  };
}

json groups_json(const std::vector<dupe_group_t> &dupe_list) {
  auto out = json::array();
  for (const auto &group : dupe_list) {
    auto files = json::array();
    for (const auto &rec : group) {
      files.push_back(record_json(rec));
    }
    out.push_back(std::move(files));
  }
  return out;
}

json info_json(const scan_info_t &info) {
  return {
      {"baseDirectory", info.base_directory.string()},
      {"startTime", to_ms(info.start_time)},
      {"endTime", info.end_time ? json(to_ms(*info.end_time)) : json(nullptr)},
      {"filesScanned", info.files_scanned},
      {"groupsFound", info.groups_found},
  };
}

std::string mime_type(const fs::path &path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  for (const auto &[key, mime] : mime_table) {
    if (key == ext) {
      return std::string(mime);
    }
  }
  return "application/octet-stream";
}

bool is_inline(const std::string &mime) {
  return mime.starts_with("text/") || mime.starts_with("image/") ||
         mime.starts_with("video/") || mime.starts_with("audio/") ||
         mime == "application/pdf";
}

std::string content_disposition(const fs::path &path) {
  constexpr char hex[] = "0123456789ABCDEF";
  std::string value = is_inline(mime_type(path)) ? "inline" : "attachment";
  value += "; filename*=UTF-8''";
  for (unsigned char c : path.filename().string()) {
    // unreserved characters of a URI component stay as is
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      value += (char)c;
    } else {
      value += '%';
      value += hex[c >> 4];
      value += hex[c & 0x0f];
    }
  }
  return value;
}

bool serve_console(manager_t &mgr, const uint16_t port, std::ostream &out) {
  httplib::Server svr;
  bool delete_index = false;
  // handlers run on pool workers, the manager and its index are not shared
  std::mutex mtx;

  svr.Get("/", [&](const httplib::Request &, httplib::Response &res) {
    std::lock_guard lk(mtx);
    res.set_content(render_index(mgr.groups()), "text/html");
  });

  svr.Get("/api/duplicates",
          [&](const httplib::Request &, httplib::Response &res) {
            std::lock_guard lk(mtx);
            send_json(res, groups_json(mgr.groups()));
          });

  svr.Get("/api/scan-info",
          [&](const httplib::Request &, httplib::Response &res) {
            std::lock_guard lk(mtx);
            auto info = mgr.scan_info();
            send_json(res, info ? info_json(*info) : json(nullptr));
          });

  // the request path arrives url-decoded, with or without its leading '/'
  svr.Get(R"(/api/download/(.+))",
          [&](const httplib::Request &req, httplib::Response &res) {
            const auto path = (fs::path("/") / req.matches[1].str())
                                  .lexically_normal();
            bool member = false;
            {
              std::lock_guard lk(mtx);
              member = mgr.is_member(path);
            }
            if (!member) {
              send_error(res, 404, "Failed to download file",
                         "not a duplicate of this scan");
              return;
            }
            std::error_code ec;
            const auto size = fs::file_size(path, ec);
            auto ifs = std::make_shared<std::ifstream>(path, std::ios::binary);
            if (ec || !ifs->is_open()) {
              send_error(res, 500, "Failed to download file",
                         ec ? ec.message() : "cannot open file");
              return;
            }
            res.set_header("Content-Disposition", content_disposition(path));
            res.set_content_provider(
                size, mime_type(path),
                [ifs](size_t offset, size_t length, httplib::DataSink &sink) {
                  std::vector<char> buf(std::min<size_t>(length, buf_sz));
                  ifs->seekg((std::streamoff)offset);
                  ifs->read(buf.data(), (std::streamsize)buf.size());
                  const auto read_len = ifs->gcount();
                  if (read_len <= 0) {
                    return false;
                  }
                  sink.write(buf.data(), (size_t)read_len);
                  return true;
                });
          });

  svr.Post("/api/delete", [&](const httplib::Request &req,
                              httplib::Response &res) {
    auto body = parse_body(req, res);
    if (body.is_discarded()) {
      return;
    }
    const fs::path path = body.value("filePath", "");
    run_mutation(res, "Failed to delete file", [&] {
      std::lock_guard lk(mtx);
      mgr.delete_file(path);
      send_json(res, {{"success", true},
                      {"message", "Successfully deleted " + path.string()}});
    });
  });

  svr.Post("/api/rename", [&](const httplib::Request &req,
                              httplib::Response &res) {
    auto body = parse_body(req, res);
    if (body.is_discarded()) {
      return;
    }
    const fs::path old_path = body.value("oldPath", "");
    const std::string new_name = body.value("newName", "");
    run_mutation(res, "Failed to rename file", [&] {
      std::lock_guard lk(mtx);
      auto new_path = mgr.rename_file(old_path, new_name);
      send_json(res, {{"success", true},
                      {"newPath", new_path.string()},
                      {"message", "Successfully renamed " + old_path.string() +
                                      " to " + new_path.string()}});
    });
  });

  svr.Post("/api/shutdown", [&](const httplib::Request &req,
                                httplib::Response &res) {
    auto body = json::parse(req.body, nullptr, false);
    {
      std::lock_guard lk(mtx);
      delete_index = body.is_object() && body.value("deleteIndex", false);
    }
    send_json(res, {{"success", true}, {"message", "Server shutting down"}});
    // listen() returns once in-flight responses are written
    svr.stop();
  });

  if (!svr.bind_to_port("127.0.0.1", port)) {
    throw std::runtime_error("Port " + std::to_string(port) +
                             " is already in use. Try a different port with "
                             "--port option.");
  }

  out << "\ndupscan web interface\n"
      << "==========================================\n"
      << "Server started at: http://localhost:" << port << '\n';
  if (auto info = mgr.scan_info()) {
    out << "Base directory: " << info->base_directory.string() << '\n'
        << "Files scanned: " << info->files_scanned << '\n'
        << "Groups found: " << info->groups_found << '\n';
    if (info->end_time) {
      out << "Scan time: "
          << cn::duration_cast<cn::seconds>(*info->end_time - info->start_time)
                 .count()
          << "s\n";
    }
  }
  out << "==========================================\n" << std::flush;

  if (!svr.listen_after_bind()) {
    log_line(lvl_t::warn) << "console stopped unexpectedly" << '\n';
  }
  return delete_index;
}

void request_shutdown(const uint16_t port, const bool delete_index) {
  httplib::Client cli("localhost", port);
  json body = {{"deleteIndex", delete_index}};
  auto res = cli.Post("/api/shutdown", body.dump(), "application/json");
  if (!res || res->status != 200) {
    throw std::runtime_error("Failed to shutdown server");
  }
}

}  // namespace detail_v1

}  // namespace dupscan
