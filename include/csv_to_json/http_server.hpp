#pragma once
#include "csv_to_json/row_policy.hpp"
#include <cstddef>
#include <string>

namespace ctj {

class MetricsRegistry;

// Tiny wrapper around cpp-httplib:
//   POST /        CSV body (raw or multipart field) -> streamed JSON array
//   GET  /        upload form
//   GET  /metrics conversion counters
class HttpServer {
public:
  struct Config {
    std::string host = "127.0.0.1";
    int port = 3000;                  // 0 = pick a free port
    int threads = 8;
    std::string upload_field = "file";
#ifdef CTJ_DEFAULT_TEMPLATE_DIR
    std::string template_dir = CTJ_DEFAULT_TEMPLATE_DIR;
#else
    std::string template_dir = "templates";
#endif
    ExtraFieldPolicy extra_fields = ExtraFieldPolicy::Drop;
    std::size_t max_record_bytes = 8 * 1024 * 1024;
    // Request bodies are held in memory until converted; larger ones get 413.
    std::size_t max_body_bytes = 64 * 1024 * 1024;
  };

  explicit HttpServer(Config cfg);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Non-blocking bind; returns false on bind error.
  bool start();

  // Blocking run (binds first if needed); returns when server stops.
  int run();

  // Stop if running.
  void stop();

  bool is_running() const;

  // Port actually bound (differs from Config::port when that was 0).
  int port() const;

  const MetricsRegistry& metrics() const;

private:
  struct Impl;
  Impl* p_;
};

}
