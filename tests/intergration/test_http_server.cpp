#include "csv_to_json/http_server.hpp"
#include "csv_to_json/metrics.hpp"
#include <httplib.h>
#include <simdjson.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool json_string_field(const std::string& body, const char* key, std::string& out) {
  simdjson::dom::parser parser;
  simdjson::padded_string ps(body);
  simdjson::dom::element doc;
  if (parser.parse(ps).get(doc) != simdjson::SUCCESS) return false;
  std::string_view v;
  if (doc[key].get(v) != simdjson::SUCCESS) return false;
  out.assign(v.data(), v.size());
  return true;
}

static void expect_body(httplib::Client& cli, const std::string& path, const std::string& csv,
                        const std::string& expected, const std::string& what) {
  auto res = cli.Post(path.c_str(), csv, "text/csv");
  const bool ok = res && res->status == 200 && res->body == expected &&
                  res->get_header_value("Content-Type").find("application/json") != std::string::npos;
  if (!ok && res) std::cerr << "       status " << res->status << " body: " << res->body << "\n";
  check(ok, what);
}

int main() {
  ctj::HttpServer::Config cfg;
  cfg.port = 0;
  cfg.threads = 2;
  cfg.template_dir = "templates";
  cfg.max_body_bytes = 64 * 1024;
  ctj::HttpServer server(cfg);
  if (!server.start()) { std::cerr << "[ERR] could not bind a port\n"; return 2; }

  std::thread t([&] { server.run(); });
  for (int i = 0; i < 100 && !server.is_running(); ++i) std::this_thread::sleep_for(20ms);
  if (!server.is_running()) {
    std::cerr << "[ERR] server did not start\n";
    server.stop();
    t.join();
    return 2;
  }

  httplib::Client cli("127.0.0.1", server.port());
  cli.set_read_timeout(5, 0);

  expect_body(cli, "/", "", "[]", "empty body -> []");
  expect_body(cli, "/", "field1,field2,field3", "[]", "header only -> []");
  expect_body(cli, "/", "field1,field2,field3\n1,2,3",
              R"([{"field1":"1","field2":"2","field3":"3"}])", "single record");
  expect_body(cli, "/", "field1,field2,field3\n1,2,3\n4,5,6",
              R"([{"field1":"1","field2":"2","field3":"3"},{"field1":"4","field2":"5","field3":"6"}])",
              "two records");
  expect_body(cli, "/", "\"field1\",field2,field3\n1,\"2\",3",
              R"([{"field1":"1","field2":"2","field3":"3"}])", "quoted fields");
  expect_body(cli, "/", "\"field1\",field2,field3\n1,\"2 &\n 3\",4",
              R"([{"field1":"1","field2":"2 &\n 3","field3":"4"}])", "newline inside quotes");
  expect_body(cli, "/?delimiter=%09", "field1\tfield2\tfield3\n1\t2\t3",
              R"([{"field1":"1","field2":"2","field3":"3"}])", "tab delimiter from query");
  expect_body(cli, "/?quote=%27", "field1,'field2','field3'\n1,'2',3",
              R"([{"field1":"1","field2":"2","field3":"3"}])", "single quote from query");

  {
    auto res = cli.Post("/?delimiter=ab", "a,b\n1,2\n", "text/csv");
    std::string kind;
    check(res && res->status == 400 && !json_string_field(res->body, "kind", kind) &&
          res->body.find("invalid query parameters") != std::string::npos,
          "multi-byte delimiter -> 400");
  }
  {
    auto res = cli.Post("/?delimiter=%22", "a,b\n", "text/csv");
    check(res && res->status == 400, "delimiter equal to quote -> 400");
  }
  {
    auto res = cli.Post("/", "a,\xFF\n1,2\n", "text/csv");
    std::string kind;
    check(res && res->status == 400 && json_string_field(res->body, "kind", kind) && kind == "encoding",
          "invalid UTF-8 in header -> 400 with kind=encoding");
  }
  {
    auto res = cli.Post("/", "a\n\"open\n", "text/csv");
    std::string kind;
    check(res && res->status == 400 && json_string_field(res->body, "kind", kind) && kind == "malformed",
          "unterminated quote before any output -> 400 with kind=malformed");
  }
  {
    // Status is already 200 when the bad row is reached; the body must not be a complete array.
    auto res = cli.Post("/", "a\n1\n2\n\xFF\n", "text/csv");
    const bool cut = !res || (res->body.empty() || res->body.back() != ']');
    check(cut, "failure after first chunk truncates the stream");
  }

  {
    const std::string boundary = "----ctjtestboundary";
    std::string body;
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"delimiter\"\r\n\r\n";
    body += ";\r\n";
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"file\"; filename=\"report.csv\"\r\n";
    body += "Content-Type: text/csv\r\n\r\n";
    body += "a;b\n1;2\n";
    body += "\r\n--" + boundary + "--\r\n";
    auto res = cli.Post("/", body, "multipart/form-data; boundary=" + boundary);
    check(res && res->status == 200 && res->body == R"([{"a":"1","b":"2"}])",
          "multipart upload with delimiter form field");
    check(res && res->get_header_value("Content-Disposition").find("report.json") != std::string::npos,
          "multipart upload names the download after the file");
  }
  {
    const std::string boundary = "----ctjtestboundary";
    std::string body;
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"other\"; filename=\"x.csv\"\r\n\r\n";
    body += "a,b\n1,2\n";
    body += "\r\n--" + boundary + "--\r\n";
    auto res = cli.Post("/", body, "multipart/form-data; boundary=" + boundary);
    check(res && res->status == 400 && res->body.find("missing multipart field") != std::string::npos,
          "multipart without the upload field -> 400");
  }

  {
    std::string body = "n\n";
    while (body.size() < 32 * 1024) body += "1234567\n";
    auto res = cli.Post("/", body, "text/csv");
    check(res && res->status == 200 && !res->body.empty() && res->body.back() == ']',
          "body under max_body_bytes converts");

    while (body.size() < 100 * 1024) body += "1234567\n";
    httplib::Client big("127.0.0.1", server.port());
    big.set_read_timeout(5, 0);
    auto over = big.Post("/", body, "text/csv");
    check(over && over->status == 413, "body over max_body_bytes -> 413");
  }
  {
    auto res = cli.Get("/");
    check(res && res->status == 200 && res->body.find("<form") != std::string::npos,
          "GET / serves the upload form");
  }
  {
    auto res = cli.Get("/nope");
    check(res && res->status == 404, "unknown path -> 404");
  }
  {
    auto res = cli.Get("/metrics");
    bool ok = false;
    if (res && res->status == 200) {
      simdjson::dom::parser parser;
      simdjson::padded_string ps(res->body);
      simdjson::dom::element doc;
      uint64_t requests = 0, rejected = 0;
      ok = parser.parse(ps).get(doc) == simdjson::SUCCESS &&
           doc["requests"].get(requests) == simdjson::SUCCESS &&
           doc["rejected"].get(rejected) == simdjson::SUCCESS &&
           requests >= 14 && rejected >= 5;
    }
    check(ok, "GET /metrics reports request and rejection counters");
  }

  server.stop();
  t.join();

  const ctj::ServiceStats s = server.metrics().snapshot();
  check(s.completed >= 9 && s.records >= 8, "registry counted completed conversions");

  std::cout << (failures ? "[FAIL] " : "[PASS] ") << "http server: " << failures << " failure(s)\n";
  return failures ? 1 : 0;
}
