#include "csv_to_json/chunk_reader.hpp"
#include "csv_to_json/csv_decoder.hpp"
#include "csv_to_json/http_server.hpp"
#include "csv_to_json/parse_options.hpp"
#include "csv_to_json/pipeline.hpp"
#include "csv_to_json/row_policy.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#ifndef CTJ_VERSION
#define CTJ_VERSION "0.0.0"
#endif

namespace {

struct Cli {
  ctj::HttpServer::Config server;
  std::optional<std::string> convert;  // one-shot mode: input path, "-" = stdin
  std::string output = "-";
  std::optional<std::string> delimiter;
  std::optional<std::string> quote;
};

[[noreturn]] void usage_error(const std::string& msg) {
  std::cerr << "csv-to-json: " << msg << "\n(see --help)\n";
  std::exit(2);
}

long to_long(const std::string& flag, const std::string& v) {
  try {
    std::size_t used = 0;
    long n = std::stol(v, &used);
    if (used != v.size() || n < 0) throw std::invalid_argument(v);
    return n;
  } catch (const std::exception&) {
    usage_error("invalid value for " + flag + ": \"" + v + "\"");
  }
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--port=", &v)) { c.server.port = static_cast<int>(to_long("--port", v)); continue; }
    if ((a == "-p" || a == "--port") && i+1 < argc) { c.server.port = static_cast<int>(to_long("--port", argv[++i])); continue; }
    if (eat("--host=", &c.server.host)) continue;
    if (eat("--threads=", &v)) { c.server.threads = static_cast<int>(to_long("--threads", v)); continue; }
    if (eat("--upload-field=", &c.server.upload_field)) continue;
    if (eat("--template-dir=", &c.server.template_dir)) continue;
    if (eat("--max-record-bytes=", &v)) { c.server.max_record_bytes = static_cast<std::size_t>(to_long("--max-record-bytes", v)); continue; }
    if (eat("--max-body-bytes=", &v)) { c.server.max_body_bytes = static_cast<std::size_t>(to_long("--max-body-bytes", v)); continue; }
    if (eat("--extra-fields=", &v)) {
      auto p = ctj::parse_extra_field_policy(v);
      if (!p) usage_error("--extra-fields must be drop or reject, got \"" + v + "\"");
      c.server.extra_fields = *p;
      continue;
    }
    if (a == "--convert" && i+1 < argc) { c.convert = argv[++i]; continue; }
    if (eat("--convert=", &v)) { c.convert = v; continue; }
    if (eat("--output=", &c.output)) continue;
    if (eat("--delimiter=", &v)) { c.delimiter = v; continue; }
    if (eat("--quote=", &v)) { c.quote = v; continue; }
    if (a == "--version") { std::cout << "csv-to-json " << CTJ_VERSION << "\n"; std::exit(0); }
    if (a == "-h" || a == "--help") {
      std::cout <<
        "Usage: csv-to-json [-p N|--port=N] [--host=ADDR] [--threads=N]\n"
        "                   [--extra-fields=drop|reject] [--max-record-bytes=N]\n"
        "                   [--max-body-bytes=N] [--upload-field=NAME] [--template-dir=DIR]\n"
        "       csv-to-json --convert <file|-> [--output=FILE] [--delimiter=C] [--quote=C]\n"
        "                   [--extra-fields=drop|reject] [--max-record-bytes=N]\n";
      std::exit(0);
    }
    usage_error("unknown argument \"" + a + "\"");
  }
  if (c.server.port > 65535) usage_error("--port out of range");
  if (c.server.max_body_bytes == 0) usage_error("--max-body-bytes must be positive");
  return c;
}

int convert_one(const Cli& cli) {
  std::string err;
  auto opts = ctj::make_parse_options(
      cli.delimiter ? std::optional<std::string_view>(*cli.delimiter) : std::nullopt,
      cli.quote ? std::optional<std::string_view>(*cli.quote) : std::nullopt,
      &err);
  if (!opts) {
    std::cerr << "[convert] invalid parse options: " << err << "\n";
    return 1;
  }

  FILE* out = stdout;
  if (cli.output != "-") {
    out = std::fopen(cli.output.c_str(), "wb");
    if (!out) { std::cerr << "[convert] cannot open output " << cli.output << "\n"; return 2; }
  }

  ctj::CsvDecoderConfig dcfg;
  dcfg.options = *opts;
  dcfg.extra_fields = cli.server.extra_fields;
  dcfg.max_record_bytes = cli.server.max_record_bytes;

  ctj::FileChunkReader reader(*cli.convert);
  ctj::ConversionStats stats;
  ctj::Error e;
  auto outcome = ctj::convert(reader, dcfg, [&](std::string_view chunk) {
    return std::fwrite(chunk.data(), 1, chunk.size(), out) == chunk.size();
  }, &stats, &e);

  const bool flushed = std::fflush(out) == 0;
  if (out != stdout) std::fclose(out);

  if (stats.dropped_fields) {
    std::cerr << "[convert] warning: dropped " << stats.dropped_fields
              << " field(s) beyond the header's width\n";
  }
  if (outcome == ctj::ConversionOutcome::Failed) {
    std::cerr << "[convert] failed after " << stats.records << " record(s): " << ctj::describe(e) << "\n";
    return 3;
  }
  if (outcome == ctj::ConversionOutcome::Cancelled || !flushed) {
    std::cerr << "[convert] write to " << cli.output << " failed\n";
    return 3;
  }
  std::cerr << "[convert] ok: " << *cli.convert << " -> " << stats.records << " record(s)\n";
  return 0;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);

  if (cli.convert) return convert_one(cli);

  ctj::HttpServer server(cli.server);
  int rc = server.run();
  if (rc != 0) {
    std::cerr << "Server failed to start on " << cli.server.host << ":" << cli.server.port << "\n";
    return rc;
  }
  return 0;
}
