#include "csv_to_json/http_server.hpp"
#include "csv_to_json/chunk_reader.hpp"
#include "csv_to_json/json_writer.hpp"
#include "csv_to_json/metrics.hpp"
#include "csv_to_json/page_renderer.hpp"
#include "csv_to_json/parse_options.hpp"
#include "csv_to_json/path_utils.hpp"
#include "csv_to_json/pipeline.hpp"
#include <httplib.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace ctj {

namespace {

constexpr std::size_t kMaxOptionFieldBytes = 16;

// State of one streamed response; shared by the content provider and its releaser.
struct Conversion {
  QueueChunkSource input;
  std::optional<ConversionPipeline> pipe;
  std::string pending;  // first chunk, pulled before the response was committed
  bool reported = false;
};

std::string error_body(std::string_view message, const char* kind = nullptr) {
  std::string out;
  JsonWriter w(out);
  w.begin_object();
  w.key("error");
  if (!w.string(message)) w.string("request could not be processed");
  if (kind) { w.key("kind"); w.string(kind); }
  w.end_object();
  return out;
}

}

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;
  MetricsRegistry metrics;
  std::string index_html;
  int bound_port{0};
  bool bound{false};

  explicit Impl(Config c) : cfg(std::move(c)) {}

  void reject(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_content(body, "application/json");
  }

  void report(Conversion& c, ConversionOutcome outcome) {
    if (c.reported) return;
    c.reported = true;
    const ConversionStats s = c.pipe->stats();
    const Error* err = outcome == ConversionOutcome::Failed ? &c.pipe->error() : nullptr;
    metrics.add_conversion(outcome, s, err);

    switch (outcome) {
      case ConversionOutcome::Completed:
        std::cout << "[convert] ok: " << s.records << " record(s), "
                  << s.bytes_in << " bytes in, " << s.bytes_out << " bytes out\n";
        break;
      case ConversionOutcome::Failed:
        // Status and part of the body are already on the wire; the stream is cut short.
        std::cerr << "[convert] failed after " << s.records << " record(s): "
                  << describe(*err) << "\n";
        break;
      case ConversionOutcome::Cancelled:
        std::cerr << "[convert] client went away after " << s.records << " record(s)\n";
        break;
    }
    if (s.dropped_fields) {
      std::cerr << "[convert] warning: dropped " << s.dropped_fields
                << " field(s) beyond the header's width\n";
    }
  }

  // One call, one chunk: socket writes pace the pipeline.
  bool stream(Conversion& c, httplib::DataSink& sink) {
    if (!c.pending.empty()) {
      std::string first;
      first.swap(c.pending);
      return sink.write(first.data(), first.size());
    }
    std::string_view chunk;
    if (c.pipe->next(chunk)) return sink.write(chunk.data(), chunk.size());
    if (c.pipe->failed()) {
      report(c, ConversionOutcome::Failed);
      return false;
    }
    report(c, ConversionOutcome::Completed);
    sink.done();
    return true;
  }

  void convert(const httplib::Request& req, httplib::Response& res,
               const httplib::ContentReader& content_reader) {
    metrics.add_request();

    std::optional<std::string> q_delim, q_quote;
    if (req.has_param("delimiter")) q_delim = req.get_param_value("delimiter");
    if (req.has_param("quote"))     q_quote = req.get_param_value("quote");

    std::string opt_err;
    auto opts = make_parse_options(q_delim ? std::optional<std::string_view>(*q_delim) : std::nullopt,
                                   q_quote ? std::optional<std::string_view>(*q_quote) : std::nullopt,
                                   &opt_err);
    if (!opts) {
      Error e{ErrorKind::Options, opt_err};
      metrics.add_rejected(e);
      std::cerr << "[convert] rejected: invalid query parameters: " << opt_err << "\n";
      reject(res, 400, error_body("invalid query parameters: " + opt_err));
      return;
    }

    auto conv = std::make_shared<Conversion>();

    // Body -> chunk queue, keeping the transport's chunk boundaries.
    bool multipart = req.is_multipart_form_data();
    bool too_large = false;
    auto enqueue = [&](const char* data, std::size_t len) {
      if (conv->input.bytes_pushed() + len > cfg.max_body_bytes) { too_large = true; return false; }
      conv->input.push(std::string(data, len));
      return true;
    };
    bool saw_upload = false;
    std::string filename;
    std::string part;
    std::string f_delim, f_quote;
    bool read_ok = true;
    if (multipart) {
      read_ok = content_reader(
        [&](const auto& file) {
          part = file.name;
          if (part == cfg.upload_field) { saw_upload = true; filename = file.filename; }
          return true;
        },
        [&](const char* data, std::size_t len) {
          if (part == cfg.upload_field) {
            return enqueue(data, len);
          } else if (part == "delimiter" || part == "quote") {
            std::string& dst = (part == "delimiter") ? f_delim : f_quote;
            if (dst.size() < kMaxOptionFieldBytes)
              dst.append(data, std::min(len, kMaxOptionFieldBytes - dst.size()));
          }
          return true;
        });
    } else {
      read_ok = content_reader(enqueue);
    }
    if (too_large || res.status == 413) {
      Error e{ErrorKind::Io, "request body exceeds " + std::to_string(cfg.max_body_bytes) + " bytes"};
      metrics.add_rejected(e);
      std::cerr << "[convert] rejected after " << conv->input.bytes_pushed() << " body bytes: "
                << e.message << "\n";
      reject(res, 413, error_body(e.message, to_string(e.kind)));
      return;
    }
    if (read_ok) conv->input.close();
    else conv->input.fail("failed to read request body");

    if (multipart) {
      if (!saw_upload) {
        Error e{ErrorKind::Options, "missing multipart field \"" + cfg.upload_field + "\""};
        metrics.add_rejected(e);
        std::cerr << "[convert] rejected: " << e.message << "\n";
        reject(res, 400, error_body(e.message));
        return;
      }
      // Form fields fill in what the query string left out; empty inputs mean "default".
      const bool use_fd = !q_delim && !f_delim.empty();
      const bool use_fq = !q_quote && !f_quote.empty();
      if (use_fd || use_fq) {
        auto pick = [](const std::optional<std::string>& q, bool use_form, const std::string& f)
            -> std::optional<std::string_view> {
          if (use_form) return std::string_view(f);
          if (q) return std::string_view(*q);
          return std::nullopt;
        };
        opts = make_parse_options(pick(q_delim, use_fd, f_delim), pick(q_quote, use_fq, f_quote), &opt_err);
        if (!opts) {
          Error e{ErrorKind::Options, opt_err};
          metrics.add_rejected(e);
          std::cerr << "[convert] rejected: invalid form fields: " << opt_err << "\n";
          reject(res, 400, error_body("invalid form fields: " + opt_err));
          return;
        }
      }
    }

    CsvDecoderConfig dcfg;
    dcfg.options = *opts;
    dcfg.extra_fields = cfg.extra_fields;
    dcfg.max_record_bytes = cfg.max_record_bytes;
    conv->pipe.emplace(conv->input, dcfg);

    // Pull the first chunk while the status can still change.
    std::string_view first;
    if (!conv->pipe->next(first)) {
      const Error& e = conv->pipe->error();
      metrics.add_rejected(e);
      std::cerr << "[convert] rejected before streaming: " << describe(e) << "\n";
      const bool client_fault = e.kind == ErrorKind::Encoding || e.kind == ErrorKind::Malformed;
      reject(res, client_fault ? 400 : 500, error_body(describe(e), to_string(e.kind)));
      return;
    }
    conv->pending.assign(first.data(), first.size());

    if (!filename.empty()) {
      res.set_header("Content-Disposition", content_disposition_for(json_filename_for(filename)));
    }
    res.set_chunked_content_provider(
      "application/json",
      [this, conv](std::size_t /*offset*/, httplib::DataSink& sink) { return stream(*conv, sink); },
      [this, conv](bool success) {
        report(*conv, success ? ConversionOutcome::Completed : ConversionOutcome::Cancelled);
      });
  }

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      if (index_html.empty()) { res.status = 500; return; }
      res.set_content(index_html, "text/html; charset=utf-8");
    });

    svr.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(metrics.to_json(), "application/json");
    });

    svr.Post("/", [this](const httplib::Request& req, httplib::Response& res,
                         const httplib::ContentReader& content_reader) {
      convert(req, res, content_reader);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) {
  PageRenderer::Config pcfg;
  pcfg.template_dir = p_->cfg.template_dir;
  pcfg.upload_field = p_->cfg.upload_field;
  PageRenderer renderer(pcfg);
  if (!renderer.render_index(p_->index_html)) {
    std::cerr << "[http] upload page unavailable: " << renderer.error() << "\n";
    p_->index_html.clear();
  }

  p_->svr.set_payload_max_length(p_->cfg.max_body_bytes);

  const int threads = p_->cfg.threads > 0 ? p_->cfg.threads : 1;
  p_->svr.new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<std::size_t>(threads)); };
  p_->routes();
}

HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->bound) return true;
  if (p_->cfg.port == 0) {
    const int port = p_->svr.bind_to_any_port(p_->cfg.host);
    if (port <= 0) return false;
    p_->bound_port = port;
  } else {
    if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
    p_->bound_port = p_->cfg.port;
  }
  p_->bound = true;
  return true;
}

int HttpServer::run() {
  if (!start()) return -1;
  std::cout << "[http] listening on " << p_->cfg.host << ":" << p_->bound_port << "\n" << std::flush;
  if (!p_->svr.listen_after_bind()) return -1;
  return 0;
}

void HttpServer::stop() { p_->svr.stop(); }
bool HttpServer::is_running() const { return p_->svr.is_running(); }
int HttpServer::port() const { return p_->bound_port; }
const MetricsRegistry& HttpServer::metrics() const { return p_->metrics; }

}
