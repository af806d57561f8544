#include "csv_to_json/page_renderer.hpp"
#include <kainjow/mustache.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace ctj {

namespace {

// Same markup as templates/index.mustache, kept for installs without the template dir.
constexpr const char* kBuiltinIndex = R"(<!doctype html>
<html>
<head><meta charset="utf-8"><title>{{title}}</title></head>
<body>
<form action="/" method="POST" enctype="multipart/form-data">
  <h1>{{title}}</h1>
  <label>Upload CSV <input type="file" name="{{field}}"></label>
  <label>delimiter <input type="text" name="delimiter" maxlength="1" value="{{delimiter}}"></label>
  <label>quote <input type="text" name="quote" maxlength="1" value="{{quote}}"></label>
  <button>Convert</button>
  <div id="motto">{{#mottos}}{{#first}}{{text}}{{/first}}{{/mottos}}</div>
</form>
<script>
  var mottos = [{{#mottos}}"{{{text}}}"{{^last}},{{/last}}{{/mottos}}];
  var i = 0;
  setInterval(function () {
    i = (i + 1) % mottos.length;
    document.getElementById("motto").textContent = mottos[i];
  }, {{interval_ms}});
</script>
</body>
</html>
)";

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

}

PageRenderer::PageRenderer() : cfg_{} {}

PageRenderer::PageRenderer(Config cfg) : cfg_(std::move(cfg)) {}

bool PageRenderer::render_index(std::string& out) {
  err_.clear();

  std::string tpl;
  if (!cfg_.template_dir.empty()) {
    tpl = read_file(std::filesystem::path(cfg_.template_dir) / "index.mustache");
  }
  if (tpl.empty()) tpl = kBuiltinIndex;

  kainjow::mustache::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  kainjow::mustache::data mottos{kainjow::mustache::data::type::list};
  for (std::size_t i = 0; i < cfg_.mottos.size(); ++i) {
    kainjow::mustache::data m;
    m.set("text", cfg_.mottos[i]);
    m.set("first", kainjow::mustache::data(i == 0));
    m.set("last", kainjow::mustache::data(i + 1 == cfg_.mottos.size()));
    mottos << m;
  }

  kainjow::mustache::data data;
  data.set("title", cfg_.title);
  data.set("field", cfg_.upload_field);
  data.set("delimiter", std::string(1, cfg_.delimiter));
  data.set("quote", std::string(1, cfg_.quote));
  data.set("interval_ms", std::to_string(cfg_.motto_interval_ms));
  data.set("mottos", mottos);

  out = view.render(data);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  return true;
}

}
