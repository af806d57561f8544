#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace ctj {

// Renders the upload form served at GET /.
class PageRenderer {
public:
  struct Config {
    std::string template_dir = "templates";  // index.mustache is looked up here
    std::string title = "Convert Your CSV to JSON:";
    std::string upload_field = "file";
    char delimiter = ',';
    char quote = '"';
    std::vector<std::string> mottos = {
      "It's fun AND educational!",
      "Everyone's doing it, don't get left behind!",
      "Do iiittt!",
    };
    int motto_interval_ms = 5000;
  };

  PageRenderer();
  explicit PageRenderer(Config cfg);

  // Falls back to the built-in template when the file is missing.
  bool render_index(std::string& out);

  const std::string& error() const { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
