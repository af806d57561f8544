#include "csv_to_json/path_utils.hpp"
#include <cctype>

namespace ctj {

static bool safe_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

std::string json_filename_for(std::string_view upload_name) {
  // Browsers on Windows may send a full path; keep the last component only.
  const auto slash = upload_name.find_last_of("/\\");
  if (slash != std::string_view::npos) upload_name.remove_prefix(slash + 1);

  const auto dot = upload_name.rfind('.');
  if (dot != std::string_view::npos && dot > 0) upload_name = upload_name.substr(0, dot);

  std::string stem;
  stem.reserve(upload_name.size());
  for (char c : upload_name) stem += safe_char(c) ? c : '_';

  // Reject names made of dots only ("", ".", "..").
  if (stem.find_first_not_of('.') == std::string::npos) return "converted.json";
  return stem + ".json";
}

std::string content_disposition_for(std::string_view filename) {
  std::string out = "attachment; filename=\"";
  for (char c : filename) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

}
