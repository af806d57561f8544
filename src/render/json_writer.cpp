#include "csv_to_json/json_writer.hpp"
#include <simdjson.h>
#include <cmath> // std::isfinite
#include <cstdio>

namespace ctj {

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

void JsonWriter::separate() {
  if (after_key_) { after_key_ = false; return; }
  if (first_.empty()) return;
  if (first_.back()) first_.back() = false;
  else out_ += ',';
}

bool JsonWriter::escaped(std::string_view s) {
  if (!simdjson::validate_utf8(s.data(), s.size())) {
    err_ = "string is not valid UTF-8";
    return false;
  }
  static const char* hex = "0123456789abcdef";
  out_ += '"';
  for (char ch : s) {
    const unsigned char c = static_cast<unsigned char>(ch);
    switch (c) {
      case '\\': out_ += "\\\\"; break;
      case '"':  out_ += "\\\""; break;
      case '\b': out_ += "\\b";  break;
      case '\f': out_ += "\\f";  break;
      case '\n': out_ += "\\n";  break;
      case '\r': out_ += "\\r";  break;
      case '\t': out_ += "\\t";  break;
      default:
        if (c < 0x20) {
          out_ += "\\u00";
          out_ += hex[c >> 4];
          out_ += hex[c & 0xF];
        } else {
          out_ += ch;
        }
        break;
    }
  }
  out_ += '"';
  return true;
}

void JsonWriter::begin_object() { separate(); out_ += '{'; first_.push_back(true); }
void JsonWriter::end_object()   { first_.pop_back(); out_ += '}'; }
void JsonWriter::begin_array()  { separate(); out_ += '['; first_.push_back(true); }
void JsonWriter::end_array()    { first_.pop_back(); out_ += ']'; }

bool JsonWriter::key(std::string_view k) {
  separate();
  if (!escaped(k)) return false;
  out_ += ':';
  after_key_ = true;
  return true;
}

bool JsonWriter::string(std::string_view s) {
  separate();
  return escaped(s);
}

void JsonWriter::number(std::uint64_t v) {
  separate();
  out_ += std::to_string(v);
}

void JsonWriter::number(double v) {
  separate();
  char tmp[32];
  int n = std::snprintf(tmp, sizeof(tmp), "%.17g", safe_num(v));
  out_.append(tmp, (n > 0) ? static_cast<size_t>(n) : 0);
}

void JsonWriter::boolean(bool b) { separate(); out_ += b ? "true" : "false"; }
void JsonWriter::null()          { separate(); out_ += "null"; }

bool write_json(JsonWriter& w, std::string_view s) { return w.string(s); }
bool write_json(JsonWriter& w, const std::string& s) { return w.string(s); }

bool write_json(JsonWriter& w, const std::vector<std::pair<std::string, std::string>>& fields) {
  w.begin_object();
  for (const auto& kv : fields) {
    if (!w.key(kv.first)) return false;
    if (!w.string(kv.second)) return false;
  }
  w.end_object();
  return true;
}

}
