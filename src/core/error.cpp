#include "csv_to_json/error.hpp"
#include <string>

namespace ctj {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Options:   return "options";
    case ErrorKind::Io:        return "io";
    case ErrorKind::Encoding:  return "encoding";
    case ErrorKind::Malformed: return "malformed";
    case ErrorKind::Encode:    return "encode";
  }
  return "unknown";
}

std::string describe(const Error& e) {
  std::string out;
  switch (e.kind) {
    case ErrorKind::Options:   out = "invalid parse options"; break;
    case ErrorKind::Io:        out = "failed to read input"; break;
    case ErrorKind::Encoding:  out = "invalid UTF-8"; break;
    case ErrorKind::Malformed: out = "malformed CSV"; break;
    case ErrorKind::Encode:    out = "failed to serialize value"; break;
  }
  if (e.line && e.record) {
    out += " at line " + std::to_string(e.line) + " (record " + std::to_string(e.record) + ")";
  } else if (e.line) {
    out += " at line " + std::to_string(e.line);
  } else if (e.record) {
    out += " in record " + std::to_string(e.record);
  }
  if (!e.message.empty()) { out += ": "; out += e.message; }
  return out;
}

}
