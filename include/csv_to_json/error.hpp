#pragma once
#include <cstdint>
#include <string>

namespace ctj {

enum class ErrorKind {
  Options,    // bad parse configuration, rejected before any conversion
  Io,         // upstream read/transport failure
  Encoding,   // input is not valid UTF-8
  Malformed,  // structurally invalid CSV
  Encode      // a value could not be serialized to JSON
};

struct Error {
  ErrorKind kind = ErrorKind::Io;
  std::string message;
  std::uint64_t line = 0;    // 1-based physical line where the failing row starts; 0 if unknown
  std::uint64_t record = 0;  // 1-based data record index; 0 if not tied to a record
};

const char* to_string(ErrorKind k) noexcept;

// One-line description for logs and error bodies.
std::string describe(const Error& e);

}
