#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ctj {

inline constexpr char kDefaultDelimiter = ',';
inline constexpr char kDefaultQuote     = '"';

// Per-request CSV dialect. Both fields are single ASCII bytes.
struct ParseOptions {
  char delimiter = kDefaultDelimiter;
  char quote     = kDefaultQuote;
};

// Validate one option value as received (query string or form field).
// Absent -> fallback. Present -> exactly one ASCII byte, not CR/LF.
std::optional<char> parse_option_char(std::string_view name,
                                      std::optional<std::string_view> raw,
                                      char fallback,
                                      std::string* err);

// Build ParseOptions from raw option values; nullopt + *err on an options error.
std::optional<ParseOptions> make_parse_options(std::optional<std::string_view> delimiter,
                                               std::optional<std::string_view> quote,
                                               std::string* err);

}
