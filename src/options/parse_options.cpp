#include "csv_to_json/parse_options.hpp"
#include <cstdio>
#include <string>

namespace ctj {

static std::string printable(char c) {
  const unsigned char u = static_cast<unsigned char>(c);
  if (u >= 0x20 && u < 0x7f) return std::string(1, c);
  char tmp[8];
  std::snprintf(tmp, sizeof(tmp), "0x%02X", u);
  return tmp;
}

std::optional<char> parse_option_char(std::string_view name,
                                      std::optional<std::string_view> raw,
                                      char fallback,
                                      std::string* err) {
  if (!raw) return fallback;
  auto fail = [&](const std::string& why) -> std::optional<char> {
    if (err) *err = std::string(name) + ": " + why;
    return std::nullopt;
  };
  if (raw->empty()) return fail("expected a single character, got an empty value");
  if (raw->size() != 1) {
    // A multi-byte UTF-8 character is still one character, but not one byte.
    if (static_cast<unsigned char>((*raw)[0]) >= 0x80) return fail("must be an ASCII character");
    return fail("expected a single character, got \"" + std::string(*raw) + "\"");
  }
  const char c = (*raw)[0];
  if (static_cast<unsigned char>(c) >= 0x80) return fail("must be an ASCII character");
  if (c == '\n' || c == '\r') return fail("line terminators (" + printable(c) + ") are not allowed");
  return c;
}

std::optional<ParseOptions> make_parse_options(std::optional<std::string_view> delimiter,
                                               std::optional<std::string_view> quote,
                                               std::string* err) {
  auto d = parse_option_char("delimiter", delimiter, kDefaultDelimiter, err);
  if (!d) return std::nullopt;
  auto q = parse_option_char("quote", quote, kDefaultQuote, err);
  if (!q) return std::nullopt;
  if (*d == *q) {
    if (err) *err = "delimiter and quote must differ (both are '" + printable(*d) + "')";
    return std::nullopt;
  }
  ParseOptions o;
  o.delimiter = *d;
  o.quote     = *q;
  return o;
}

}
