#include "csv_to_json/row_policy.hpp"
#include <cctype>

namespace ctj {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

RowShape shape_row(std::size_t header_width, std::size_t field_count, ExtraFieldPolicy policy) noexcept {
  RowShape s;
  if (field_count <= header_width) {
    s.kept = field_count;
    return s;
  }
  if (policy == ExtraFieldPolicy::Reject) {
    s.rejected = true;
    return s;
  }
  s.kept = header_width;
  s.dropped = field_count - header_width;
  return s;
}

std::optional<ExtraFieldPolicy> parse_extra_field_policy(std::string_view s) {
  if (ieq(s, "drop"))   return ExtraFieldPolicy::Drop;
  if (ieq(s, "reject")) return ExtraFieldPolicy::Reject;
  return std::nullopt;
}

const char* to_string(ExtraFieldPolicy p) noexcept {
  return p == ExtraFieldPolicy::Reject ? "reject" : "drop";
}

}
