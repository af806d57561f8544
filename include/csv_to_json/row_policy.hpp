#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace ctj {

// What to do with values beyond the header's width.
enum class ExtraFieldPolicy { Drop, Reject };

struct RowShape {
  std::size_t kept = 0;     // values that become record fields
  std::size_t dropped = 0;  // excess values discarded (Drop only)
  bool rejected = false;    // row must fail as malformed (Reject only)
};

// Single place deciding how a row of `field_count` values maps onto a header.
// Short rows keep every value (missing trailing keys are absent).
RowShape shape_row(std::size_t header_width, std::size_t field_count, ExtraFieldPolicy policy) noexcept;

std::optional<ExtraFieldPolicy> parse_extra_field_policy(std::string_view s);
const char* to_string(ExtraFieldPolicy p) noexcept;

}
