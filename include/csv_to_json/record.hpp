#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ctj {

class JsonWriter;

// One decoded data row: field names from the header, values from the row,
// both in header order. Non-owning; valid until the decoder's next pull.
class Record {
public:
  Record() = default;
  Record(const std::vector<std::string>* header,
         const std::vector<std::string_view>* values)
      : header_(header), values_(values) {}

  // Number of fields present (never more than the header's width).
  std::size_t size() const noexcept { return values_ ? values_->size() : 0; }
  bool empty() const noexcept { return size() == 0; }

  std::string_view name(std::size_t i) const {
    return (header_ && i < header_->size()) ? std::string_view((*header_)[i]) : std::string_view{};
  }

  std::string_view value(std::size_t i) const {
    return (values_ && i < values_->size()) ? (*values_)[i] : std::string_view{};
  }

  // Value for a field name; false if the row did not supply it.
  bool find(std::string_view field, std::string_view& out) const;

private:
  const std::vector<std::string>* header_{nullptr};
  const std::vector<std::string_view>* values_{nullptr};
};

// {"name":"value",...} in header order.
bool write_json(JsonWriter& w, const Record& r);

}
