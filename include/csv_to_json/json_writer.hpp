#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctj {

// Appends compact JSON to a caller-owned buffer. Commas between members and
// elements are inserted automatically. key()/string() refuse text that is not
// valid UTF-8 and leave the reason in error().
class JsonWriter {
public:
  explicit JsonWriter(std::string& out) : out_(out) {}

  void begin_object();
  void end_object();
  void begin_array();
  void end_array();

  bool key(std::string_view k);
  bool string(std::string_view s);
  void number(std::uint64_t v);
  void number(double v);
  void boolean(bool b);
  void null();

  const std::string& error() const noexcept { return err_; }

private:
  void separate();
  bool escaped(std::string_view s);

  std::string& out_;
  std::vector<bool> first_;   // per open container: no member written yet
  bool after_key_{false};
  std::string err_;
};

// Serialization hooks used by JsonArrayEncoder; add an overload (found by ADL)
// to make another type encodable.
bool write_json(JsonWriter& w, std::string_view s);
bool write_json(JsonWriter& w, const std::string& s);
bool write_json(JsonWriter& w, const std::vector<std::pair<std::string, std::string>>& fields);

}
