#include "csv_to_json/record.hpp"
#include "csv_to_json/json_writer.hpp"

namespace ctj {

bool Record::find(std::string_view field, std::string_view& out) const {
  for (std::size_t i = 0; i < size(); ++i) {
    if (name(i) == field) { out = value(i); return true; }
  }
  return false;
}

bool write_json(JsonWriter& w, const Record& r) {
  w.begin_object();
  for (std::size_t i = 0; i < r.size(); ++i) {
    if (!w.key(r.name(i))) return false;
    if (!w.string(r.value(i))) return false;
  }
  w.end_object();
  return true;
}

}
