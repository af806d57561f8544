#include "csv_to_json/metrics.hpp"
#include "csv_to_json/json_writer.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace ctj {

void MetricsRegistry::add_request() {
  std::lock_guard<std::mutex> lk(mu_);
  ++st_.requests;
}

void MetricsRegistry::add_rejected(const Error& e) {
  std::lock_guard<std::mutex> lk(mu_);
  ++st_.rejected;
  ++st_.errors_by_kind[to_string(e.kind)];
}

void MetricsRegistry::add_conversion(ConversionOutcome outcome, const ConversionStats& s, const Error* e) {
  std::lock_guard<std::mutex> lk(mu_);
  switch (outcome) {
    case ConversionOutcome::Completed: ++st_.completed; break;
    case ConversionOutcome::Failed:    ++st_.failed;    break;
    case ConversionOutcome::Cancelled: ++st_.cancelled; break;
  }
  if (outcome == ConversionOutcome::Failed && e) ++st_.errors_by_kind[to_string(e->kind)];
  st_.records += s.records;
  st_.dropped_fields += s.dropped_fields;
  st_.bytes_in += s.bytes_in;
  st_.bytes_out += s.bytes_out;
}

ServiceStats MetricsRegistry::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return st_;
}

std::string MetricsRegistry::to_json() const {
  const ServiceStats s = snapshot();
  std::string out;
  JsonWriter w(out);
  w.begin_object();
  w.key("requests");       w.number(s.requests);
  w.key("rejected");       w.number(s.rejected);
  w.key("completed");      w.number(s.completed);
  w.key("failed");         w.number(s.failed);
  w.key("cancelled");      w.number(s.cancelled);
  w.key("records");        w.number(s.records);
  w.key("dropped_fields"); w.number(s.dropped_fields);
  w.key("bytes_in");       w.number(s.bytes_in);
  w.key("bytes_out");      w.number(s.bytes_out);

  // sorted so the output is stable
  std::vector<std::pair<std::string, std::uint64_t>> kinds(s.errors_by_kind.begin(), s.errors_by_kind.end());
  std::sort(kinds.begin(), kinds.end());
  w.key("errors_by_kind");
  w.begin_object();
  for (auto& kv : kinds) { w.key(kv.first); w.number(kv.second); }
  w.end_object();

  w.end_object();
  return out;
}

}
