#pragma once
#include "csv_to_json/error.hpp"
#include "csv_to_json/pipeline.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ctj {

struct ServiceStats {
  std::uint64_t requests = 0;
  std::uint64_t rejected = 0;   // answered with an error status before streaming
  std::uint64_t completed = 0;
  std::uint64_t failed = 0;     // failed after the response was committed
  std::uint64_t cancelled = 0;
  std::uint64_t records = 0;
  std::uint64_t dropped_fields = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;

  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

// Process-wide conversion counters, shared by all request threads.
class MetricsRegistry {
public:
  void add_request();
  void add_rejected(const Error& e);
  void add_conversion(ConversionOutcome outcome, const ConversionStats& s, const Error* e = nullptr);

  ServiceStats snapshot() const;
  std::string to_json() const;

private:
  mutable std::mutex mu_;
  ServiceStats st_;
};

}
