#pragma once
#include "csv_to_json/chunk_reader.hpp"
#include "csv_to_json/error.hpp"
#include "csv_to_json/parse_options.hpp"
#include "csv_to_json/record.hpp"
#include "csv_to_json/row_policy.hpp"
#include <cstddef>
#include <cstdint>

namespace ctj {

struct CsvDecoderConfig {
  ParseOptions options;
  ExtraFieldPolicy extra_fields = ExtraFieldPolicy::Drop;
  std::size_t max_record_bytes = 8 * 1024 * 1024;  // 8 MiB guard per row; 0 = unlimited
};

// Streaming CSV -> Record decoder. Pulls input chunks only when the current
// one is exhausted and buffers nothing but the row being parsed. The first
// non-empty row is the header and is never yielded. The first error ends the
// sequence.
class CsvDecoder {
public:
  using value_type = Record;

  CsvDecoder(ChunkSource& input, const CsvDecoderConfig& cfg);
  ~CsvDecoder();

  CsvDecoder(const CsvDecoder&) = delete;
  CsvDecoder& operator=(const CsvDecoder&) = delete;

  // Next data record; the view is valid until the following call.
  bool next(Record& out);

  bool failed() const noexcept;
  const Error& error() const noexcept;

  std::uint64_t records() const noexcept;
  std::uint64_t dropped_fields() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
