#pragma once
#include "csv_to_json/chunk_reader.hpp"
#include "csv_to_json/csv_decoder.hpp"
#include "csv_to_json/error.hpp"
#include "csv_to_json/json_array_encoder.hpp"
#include <cstdint>
#include <functional>
#include <string_view>

namespace ctj {

struct ConversionStats {
  std::uint64_t records = 0;
  std::uint64_t dropped_fields = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  std::uint64_t chunks = 0;
};

// raw bytes -> CsvDecoder -> JsonArrayEncoder -> JSON chunks, one request's worth.
// Each next() drives the decoder to at most one record and yields one chunk.
class ConversionPipeline {
public:
  ConversionPipeline(ChunkSource& input, const CsvDecoderConfig& cfg);

  ConversionPipeline(const ConversionPipeline&) = delete;
  ConversionPipeline& operator=(const ConversionPipeline&) = delete;

  bool next(std::string_view& chunk);

  bool failed() const noexcept { return encoder_.failed(); }
  bool finished() const noexcept { return encoder_.finished(); }
  // Once true, a failure can only show up as a truncated document.
  bool committed() const noexcept { return encoder_.chunks() > 0; }
  const Error& error() const noexcept { return encoder_.error(); }

  ConversionStats stats() const noexcept;

private:
  CsvDecoder decoder_;
  JsonArrayEncoder<CsvDecoder> encoder_;
};

enum class ConversionOutcome { Completed, Failed, Cancelled };

const char* to_string(ConversionOutcome o) noexcept;

// Receives each chunk; return false to stop (consumer gone).
using ChunkSink = std::function<bool(std::string_view)>;

// Drain a whole conversion into `sink`. On Failed, *err holds the terminal error.
ConversionOutcome convert(ChunkSource& input, const CsvDecoderConfig& cfg,
                          const ChunkSink& sink,
                          ConversionStats* stats = nullptr,
                          Error* err = nullptr);

}
