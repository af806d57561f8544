#include "csv_to_json/pipeline.hpp"

namespace ctj {

ConversionPipeline::ConversionPipeline(ChunkSource& input, const CsvDecoderConfig& cfg)
  : decoder_(input, cfg), encoder_(decoder_) {}

bool ConversionPipeline::next(std::string_view& chunk) { return encoder_.next(chunk); }

ConversionStats ConversionPipeline::stats() const noexcept {
  ConversionStats s;
  s.records = decoder_.records();
  s.dropped_fields = decoder_.dropped_fields();
  s.bytes_in = decoder_.bytes_read();
  s.bytes_out = encoder_.bytes();
  s.chunks = encoder_.chunks();
  return s;
}

const char* to_string(ConversionOutcome o) noexcept {
  switch (o) {
    case ConversionOutcome::Completed: return "completed";
    case ConversionOutcome::Failed:    return "failed";
    case ConversionOutcome::Cancelled: return "cancelled";
  }
  return "unknown";
}

ConversionOutcome convert(ChunkSource& input, const CsvDecoderConfig& cfg,
                          const ChunkSink& sink,
                          ConversionStats* stats,
                          Error* err) {
  ConversionPipeline pipe(input, cfg);
  ConversionOutcome outcome = ConversionOutcome::Completed;
  std::string_view chunk;
  while (pipe.next(chunk)) {
    if (!sink(chunk)) { outcome = ConversionOutcome::Cancelled; break; }
  }
  if (outcome != ConversionOutcome::Cancelled && pipe.failed()) {
    outcome = ConversionOutcome::Failed;
    if (err) *err = pipe.error();
  }
  if (stats) *stats = pipe.stats();
  return outcome;
}

}
