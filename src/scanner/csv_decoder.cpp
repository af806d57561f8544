#include "csv_to_json/csv_decoder.hpp"
#include <simdjson.h>
#include <string>
#include <string_view>
#include <vector>

namespace ctj {

namespace {

enum class Mode { RecordStart, FieldStart, Unquoted, Quoted, QuoteInQuoted, AfterCr };
enum class Step { More, Row, Fail };

constexpr char kBom[3] = {'\xEF', '\xBB', '\xBF'};

}

struct CsvDecoder::Impl {
  ChunkSource& input;
  CsvDecoderConfig cfg;

  Mode mode{Mode::RecordStart};
  std::string_view chunk;
  std::size_t pos{0};
  int bom_pos{0};  // bytes of a leading BOM matched so far; -1 once past it
  bool quoted_cr{false};  // last quoted byte was CR; a following LF is the same line break
  bool input_done{false};
  bool done{false};
  bool has_error{false};
  Error err;

  std::vector<std::string> header;
  bool have_header{false};

  // Current row: field bytes back to back, `ends` marks where each field stops.
  std::string row;
  std::vector<std::size_t> ends;
  std::vector<std::string_view> values;

  std::uint64_t line{1};
  std::uint64_t row_line{1};
  std::uint64_t records{0};
  std::uint64_t dropped{0};
  std::uint64_t bytes{0};

  Impl(ChunkSource& in, const CsvDecoderConfig& c) : input(in), cfg(c) {}

  void fail(ErrorKind kind, std::string message, std::uint64_t at_line, std::uint64_t at_record) {
    has_error = true;
    err.kind = kind;
    err.message = std::move(message);
    err.line = at_line;
    err.record = at_record;
  }

  void end_field() { ends.push_back(row.size()); }

  Step terminate(char c) {
    end_field();
    ++line;
    mode = (c == '\r') ? Mode::AfterCr : Mode::RecordStart;
    return Step::Row;
  }

  Step step(char c) {
    const char d = cfg.options.delimiter;
    const char q = cfg.options.quote;
    switch (mode) {
      case Mode::AfterCr:
        mode = Mode::RecordStart;
        if (c == '\n') break;  // CRLF, line already counted at CR
        [[fallthrough]];
      case Mode::RecordStart:
        if (c == '\n' || c == '\r') {  // blank line
          ++line;
          if (c == '\r') mode = Mode::AfterCr;
          break;
        }
        row_line = line;
        if (c == q)      { mode = Mode::Quoted; }
        else if (c == d) { end_field(); mode = Mode::FieldStart; }
        else             { row += c; mode = Mode::Unquoted; }
        break;
      case Mode::FieldStart:
        if (c == q)                     { mode = Mode::Quoted; }
        else if (c == d)                { end_field(); }
        else if (c == '\n' || c == '\r') return terminate(c);
        else                            { row += c; mode = Mode::Unquoted; }
        break;
      case Mode::Unquoted:
        if (c == d)                     { end_field(); mode = Mode::FieldStart; }
        else if (c == '\n' || c == '\r') return terminate(c);
        else                            row += c;
        break;
      case Mode::Quoted: {
        const bool after_cr = quoted_cr;
        quoted_cr = false;
        if (c == q) { mode = Mode::QuoteInQuoted; break; }
        if (c == '\r') { ++line; quoted_cr = true; }
        else if (c == '\n' && !after_cr) ++line;
        row += c;
        break;
      }
      case Mode::QuoteInQuoted:
        if (c == q)                     { row += c; mode = Mode::Quoted; }  // doubled quote
        else if (c == d)                { end_field(); mode = Mode::FieldStart; }
        else if (c == '\n' || c == '\r') return terminate(c);
        else                            { row += c; mode = Mode::Unquoted; }  // "ab"cd -> abcd
        break;
    }
    return Step::More;
  }

  // Consume bytes of the current chunk until a row completes or the chunk runs out.
  Step scan() {
    while (pos < chunk.size()) {
      const char c = chunk[pos++];
      Step s = Step::More;
      if (bom_pos >= 0) {
        if (c == kBom[bom_pos]) {
          if (++bom_pos == 3) bom_pos = -1;
          continue;
        }
        // Not a BOM after all: replay what was held back.
        const int held = bom_pos;
        bom_pos = -1;
        for (int i = 0; i < held; ++i) (void)step(kBom[i]);  // non-terminators, cannot end a row
      }
      s = step(c);
      if (cfg.max_record_bytes && row.size() > cfg.max_record_bytes) {
        fail(ErrorKind::Malformed,
             "record exceeds " + std::to_string(cfg.max_record_bytes) + " bytes",
             row_line, have_header ? records + 1 : 0);
        return Step::Fail;
      }
      if (s == Step::Row) return s;
    }
    return Step::More;
  }

  // End of input: flush the last row, if any.
  Step finish() {
    if (bom_pos > 0) {
      const int held = bom_pos;
      bom_pos = -1;
      for (int i = 0; i < held; ++i) (void)step(kBom[i]);
    }
    switch (mode) {
      case Mode::RecordStart:
      case Mode::AfterCr:
        return Step::More;
      case Mode::Quoted:
        fail(ErrorKind::Malformed, "unterminated quoted field", row_line,
             have_header ? records + 1 : 0);
        return Step::Fail;
      case Mode::FieldStart:
      case Mode::Unquoted:
      case Mode::QuoteInQuoted:
        end_field();
        mode = Mode::RecordStart;
        return Step::Row;
    }
    return Step::More;
  }

  // Turn the buffered row into the header or a record. Returns true when `out` was set.
  bool complete_row(Record& out) {
    values.clear();
    std::size_t begin = 0;
    for (std::size_t e : ends) {
      values.emplace_back(row.data() + begin, e - begin);
      begin = e;
    }

    const std::uint64_t rec = have_header ? records + 1 : 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
      if (!simdjson::validate_utf8(values[i].data(), values[i].size())) {
        fail(ErrorKind::Encoding,
             (have_header ? "field " : "header field ") + std::to_string(i + 1) + " is not valid UTF-8",
             row_line, rec);
        return false;
      }
    }

    if (!have_header) {
      header.assign(values.begin(), values.end());
      have_header = true;
      return false;
    }

    ++records;
    const RowShape shape = shape_row(header.size(), values.size(), cfg.extra_fields);
    if (shape.rejected) {
      fail(ErrorKind::Malformed,
           "record has " + std::to_string(values.size()) + " fields but header has " +
           std::to_string(header.size()),
           row_line, records);
      return false;
    }
    values.resize(shape.kept);
    dropped += shape.dropped;
    out = Record(&header, &values);
    return true;
  }

  bool next(Record& out) {
    if (done || has_error) return false;
    for (;;) {
      // Buffers of the previously yielded row are reused from here on.
      row.clear();
      ends.clear();

      Step s = Step::More;
      while (s == Step::More) {
        if (pos < chunk.size()) {
          s = scan();
        } else if (input_done) {
          s = finish();
          if (s == Step::More) { done = true; return false; }
        } else {
          std::string_view c;
          if (input.next(c)) {
            chunk = c;
            pos = 0;
            bytes += c.size();
          } else if (input.failed()) {
            fail(ErrorKind::Io, input.error(), 0, have_header ? records + 1 : 0);
            return false;
          } else {
            input_done = true;
          }
        }
      }
      if (s == Step::Fail) return false;
      if (complete_row(out)) return true;
      if (has_error) return false;
    }
  }
};

CsvDecoder::CsvDecoder(ChunkSource& input, const CsvDecoderConfig& cfg)
  : p_(new Impl(input, cfg)) {}

CsvDecoder::~CsvDecoder() { delete p_; }

bool CsvDecoder::next(Record& out) { return p_->next(out); }
bool CsvDecoder::failed() const noexcept { return p_->has_error; }
const Error& CsvDecoder::error() const noexcept { return p_->err; }
std::uint64_t CsvDecoder::records() const noexcept { return p_->records; }
std::uint64_t CsvDecoder::dropped_fields() const noexcept { return p_->dropped; }
std::uint64_t CsvDecoder::bytes_read() const noexcept { return p_->bytes; }

}
