#pragma once
#include "csv_to_json/error.hpp"
#include "csv_to_json/json_writer.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ctj {

// Pulls values from `Source` and hands out the text of one JSON array, one
// element per chunk: "[" + first, then "," + each next, then "]".
//
// Source requirements:
//   using value_type = ...;              // default constructible
//   bool next(value_type&);              // false at end or on failure
//   bool failed() const;
//   const Error& error() const;
// and an overload `bool write_json(JsonWriter&, const value_type&)` reachable by ADL.
//
// An upstream or serialization failure ends the chunk sequence without the
// closing bracket. Whatever was already handed out stays a truncated document.
template <typename Source>
class JsonArrayEncoder {
public:
  using value_type = typename Source::value_type;

  explicit JsonArrayEncoder(Source& src, std::size_t reserve_bytes = 1024)
    : src_(src) { buf_.reserve(reserve_bytes); }

  // Next chunk; the view is valid until the following call.
  bool next(std::string_view& chunk) {
    switch (stage_) {
      case Stage::Open: {
        buf_.clear();
        buf_ += '[';
        value_type v{};
        if (src_.next(v)) {
          if (!append(v)) return false;
          stage_ = Stage::Elements;
        } else {
          if (src_.failed()) return fail(src_.error());
          stage_ = Stage::Close;
        }
        return emit(chunk);
      }
      case Stage::Elements: {
        value_type v{};
        if (!src_.next(v)) {
          if (src_.failed()) return fail(src_.error());
          buf_.assign(1, ']');
          stage_ = Stage::Done;
          return emit(chunk);
        }
        buf_.assign(1, ',');
        if (!append(v)) return false;
        return emit(chunk);
      }
      case Stage::Close:
        buf_.assign(1, ']');
        stage_ = Stage::Done;
        return emit(chunk);
      case Stage::Done:
      case Stage::Failed:
        return false;
    }
    return false;
  }

  bool failed() const noexcept { return stage_ == Stage::Failed; }
  // True once the closing bracket has been handed out.
  bool finished() const noexcept { return stage_ == Stage::Done; }
  const Error& error() const noexcept { return err_; }

  std::uint64_t elements() const noexcept { return elements_; }
  std::uint64_t chunks() const noexcept { return chunks_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

private:
  enum class Stage { Open, Elements, Close, Done, Failed };

  bool append(const value_type& v) {
    JsonWriter w(buf_);
    if (!write_json(w, v)) {
      Error e;
      e.kind = ErrorKind::Encode;
      e.message = w.error().empty() ? std::string("value has no JSON representation") : w.error();
      e.record = elements_ + 1;
      return fail(e);
    }
    ++elements_;
    return true;
  }

  bool emit(std::string_view& chunk) {
    chunk = buf_;
    ++chunks_;
    bytes_ += buf_.size();
    return true;
  }

  bool fail(const Error& e) {
    err_ = e;
    stage_ = Stage::Failed;
    buf_.clear();
    return false;
  }

  Source& src_;
  Stage stage_{Stage::Open};
  std::string buf_;
  Error err_;
  std::uint64_t elements_{0};
  std::uint64_t chunks_{0};
  std::uint64_t bytes_{0};
};

}
