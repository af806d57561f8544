#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

namespace ctj {

// Pull-based source of raw input bytes. next() hands out one chunk at a time;
// the view stays valid until the following call. false means end of input or,
// if failed(), a read/transport error.
class ChunkSource {
public:
  virtual ~ChunkSource() = default;

  virtual bool next(std::string_view& out) = 0;

  bool failed() const noexcept { return !err_.empty(); }
  const std::string& error() const noexcept { return err_; }

protected:
  std::string err_;
};

// Reads a file (or stdin for "-") in fixed-size blocks.
class FileChunkReader : public ChunkSource {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024;  // 512 KiB
  };

  explicit FileChunkReader(std::string path);      // uses default Config{}
  FileChunkReader(std::string path, Config cfg);   // explicit Config
  ~FileChunkReader() override;

  FileChunkReader(const FileChunkReader&) = delete;
  FileChunkReader& operator=(const FileChunkReader&) = delete;

  bool next(std::string_view& out) override;

  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Serves a borrowed buffer in slices of `chunk_bytes` (0 = whole buffer at once).
class MemoryChunkSource : public ChunkSource {
public:
  explicit MemoryChunkSource(std::string_view data, std::size_t chunk_bytes = 0)
    : data_(data), chunk_bytes_(chunk_bytes) {}

  bool next(std::string_view& out) override;

private:
  std::string_view data_;
  std::size_t chunk_bytes_;
  std::size_t pos_{0};
};

// FIFO of owned chunks filled by a producer (e.g. the HTTP body reader).
// Not synchronized: push/close/fail must happen-before the consumer's next().
// Draining a queue that was neither closed nor failed is an error.
class QueueChunkSource : public ChunkSource {
public:
  void push(std::string chunk);
  void close() noexcept { closed_ = true; }
  void fail(std::string message);

  bool next(std::string_view& out) override;

  std::uint64_t bytes_pushed() const noexcept { return bytes_; }

private:
  std::deque<std::string> queue_;
  std::string current_;
  std::uint64_t bytes_{0};
  bool closed_{false};
  bool failed_pending_{false};
  std::string fail_msg_;
};

}
