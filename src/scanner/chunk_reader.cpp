#include "csv_to_json/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

namespace ctj {

struct FileChunkReader::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  bool owns{false};
  bool opened{false};
  bool eof{false};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::vector<char> buf;

  ~Impl() { if (f && owns) std::fclose(f); }

  bool open(std::string& err) {
    opened = true;
    if (path == "-") { f = stdin; owns = false; }
    else { f = std::fopen(path.c_str(), "rb"); owns = true; }
    if (!f) {
      last_errno = errno;
      err = "cannot open " + path + ": " + std::strerror(last_errno);
      return false;
    }
    buf.resize(cfg.chunk_bytes ? cfg.chunk_bytes : 1);
    return true;
  }

  bool read(std::string_view& out, std::string& err) {
    if (eof) return false;
    if (!opened && !open(err)) return false;
    if (!f) return false;

    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0 && std::ferror(f)) {
      last_errno = errno;
      err = "read failed on " + path + ": " + std::strerror(last_errno);
      return false;
    }
    if (n == 0) { eof = true; return false; }
    bytes += n;
    out = std::string_view(buf.data(), n);
    return true;
  }
};

FileChunkReader::FileChunkReader(std::string path)
  : FileChunkReader(std::move(path), Config{}) {}

FileChunkReader::FileChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

FileChunkReader::~FileChunkReader() { delete p_; }

bool FileChunkReader::next(std::string_view& out) {
  if (failed()) return false;
  return p_->read(out, err_);
}

int  FileChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t FileChunkReader::bytes_read() const noexcept { return p_->bytes; }

bool MemoryChunkSource::next(std::string_view& out) {
  if (pos_ >= data_.size()) return false;
  const std::size_t n = chunk_bytes_ ? chunk_bytes_ : data_.size();
  out = data_.substr(pos_, n);
  pos_ += out.size();
  return true;
}

void QueueChunkSource::push(std::string chunk) {
  if (chunk.empty()) return;
  bytes_ += chunk.size();
  queue_.push_back(std::move(chunk));
}

void QueueChunkSource::fail(std::string message) {
  failed_pending_ = true;
  fail_msg_ = message.empty() ? std::string("input stream failed") : std::move(message);
  closed_ = true;
}

bool QueueChunkSource::next(std::string_view& out) {
  if (failed()) return false;
  if (queue_.empty()) {
    // Chunks received before a failure are still delivered; the error surfaces after them.
    if (failed_pending_) err_ = fail_msg_;
    else if (!closed_) err_ = "input ended before the producer closed it";
    return false;
  }
  current_ = std::move(queue_.front());
  queue_.pop_front();
  out = current_;
  return true;
}

}
