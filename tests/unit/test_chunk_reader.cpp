#include "csv_to_json/chunk_reader.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::string drain(ctj::ChunkSource& src, std::size_t* chunks = nullptr) {
  std::string all;
  std::string_view c;
  std::size_t n = 0;
  while (src.next(c)) { all.append(c.data(), c.size()); ++n; }
  if (chunks) *chunks = n;
  return all;
}

int main(){
  const fs::path f = "tests/data/utf8.csv";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  std::ifstream in(f, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  const std::string expected = ss.str();

  ctj::FileChunkReader::Config cfg;
  cfg.chunk_bytes = 7;
  ctj::FileChunkReader r(f.string(), cfg);
  std::size_t chunks = 0;
  const std::string got = drain(r, &chunks);
  check(got == expected, "file chunks concatenate to the file contents");
  check(!r.failed(), "file reader ends cleanly");
  check(r.bytes_read() == fs::file_size(f), "bytes_read matches file size");
  check(chunks == (expected.size() + 6) / 7, "file read in 7-byte blocks");

  std::string_view c;
  check(!r.next(c), "reader stays at end");

  ctj::FileChunkReader missing("tests/data/does-not-exist.csv");
  check(!missing.next(c) && missing.failed() && missing.last_error() == ENOENT,
        "missing file reports an error instead of end of input");

  const std::string text = "abcdefghij";
  ctj::MemoryChunkSource mem(text, 3);
  std::size_t mem_chunks = 0;
  check(drain(mem, &mem_chunks) == text && mem_chunks == 4, "memory source slices 10 bytes into 4 chunks");

  ctj::MemoryChunkSource whole(text);
  std::size_t whole_chunks = 0;
  check(drain(whole, &whole_chunks) == text && whole_chunks == 1, "chunk size 0 serves the whole buffer");

  ctj::QueueChunkSource q;
  q.push("ab");
  q.push("");
  q.push("cd");
  q.close();
  std::size_t q_chunks = 0;
  check(drain(q, &q_chunks) == "abcd" && q_chunks == 2 && !q.failed(), "queue delivers pushed chunks in order, skips empty");
  check(q.bytes_pushed() == 4, "queue counts pushed bytes");

  ctj::QueueChunkSource open_q;
  open_q.push("ab");
  check(open_q.next(c) && c == "ab" && !open_q.next(c) && open_q.failed(),
        "draining a queue that was never closed is an error");

  ctj::QueueChunkSource qf;
  qf.push("xy");
  qf.fail("connection reset");
  check(qf.next(c) && c == "xy", "queued data before a failure is still delivered");
  check(!qf.next(c) && qf.failed() && qf.error() == "connection reset", "failure surfaces after the queued data");

  std::cout << (failures ? "[FAIL] " : "[PASS] ") << "chunk sources: " << failures << " failure(s)\n";
  return failures ? 1 : 0;
}
