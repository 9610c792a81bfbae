// Copyright The ligsite Authors.
//
// Input abstraction.
// Used to decouple line reading from decompression.

#ifndef LIGSITE_INPUT_HPP_
#define LIGSITE_INPUT_HPP_

#include <cstdio>  // for FILE, fgets, fgetc
#include <cstring> // for memchr, memcpy, strlen
#include <memory>  // for unique_ptr
#include <string>
#include "fileutil.hpp"  // for fileptr_t

namespace ligsite {

// base class for FileStream, MemoryStream and GzStream
struct AnyStream {
  virtual ~AnyStream() = default;

  virtual char* gets(char* line, int size) = 0;
  virtual int getc() = 0;

  // Reads one line (with the newline, if it fits) into line.
  // Returns the length or 0 at the end of input.
  size_t copy_line(char* line, int size) {
    if (!gets(line, size))
      return 0;
    size_t len = std::strlen(line);
    // If a line is longer than size we discard the rest of it.
    if (len > 0 && line[len-1] != '\n')
      for (int c = getc(); c > 0 /* not 0 nor EOF */ && c != '\n'; c = getc())
        continue;
    return len;
  }
};

struct FileStream final : public AnyStream {
  FileStream(std::FILE* f_) : f(f_, needs_fclose{false}) {}
  FileStream(const char* path, const char* mode) : f(file_open_or(path, mode, stdin)) {}

  char* gets(char* line, int size) override { return std::fgets(line, size, f.get()); }
  int getc() override { return std::fgetc(f.get()); }

private:
  fileptr_t f;
};

struct MemoryStream final : public AnyStream {
  MemoryStream(const char* start_, size_t size)
    : end(start_ + size), cur(start_) {}

  char* gets(char* line, int size) override {
    --size; // fgets reads in at most one less than size characters
    if (cur >= end)
      return nullptr;
    if (size > end - cur)
      size = int(end - cur);
    const char* nl = (const char*) std::memchr(cur, '\n', size);
    size_t len = nl ? nl - cur + 1 : size;
    std::memcpy(line, cur, len);
    line[len] = '\0';
    cur += len;
    return line;
  }
  int getc() override { return cur < end ? (unsigned char) *cur++ : EOF; }

private:
  const char* const end;
  const char* cur;
};

class BasicInput {
public:
  explicit BasicInput(const std::string& path) : path_(path) {}

  const std::string& path() const { return path_; }

  // Does the path stand for stdin?
  bool is_stdin() const { return path() == "-"; }

  std::unique_ptr<AnyStream> create_stream() {
    return std::unique_ptr<AnyStream>(new FileStream(path().c_str(), "rb"));
  }

private:
  std::string path_;
};

} // namespace ligsite
#endif
