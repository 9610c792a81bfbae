// Copyright The ligsite Authors.

#include <ligsite/gz.hpp>
#include <zlib.h>
#include <ligsite/fail.hpp>  // for sys_fail

namespace ligsite {

const char* const zlib_description = "zlib " ZLIB_VERSION;

char* GzStream::gets(char* line, int size) {
  return gzgets((gzFile)f, line, size);
}

int GzStream::getc() {
  return gzgetc((gzFile)f);
}


MaybeGzipped::MaybeGzipped(const std::string& path) : BasicInput(path) {}

MaybeGzipped::~MaybeGzipped() {
  if (file_)
#if ZLIB_VERNUM >= 0x1235
    gzclose_r((gzFile)file_);
#else
    gzclose((gzFile)file_);
#endif
}

std::unique_ptr<AnyStream> MaybeGzipped::create_stream() {
  if (is_compressed()) {
    file_ = gzopen(path().c_str(), "rb");
    if (!file_)
      sys_fail("Failed to gzopen " + path());
#if ZLIB_VERNUM >= 0x1235
    gzbuffer((gzFile)file_, 64*1024);
#endif
    return std::unique_ptr<AnyStream>(new GzStream(file_));
  }
  return BasicInput::create_stream();
}

} // namespace ligsite
