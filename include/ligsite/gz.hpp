// Copyright The ligsite Authors.
//
// Transparent reading of gzipped files. Uses zlib.

#ifndef LIGSITE_GZ_HPP_
#define LIGSITE_GZ_HPP_

#include <memory>
#include <string>
#include "input.hpp"    // BasicInput
#include "util.hpp"     // iends_with

namespace ligsite {

extern const char* const zlib_description;

// the same interface as FileStream and MemoryStream
struct GzStream final : public AnyStream {
  GzStream(void* f_) : f(f_) {}
  char* gets(char* line, int size) override;
  int getc() override;
private:
  void* f;  // implementation detail
};

class MaybeGzipped : public BasicInput {
public:
  explicit MaybeGzipped(const std::string& path);
  ~MaybeGzipped();
  MaybeGzipped(const MaybeGzipped&) = delete;
  MaybeGzipped& operator=(const MaybeGzipped&) = delete;

  bool is_compressed() const { return iends_with(path(), ".gz"); }

  // The returned stream must not outlive this object.
  std::unique_ptr<AnyStream> create_stream();

private:
  void* file_ = nullptr;
};

} // namespace ligsite

#endif
