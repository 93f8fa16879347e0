#pragma once
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

// Temporary card image file for tests. Removed on destruction.
namespace sdemu_test {

  // Byte i of the pattern image: distinct per 256-byte page so offsets are visible.
  inline uint8_t pattern_byte(size_t i) { return (uint8_t)((i * 7u) ^ (i >> 8)); }

  inline std::vector<uint8_t> pattern(size_t n) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = pattern_byte(i);
    return v;
  }

  class TempImage {
  public:
    // Creates a file filled with `contents`.
    explicit TempImage(const std::vector<uint8_t>& contents) : TempImage() {
      FILE* fp = fopen(path_.c_str(), "wb");
      if (!fp) abort();
      if (!contents.empty() && fwrite(contents.data(), 1, contents.size(), fp) != contents.size()) abort();
      fclose(fp);
    }

    // Reserves a unique path without creating the file.
    static TempImage missing() {
      TempImage t;
      unlink(t.path_.c_str());
      return t;
    }

    ~TempImage() { if (!path_.empty()) unlink(path_.c_str()); }

    TempImage(TempImage&& o) noexcept : path_(std::move(o.path_)) { o.path_.clear(); }
    TempImage(const TempImage&) = delete;
    TempImage& operator=(const TempImage&) = delete;

    const std::string& path() const { return path_; }

    std::vector<uint8_t> contents() const {
      std::vector<uint8_t> out;
      FILE* fp = fopen(path_.c_str(), "rb");
      if (!fp) return out;
      uint8_t buf[4096];
      size_t r;
      while ((r = fread(buf, 1, sizeof(buf), fp)) > 0) out.insert(out.end(), buf, buf + r);
      fclose(fp);
      return out;
    }

  private:
    TempImage() {
      char tmpl[] = "/tmp/sdemu_test_XXXXXX";
      int fd = mkstemp(tmpl);
      if (fd < 0) abort();
      close(fd);
      path_ = tmpl;
    }

    std::string path_;
  };

} // namespace sdemu_test
