#include <cassert>
#include <cstdint>
#include <vector>

#include "Storage.hpp"
#include "TempImage.hpp"

// A missing image can only be opened when an explicit size is given.
// An explicit size resizes an existing image.

int main() {
  using namespace Sdemu;

  // Missing, no size: fails in both modes and leaves the backend closed.
  {
    sdemu_test::TempImage missing = sdemu_test::TempImage::missing();
    Storage::State st;
    assert(!Storage::Open(st, missing.path(), 0, false));
    assert(!Storage::IsOpen(st));
    assert(!Storage::Open(st, missing.path(), 0, true));
    assert(!Storage::IsOpen(st));
  }

  // Missing, non-persistent with size: zero-filled private image, no file created.
  {
    sdemu_test::TempImage missing = sdemu_test::TempImage::missing();
    Storage::State st;
    bool ok = Storage::Open(st, missing.path(), 4096, false);
    assert(ok);
    assert(Storage::Length(st) == 4096);
    std::vector<uint8_t> b(16, 0xAA);
    Storage::SetPosition(st, 4000);
    assert(Storage::Read(st, b.data(), b.size()) == 16);
    for (uint8_t v : b) assert(v == 0);
    Storage::Close(st);
    assert(access(missing.path().c_str(), F_OK) != 0);
  }

  // Missing, persistent with size: file is created with that length.
  {
    sdemu_test::TempImage missing = sdemu_test::TempImage::missing();
    Storage::State st;
    bool ok = Storage::Open(st, missing.path(), 1536, true);
    assert(ok);
    assert(Storage::Length(st) == 1536);
    Storage::Close(st);
    assert(missing.contents().size() == 1536);
  }

  // Existing image grown by an explicit size: old bytes kept, tail zeroed.
  {
    const std::vector<uint8_t> original = sdemu_test::pattern(1000);
    sdemu_test::TempImage img(original);
    Storage::State st;
    bool ok = Storage::Open(st, img.path(), 2048, false);
    assert(ok);
    assert(Storage::Length(st) == 2048);
    std::vector<uint8_t> b(2048);
    assert(Storage::Read(st, b.data(), b.size()) == 2048);
    for (size_t i = 0; i < 1000; ++i) assert(b[i] == original[i]);
    for (size_t i = 1000; i < 2048; ++i) assert(b[i] == 0);
    Storage::Close(st);
    assert(img.contents() == original);
  }

  return 0;
}
