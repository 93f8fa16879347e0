#include <cassert>
#include <cstdint>
#include <vector>

#include "Storage.hpp"
#include "TempImage.hpp"

// Persistent storage writes land directly in the image file.

int main() {
  using namespace Sdemu;

  std::vector<uint8_t> expect = sdemu_test::pattern(2048);
  sdemu_test::TempImage img(expect);

  {
    Storage::State st;
    bool ok = Storage::Open(st, img.path(), 0, true);
    assert(ok);
    assert(st.kind == Storage::State::FILE_BACKED);
    assert(Storage::Length(st) == 2048);

    const std::vector<uint8_t> ones(512, 0xFF);
    Storage::SetPosition(st, 512);
    assert(Storage::Write(st, ones.data(), ones.size()) == 512);

    // Cursor advanced past the write.
    assert(st.pos == 1024);

    // Writes past the end are clamped, the file does not grow.
    Storage::SetPosition(st, 2040);
    assert(Storage::Write(st, ones.data(), 16) == 8);
    Storage::Close(st);
  }

  for (size_t i = 512; i < 1024; ++i) expect[i] = 0xFF;
  for (size_t i = 2040; i < 2048; ++i) expect[i] = 0xFF;
  assert(img.contents() == expect);

  // Reopen and read back through the backend.
  Storage::State st;
  bool ok = Storage::Open(st, img.path(), 0, true);
  assert(ok);
  std::vector<uint8_t> back(4);
  Storage::SetPosition(st, 1022);
  assert(Storage::Read(st, back.data(), back.size()) == 4);
  assert(back[0] == 0xFF && back[1] == 0xFF);
  assert(back[2] == expect[1024] && back[3] == expect[1025]);

  // Reads at the end are short, never past it.
  Storage::SetPosition(st, 2046);
  assert(Storage::Read(st, back.data(), back.size()) == 2);
  Storage::SetPosition(st, 4096);
  assert(Storage::Read(st, back.data(), back.size()) == 0);

  return 0;
}
