#include <cassert>
#include <cstdint>
#include <vector>

#include "Sd.hpp"
#include "TempImage.hpp"

// 1024 byte image, 512 byte blocks: read the first half, zero the second
// half, then check the CSD size multiplier.

int main() {
  using namespace Sdemu;

  const std::vector<uint8_t> data = sdemu_test::pattern(1024);
  sdemu_test::TempImage img(data);
  Sd::Card card;
  bool ok = Sd::MountImg(card, img.path(), 0, true);
  assert(ok);

  Sd::HandleCommand(card, 16, 512);
  Sd::HandleCommand(card, 17, 0);
  std::vector<uint8_t> first = Sd::ReadData(card, 512);
  assert(first == std::vector<uint8_t>(data.begin(), data.begin() + 512));
  assert(Sd::ReadData(card, 1).empty());
  assert(Sd::ReadData(card, 512).empty());

  Sd::HandleCommand(card, 24, 512);
  Sd::WriteData(card, std::vector<uint8_t>(512, 0));
  assert(!Sd::IsReadyForWriting(card));

  std::vector<uint8_t> expect(data.begin(), data.begin() + 512);
  expect.resize(1024, 0);
  assert(img.contents() == expect);

  Sd::HandleCommand(card, 17, 512);
  assert(Sd::ReadData(card, 512) == std::vector<uint8_t>(512, 0));

  BitSeq csd = Sd::HandleCommand(card, 9, 0);
  assert(csd.Length() == 120);
  assert(csd.Field(39, 3) == 7);

  return 0;
}
