#include <cassert>
#include <cstdint>
#include <vector>

#include "Sd.hpp"
#include "TempImage.hpp"

// A read limit after a register read has drained does not expose image
// data. Only a new read command positions the card on the image again.

int main() {
  using namespace Sdemu;

  std::vector<uint8_t> data = sdemu_test::pattern(1024);
  data[0] = 0x5C;
  sdemu_test::TempImage img(data);
  Sd::Card card;
  bool ok = Sd::MountImg(card, img.path());
  assert(ok);

  Sd::HandleCommand(card, 55, 0);
  Sd::HandleCommand(card, 51, 0);
  assert(Sd::ReadData(card, 8).size() == 8);
  assert(!Sd::IsReadyForReading(card));

  Sd::SetReadLimit(card, 16);
  assert(!Sd::IsReadyForReading(card));
  assert(Sd::ReadData(card, 16).empty());

  // Same after the 512-bit SD status.
  Sd::HandleCommand(card, 55, 0);
  Sd::HandleCommand(card, 13, 0);
  assert(Sd::ReadData(card, 64).size() == 64);
  Sd::SetReadLimit(card, 512);
  assert(Sd::ReadData(card, 1).empty());

  // CMD18 repositions on the image and the limit then applies.
  Sd::HandleCommand(card, 18, 0);
  Sd::SetReadLimit(card, 4);
  std::vector<uint8_t> got = Sd::ReadData(card, 4);
  assert(got == std::vector<uint8_t>(data.begin(), data.begin() + 4));

  return 0;
}
