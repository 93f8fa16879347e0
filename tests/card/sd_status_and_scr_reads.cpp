#include <cassert>
#include <cstdint>
#include <vector>

#include "Sd.hpp"
#include "TempImage.hpp"

// ACMD13 and ACMD51 queue their registers on the data line.

int main() {
  using namespace Sdemu;

  sdemu_test::TempImage img(sdemu_test::pattern(1024));
  Sd::Card card;
  bool ok = Sd::MountImg(card, img.path());
  assert(ok);

  // SD status: 512 bits.
  Sd::HandleCommand(card, 55, 0);
  BitSeq r = Sd::HandleCommand(card, 13, 0);
  assert(r.Length() == 32);
  assert(Sd::IsReadyForReading(card));
  assert(!Sd::IsReadyForWriting(card));
  assert(Transfer::Remaining(card.read_ctx) == 64);

  // Too much at once is refused and nothing is consumed.
  assert(Sd::ReadData(card, 65).empty());
  assert(Transfer::Remaining(card.read_ctx) == 64);

  std::vector<uint8_t> st = Sd::ReadData(card, 60);
  assert(st.size() == 60);
  for (uint8_t b : st) assert(b == 0);
  st = Sd::ReadData(card, 4);
  assert(st.size() == 4);
  assert(!Sd::IsReadyForReading(card));
  assert(Sd::ReadData(card, 1).empty());

  // Writes are not expected while a register is being read.
  Sd::HandleCommand(card, 55, 0);
  Sd::HandleCommand(card, 51, 0);
  Sd::WriteData(card, std::vector<uint8_t>(1, 0x55));
  assert(Transfer::Remaining(card.read_ctx) == 8);

  std::vector<uint8_t> scr = Sd::ReadData(card, 8);
  assert(scr == std::vector<uint8_t>(8, 0));
  assert(!Sd::IsReadyForReading(card));

  // The image was not touched by the stray write.
  assert(img.contents() == sdemu_test::pattern(1024));

  return 0;
}
