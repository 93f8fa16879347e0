#include <cassert>
#include <cstdint>
#include <vector>

#include "Sd.hpp"
#include "TempImage.hpp"

// CMD0 and Reset abandon transfers and the pending application command.
// The block length set by CMD16 survives both.

int main() {
  using namespace Sdemu;

  const std::vector<uint8_t> data = sdemu_test::pattern(2048);
  sdemu_test::TempImage img(data);
  Sd::Card card;
  bool ok = Sd::MountImg(card, img.path());
  assert(ok);

  // Default block length is zero: CMD17 starts an empty transfer.
  Sd::HandleCommand(card, 17, 0);
  assert(!Sd::IsReadyForReading(card));

  Sd::HandleCommand(card, 16, 512);
  Sd::HandleCommand(card, 17, 0);
  Sd::HandleCommand(card, 24, 512);
  Sd::HandleCommand(card, 55, 0);
  assert(Sd::IsReadyForReading(card));
  assert(Sd::IsReadyForWriting(card));
  assert(card.is_acmd);

  BitSeq r = Sd::HandleCommand(card, 0, 0);
  assert(r.Empty());
  assert(!Sd::IsReadyForReading(card));
  assert(!Sd::IsReadyForWriting(card));
  assert(!card.is_acmd);
  assert(!Sd::CardStatus(card).Bit(5));
  assert(card.block_len == 512);

  // CMD0 right after CMD55 still resets, it is not an application command.
  Sd::HandleCommand(card, 17, 0);
  Sd::HandleCommand(card, 55, 0);
  Sd::HandleCommand(card, 0, 0);
  assert(!Sd::IsReadyForReading(card));

  // Block length still applies after a reset.
  Sd::HandleCommand(card, 55, 0);
  Sd::Reset(card);
  assert(!card.is_acmd);
  Sd::HandleCommand(card, 17, 1536);
  assert(Transfer::Remaining(card.read_ctx) == 512);
  std::vector<uint8_t> got = Sd::ReadData(card, 512);
  assert(got == std::vector<uint8_t>(data.begin() + 1536, data.end()));

  return 0;
}
