#include <cassert>
#include <cstdint>
#include <vector>

#include "Register.hpp"

// For non-overlapping fragments, Synthesize() equals the OR of each fragment's
// masked value shifted to its offset. Every other bit is 0.

struct Frag { uint32_t offset, width, value; };

int main() {
  using namespace Sdemu;

  const std::vector<Frag> frags = {
    {  0,  1, 0x1 },
    {  3,  5, 0xFFFF },      // truncated to 0x1F
    { 13, 13, 0x1ABC },
    { 30,  4, 0xA },         // straddles the 32-bit word boundary
    { 47,  3, 7 },
    { 62, 12, 0xFFF },
    { 96, 32, 0xDEADBEEF },
  };

  Register reg(128);
  for (const Frag& f : frags) reg.Define(f.offset, f.width, f.value, "frag");
  assert(!FindOverlap(reg));

  // Reference model, one bit at a time.
  std::vector<bool> expect(128, false);
  for (const Frag& f : frags)
    for (uint32_t i = 0; i < f.width; ++i)
      if ((f.value >> i) & 1u) expect[f.offset + i] = true;

  BitSeq bits = reg.Synthesize();
  assert(bits.Length() == 128);
  for (uint32_t i = 0; i < 128; ++i) assert(bits.Bit(i) == expect[i]);

  // A register without fragments is all zero.
  BitSeq zero = Register(64).Synthesize();
  assert(zero.Length() == 64);
  for (uint32_t i = 0; i < 64; ++i) assert(!zero.Bit(i));

  return 0;
}
