#include <cassert>
#include <cstdint>

#include "Register.hpp"

// Callback fragments are evaluated when the register is read, not when defined.

int main() {
  using namespace Sdemu;

  bool flag = false;
  uint32_t counter = 0;

  Register reg(32);
  reg.Define(5, 1, [&flag]() { return flag ? 1u : 0u; }, "flag")
     .Define(8, 1, 1, "constant")
     .Define(16, 4, [&counter]() { return ++counter; }, "counter");

  assert(reg.Synthesize().ToUInt32() == 0x00010100u);
  flag = true;
  assert(reg.Synthesize().ToUInt32() == 0x00020120u);
  flag = false;
  assert(reg.Synthesize().ToUInt32() == 0x00030100u);

  // Callback results are masked to the fragment width.
  counter = 0xFF;
  assert(reg.Synthesize().Field(16, 4) == 0x0u);

  return 0;
}
