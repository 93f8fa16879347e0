/* src/SdemuSystem.cpp */
#include "SdemuSystem.hpp"

namespace Sdemu
{
  void UpdateIrq(System& sys)
  {
    sys.irq = (sys.sdhost.reg_ifr & sys.sdhost.reg_ier & 0x7F) != 0;
  }

  // バス読み込み
  uint8_t BusRead(System& sys, uint16_t addr)
  {
    // RAM
    if (addr < RAM_SIZE) return sys.ram[addr];
    // --- SDホストコントローラ
    if (addr >= SDHOST_BASE && addr <= SDHOST_END) return SdHost::Read(sys, addr);
    return 0;
  }

  // バス書き込み
  void BusWrite(System& sys, uint16_t addr, uint8_t val)
  {
    // RAM
    if (addr < RAM_SIZE) sys.ram[addr] = val;
    // SDホストコントローラ
    if (addr >= SDHOST_BASE && addr <= SDHOST_END) SdHost::Write(sys, addr, val);
  }

  void Reset(System& sys)
  {
    Sd::Reset(sys.card);
    SdHost::Reset(sys);
  }
}
