/* src/SdemuSystem.hpp */
#pragma once

#include <cstdint>
#include "Sd.hpp"
#include "SdHost.hpp"

namespace Sdemu
{
  // メモリマップ
  constexpr uint16_t RAM_SIZE    = 0x8000;
  constexpr uint16_t SDHOST_BASE = 0xE200;
  constexpr uint16_t SDHOST_END  = 0xE20F;

  struct System
  {
    // メモリ
    uint8_t ram[RAM_SIZE] = {};

    // 周辺機器
    Sd::Card      card;
    SdHost::State sdhost;

    // 割り込み線 (アクティブ時 true)
    bool irq = false;
  };

  // 周辺機器の状態に応じて割り込み線を更新
  void UpdateIrq(System& sys);

  // バスアクセス
  uint8_t BusRead(System& sys, uint16_t addr);
  void    BusWrite(System& sys, uint16_t addr, uint8_t val);

  // ハードリセット (カードイメージは挿したまま)
  void Reset(System& sys);
}
