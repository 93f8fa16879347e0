/* src/SdHost.hpp - メモリマップド SD ホストコントローラ
 *
 * レジスタマップ ($E200-$E20F):
 *   $E200 CMD   W:コマンド発行 [5:0]=index / R:最後のコマンド
 *   $E201 ARG0  引数 [7:0]
 *   $E202 ARG1  引数 [15:8]
 *   $E203 ARG2  引数 [23:16]
 *   $E204 ARG3  引数 [31:24]
 *   $E205 RLEN  R:レスポンス長 [bit]
 *   $E206 RSEL  レスポンスのバイト選択 (0=bit[7:0])
 *   $E207 RDAT  R:選択中のレスポンスバイト
 *   $E208 DATA  R:1バイト読み出し / W:1バイト書き込み
 *   $E209 BCNTL ブロック数 [7:0]  (CMD18 用)
 *   $E20A BCNTH ブロック数 [15:8]
 *   $E20B STAT  R: bit0=読み出し可, bit1=書き込み可, bit2=カード挿入
 *   $E20D IFR   bit0=コマンド完了, bit1=読み出しデータあり, bit2=書き込み可
 *   $E20E IER   bit7=1 でセット, 0 でクリア
 */
#pragma once
#include "BitSeq.hpp"
#include <cstdint>

namespace Sdemu
{
  // 前方宣言
  struct System;

  namespace SdHost
  {

    // レジスタのアドレスオフセット
    namespace Reg
    {
      constexpr uint8_t CMD   = 0x00;
      constexpr uint8_t ARG0  = 0x01;
      constexpr uint8_t ARG1  = 0x02;
      constexpr uint8_t ARG2  = 0x03;
      constexpr uint8_t ARG3  = 0x04;
      constexpr uint8_t RLEN  = 0x05;
      constexpr uint8_t RSEL  = 0x06;
      constexpr uint8_t RDAT  = 0x07;
      constexpr uint8_t DATA  = 0x08;
      constexpr uint8_t BCNTL = 0x09;
      constexpr uint8_t BCNTH = 0x0A;
      constexpr uint8_t STAT  = 0x0B;
      constexpr uint8_t IFR   = 0x0D;
      constexpr uint8_t IER   = 0x0E;
    }

    // STAT
    constexpr uint8_t STAT_READ_READY  = 0x01;
    constexpr uint8_t STAT_WRITE_READY = 0x02;
    constexpr uint8_t STAT_MOUNTED     = 0x04;

    // IFR/IER
    constexpr uint8_t IRQ_CMD_DONE    = 0x01;
    constexpr uint8_t IRQ_DATA_AVAIL  = 0x02;
    constexpr uint8_t IRQ_WRITE_READY = 0x04;

    // 内部状態
    struct State
    {
      uint8_t  reg_cmd  = 0;
      uint32_t reg_arg  = 0;
      uint8_t  reg_rsel = 0;
      uint8_t  reg_ifr  = 0;
      uint8_t  reg_ier  = 0;
      uint16_t block_count = 0;

      // CMD16 をスヌープして保持するブロック長
      uint32_t block_len = 0;

      BitSeq response; // 最後のレスポンス
    };

    // 操作関数
    void Write(System& sys, uint16_t addr, uint8_t val);
    uint8_t Read(System& sys, uint16_t addr);
    void Reset(System& sys);

  }

}
