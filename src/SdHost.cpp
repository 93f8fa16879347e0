/* src/SdHost.cpp */
#include "SdHost.hpp"
#include "SdemuSystem.hpp"
#include "Sd.hpp"
#include "Log.hpp"
#include <vector>

namespace Sdemu
{
namespace SdHost
{
  // カードの転送状態から IFR のデータ系フラグを更新
  static void UpdateDataFlags(System& sys)
  {
    State& host = sys.sdhost;
    host.reg_ifr &= ~(IRQ_DATA_AVAIL | IRQ_WRITE_READY);
    if (Sd::IsReadyForReading(sys.card)) host.reg_ifr |= IRQ_DATA_AVAIL;
    if (Sd::IsReadyForWriting(sys.card)) host.reg_ifr |= IRQ_WRITE_READY;
    UpdateIrq(sys);
  }

  // コマンド発行
  static void IssueCommand(System& sys, uint8_t index)
  {
    State& host = sys.sdhost;
    host.reg_cmd  = index;
    host.response = Sd::HandleCommand(sys.card, index, host.reg_arg);
    host.reg_rsel = 0;

    // CMD16 をスヌープ (ACMD 表に無い番号は CMD55 の後でも標準コマンドとして処理される)
    if (index == (uint8_t)Sd::Cmd::SET_BLOCKLEN)
      host.block_len = host.reg_arg;

    // CMD18 は転送量をコントローラ側で決める
    if (index == (uint8_t)Sd::Cmd::READ_MULTIPLE_BLOCK)
    {
      uint32_t limit = host.block_len * host.block_count;
      SDEMU_DEBUG("sdhost", "CMD18: %u blocks x %u bytes", host.block_count, host.block_len);
      Sd::SetReadLimit(sys.card, limit);
    }

    host.reg_ifr |= IRQ_CMD_DONE;
    UpdateDataFlags(sys);
  }

  void Write(System& sys, uint16_t addr, uint8_t val)
  {
    State& host = sys.sdhost;
    uint8_t reg = addr & 0x0F;
    switch (reg)
    {
      case Reg::CMD:
        IssueCommand(sys, val & 0x3F);
        break;

      case Reg::ARG0: host.reg_arg = (host.reg_arg & 0xFFFFFF00u) | val;                   break;
      case Reg::ARG1: host.reg_arg = (host.reg_arg & 0xFFFF00FFu) | ((uint32_t)val << 8);  break;
      case Reg::ARG2: host.reg_arg = (host.reg_arg & 0xFF00FFFFu) | ((uint32_t)val << 16); break;
      case Reg::ARG3: host.reg_arg = (host.reg_arg & 0x00FFFFFFu) | ((uint32_t)val << 24); break;

      case Reg::RSEL: host.reg_rsel = val; break;

      case Reg::DATA:
        Sd::WriteData(sys.card, std::vector<uint8_t>(1, val));
        UpdateDataFlags(sys);
        break;

      case Reg::BCNTL: host.block_count = (host.block_count & 0xFF00) | val;               break;
      case Reg::BCNTH: host.block_count = (host.block_count & 0x00FF) | ((uint16_t)val << 8); break;

      case Reg::IER:
        if (val & 0b10000000) host.reg_ier |=  (val & 0x7F);
        else                  host.reg_ier &= ~(val & 0x7F);
        UpdateIrq(sys);
        break;

      case Reg::IFR:
        host.reg_ifr &= ~(val & 0x7F);
        UpdateIrq(sys);
        break;

      default:
        SDEMU_DEBUG("sdhost", "Write to read-only register $%X ignored", reg);
        break;
    }
  }

  uint8_t Read(System& sys, uint16_t addr)
  {
    State& host = sys.sdhost;
    uint8_t reg = addr & 0x0F;
    switch (reg)
    {
      case Reg::CMD:  return host.reg_cmd;
      case Reg::ARG0: return (uint8_t)(host.reg_arg);
      case Reg::ARG1: return (uint8_t)(host.reg_arg >> 8);
      case Reg::ARG2: return (uint8_t)(host.reg_arg >> 16);
      case Reg::ARG3: return (uint8_t)(host.reg_arg >> 24);
      case Reg::RLEN: return (uint8_t)host.response.Length();
      case Reg::RSEL: return host.reg_rsel;

      case Reg::RDAT:
        {
          // レスポンス長を超えるビットは0
          uint32_t bit = (uint32_t)host.reg_rsel * 8;
          uint32_t len = host.response.Length();
          if (bit >= len) return 0;
          uint32_t w = (len - bit < 8) ? len - bit : 8;
          return (uint8_t)host.response.Field(bit, w);
        }

      case Reg::DATA:
        {
          std::vector<uint8_t> d = Sd::ReadData(sys.card, 1);
          UpdateDataFlags(sys);
          // データが無ければバスはプルアップ
          return d.empty() ? 0xFF : d[0];
        }

      case Reg::BCNTL: return (uint8_t)(host.block_count & 0xFF);
      case Reg::BCNTH: return (uint8_t)(host.block_count >> 8);

      case Reg::STAT:
        {
          uint8_t val = 0;
          if (Sd::IsReadyForReading(sys.card)) val |= STAT_READ_READY;
          if (Sd::IsReadyForWriting(sys.card)) val |= STAT_WRITE_READY;
          if (Sd::IsMounted(sys.card))         val |= STAT_MOUNTED;
          return val;
        }

      case Reg::IER: return host.reg_ier | 0x80;
      case Reg::IFR:
        {
          uint8_t val = host.reg_ifr & 0x7F;
          if (host.reg_ifr & host.reg_ier & 0x7F) val |= 0x80;
          return val;
        }
    }
    return 0;
  }

  void Reset(System& sys)
  {
    // block_len はカード側と同じく保持
    uint32_t block_len = sys.sdhost.block_len;
    sys.sdhost = State();
    sys.sdhost.block_len = block_len;
    UpdateIrq(sys);
  }

}
}
