/* src/Sd.cpp */
#include "Sd.hpp"
#include "Log.hpp"
#include <algorithm>
#include <stdexcept>

namespace Sdemu
{
namespace Sd
{

  // ---------- 内部ヘルパー----------
  static size_t Available(const Card& card, uint32_t offset, size_t size)
  {
    uint64_t len = Storage::Length(card.storage);
    if (offset >= len) return 0;
    return (size_t)std::min<uint64_t>(size, len - offset);
  }

  static void WriteToStorage(Card& card, uint32_t offset, const std::vector<uint8_t>& data)
  {
    size_t actual = Available(card, offset, data.size());
    if (actual < data.size())
    {
      SDEMU_WARN("sd", "Tried to write %zu bytes of data to offset %u, but space for only %zu is available.",
                 data.size(), offset, actual);
    }
    Storage::SetPosition(card.storage, offset);
    size_t w = actual ? Storage::Write(card.storage, data.data(), actual) : 0;
    if (w < actual)
      SDEMU_ERROR("sd", "Storage write failed at offset %u (%zu of %zu bytes)", offset, w, actual);
  }

  static std::vector<uint8_t> ReadFromStorage(Card& card, uint32_t offset, uint32_t size)
  {
    size_t actual = Available(card, offset, size);
    if (actual < size)
    {
      SDEMU_WARN("sd", "Tried to read %u bytes of data from offset %u, but only %zu is available.",
                 size, offset, actual);
    }

    std::vector<uint8_t> result(actual);
    Storage::SetPosition(card.storage, offset);
    size_t done = 0;
    while (done < actual)
    {
      size_t r = Storage::Read(card.storage, result.data() + done, actual - done);
      // 残量は計算済みなので0になることはない
      if (r == 0) throw std::logic_error("Sd: unexpected end of data in storage");
      done += r;
    }
    return result;
  }


  static BitSeq HandleStandardCommand(Card& card, uint32_t index, uint32_t arg)
  {
    switch ((Cmd)index)
    {
      case Cmd::GO_IDLE_STATE:
        Reset(card);
        return BitSeq();

      case Cmd::ALL_SEND_CID:
        return CardIdentification(card);

      case Cmd::SEND_RELATIVE_ADDR:
        return RelativeAddress(CardStatus(card).ToUInt32(), card.card_address);

      case Cmd::SELECT_DESELECT_CARD:
        return CardStatus(card);

      case Cmd::SEND_CSD:
        return CardSpecificData(card);

      case Cmd::STOP_TRANSMISSION:
        Transfer::Reset(card.read_ctx);
        Transfer::Reset(card.write_ctx);
        return CardStatus(card);

      case Cmd::SEND_STATUS:
        return CardStatus(card);

      case Cmd::SET_BLOCKLEN:
        card.block_len = arg;
        return CardStatus(card);

      case Cmd::READ_SINGLE_BLOCK:
        Transfer::SetOffset(card.read_ctx, arg);
        Transfer::SetRemaining(card.read_ctx, card.block_len);
        return CardStatus(card);

      case Cmd::READ_MULTIPLE_BLOCK:
        // 残量はコントローラが SetReadLimit で設定する
        Transfer::SetOffset(card.read_ctx, arg);
        return CardStatus(card);

      case Cmd::WRITE_BLOCK:
        Transfer::SetOffset(card.write_ctx, arg);
        Transfer::SetRemaining(card.write_ctx, card.block_len);
        return CardStatus(card);

      case Cmd::APP_CMD:
        card.is_acmd = true;
        return CardStatus(card);

      default:
        SDEMU_WARN("sd", "Unsupported command: CMD%u. Ignoring it", index);
        return BitSeq();
    }
  }

  // 処理したら true
  static bool TryHandleAppCommand(Card& card, uint32_t index, uint32_t arg, BitSeq& result)
  {
    (void)arg;
    switch ((AppCmd)index)
    {
      case AppCmd::SD_STATUS:
        Transfer::SetData(card.read_ctx, SdStatus());
        result = CardStatus(card);
        return true;

      case AppCmd::SD_SEND_OP_COND:
        result = OperatingConditions(card);
        return true;

      case AppCmd::SEND_SCR:
        Transfer::SetData(card.read_ctx, SdConfiguration());
        result = CardStatus(card);
        return true;

      default:
        SDEMU_DEBUG("sd", "CMD%u is not an application specific command", index);
        return false;
    }
  }
  // ---------- 内部ヘルパー----------

  Card::Card()
    : status_reg(STATUS_BITS), ocr_reg(OCR_BITS), csd_reg(CSD_BITS), cid_reg(CID_BITS)
  {
    status_reg
      .Define(5, 1, [this]() { return is_acmd ? 1u : 0u; }, "APP_CMD")
      .Define(8, 1, 1, "READY_FOR_DATA");

    ocr_reg
      .Define(31, 1, 1, "card power up status (busy)");

    csd_reg
      .Define(47,  3, Csd::SIZE_MULT_512,    "device size multiplier")
      .Define(62, 12, Csd::DEVICE_SIZE_MAX,  "device size")
      .Define(80,  4, Csd::READ_BL_LEN_2048, "max read data block length")
      .Define(84, 12, Csd::CCC_CLASS0,       "card command classes")
      .Define(96,  3, Csd::TRAN_RATE_10MBIT, "transfer rate unit")
      .Define(99,  4, Csd::TRAN_MULT_2_5,    "transfer multiplier");

    cid_reg
      .Define(  8, 4, 8,   "manufacturing date - month")
      .Define( 12, 8, 18,  "manufacturing date - year")
      .Define( 64, 8, 'D', "product name 5")
      .Define( 72, 8, 'O', "product name 4")
      .Define( 80, 8, 'N', "product name 3")
      .Define( 88, 8, 'E', "product name 2")
      .Define( 96, 8, 'R', "product name 1")
      .Define(120, 8, 0xAB, "manufacturer ID");
  }

  Card::~Card()
  {
    UnmountImg(*this);
  }

  bool MountImg(Card& card, const std::string& path, uint64_t size, bool persistent)
  {
    UnmountImg(card);
    if (!Storage::Open(card.storage, path, size, persistent))
    {
      SDEMU_ERROR("sd", "SD card image '%s' could not be mounted", path.c_str());
      return false;
    }
    Reset(card);
    SDEMU_INFO("sd", "Mounted '%s' (%llu bytes)", path.c_str(),
               (unsigned long long)Storage::Length(card.storage));
    return true;
  }

  void UnmountImg(Card& card)
  {
    Reset(card);
    Storage::Close(card.storage);
  }

  bool IsMounted(const Card& card) { return Storage::IsOpen(card.storage); }

  void Reset(Card& card)
  {
    Transfer::Reset(card.read_ctx);
    Transfer::Reset(card.write_ctx);
    card.is_acmd = false;
  }

  BitSeq HandleCommand(Card& card, uint32_t index, uint32_t arg)
  {
    if (!IsMounted(card))
    {
      SDEMU_WARN("sd", "CMD%u received but no card image is mounted", index);
      return BitSeq();
    }

    SDEMU_DEBUG("sd", "Command received: CMD%u arg 0x%08X%s", index, arg,
                card.is_acmd ? " (ACMD)" : "");

    bool acmd = card.is_acmd;
    card.is_acmd = false;

    BitSeq result;
    if (!acmd || !TryHandleAppCommand(card, index, arg, result))
      result = HandleStandardCommand(card, index, arg);

    SDEMU_DEBUG("sd", "Sending command response: %s", result.ToString().c_str());
    return result;
  }

  void WriteData(Card& card, const std::vector<uint8_t>& data)
  {
    if (!Transfer::IsActive(card.write_ctx) ||
        card.write_ctx.mode != Transfer::Context::Mode::STORAGE)
    {
      SDEMU_WARN("sd", "Trying to write data when the SD card is not expecting it");
      return;
    }
    if (!Transfer::CanAccept(card.write_ctx, (uint32_t)data.size()))
    {
      SDEMU_WARN("sd", "Trying to write more data (%zu bytes) than expected (%u bytes). Ignoring the whole transfer",
                 data.size(), Transfer::Remaining(card.write_ctx));
      return;
    }
    WriteToStorage(card, card.write_ctx.byte_offset, data);
    Transfer::AdvanceBytes(card.write_ctx, (uint32_t)data.size());
  }

  void SetReadLimit(Card& card, uint32_t bytes)
  {
    SDEMU_DEBUG("sd", "Setting read limit to: %u", bytes);
    Transfer::SetRemaining(card.read_ctx, bytes);
  }

  std::vector<uint8_t> ReadData(Card& card, uint32_t count)
  {
    if (!Transfer::IsActive(card.read_ctx))
    {
      SDEMU_WARN("sd", "Trying to read data when the SD card is not expecting it");
      return {};
    }
    if (!Transfer::CanAccept(card.read_ctx, count))
    {
      SDEMU_WARN("sd", "Trying to read more data (%u bytes) than expected (%u bytes). Ignoring the whole transfer",
                 count, Transfer::Remaining(card.read_ctx));
      return {};
    }

    std::vector<uint8_t> result;
    if (card.read_ctx.mode == Transfer::Context::Mode::SEQUENCE)
    {
      result = card.read_ctx.seq.ToBytes(card.read_ctx.bit_offset, count);
      Transfer::AdvanceBits(card.read_ctx, count * 8);
    }
    else
    {
      result = ReadFromStorage(card, card.read_ctx.byte_offset, count);
      Transfer::AdvanceBytes(card.read_ctx, count);
    }
    return result;
  }

  bool IsReadyForReading(const Card& card) { return Transfer::IsActive(card.read_ctx); }
  bool IsReadyForWriting(const Card& card) { return Transfer::IsActive(card.write_ctx); }

  BitSeq CardStatus(const Card& card)          { return card.status_reg.Synthesize(); }
  BitSeq OperatingConditions(const Card& card) { return card.ocr_reg.Synthesize(); }
  BitSeq CardSpecificData(const Card& card)    { return card.csd_reg.Synthesize(CRC_SKIP_BITS); }
  BitSeq CardIdentification(const Card& card)  { return card.cid_reg.Synthesize(CRC_SKIP_BITS); }

  BitSeq RelativeAddress(uint32_t status, uint16_t card_address)
  {
    return BitStacker(32)
      .Stack(status,       13, 0)
      .Stack(status >> 13,  1, 19)
      .Stack(status >> 14,  2, 22)
      .Stack(card_address, 16, 0)
      .Build();
  }

  BitSeq SdStatus()        { return Register(SD_STATUS_BITS).Synthesize(); }
  BitSeq SdConfiguration() { return Register(SCR_BITS).Synthesize(); }

}
}
