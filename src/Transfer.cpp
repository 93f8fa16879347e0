/* src/Transfer.cpp - 転送中の読み出し/書き込みコンテキスト */
#include "Transfer.hpp"
#include <stdexcept>

namespace Sdemu
{
namespace Transfer
{

  void SetOffset(Context& ctx, uint32_t byte_offset)
  {
    // bytes_left は前の値を引き継ぐ (CMD18 は残量を外部から設定する)
    if (ctx.mode != Context::Mode::STORAGE) ctx.bytes_left = 0;
    ctx.mode        = Context::Mode::STORAGE;
    ctx.byte_offset = byte_offset;
    ctx.seq         = BitSeq();
    ctx.bit_offset  = 0;
  }

  void SetData(Context& ctx, const BitSeq& seq)
  {
    ctx.mode        = Context::Mode::SEQUENCE;
    ctx.seq         = seq;
    ctx.bit_offset  = 0;
    ctx.byte_offset = 0;
    ctx.bytes_left  = 0;
  }

  uint32_t Remaining(const Context& ctx)
  {
    switch (ctx.mode)
    {
      case Context::Mode::STORAGE:  return ctx.bytes_left;
      case Context::Mode::SEQUENCE: return (ctx.seq.Length() - ctx.bit_offset) / 8;
      case Context::Mode::NOT_STARTED: break;
    }
    return 0;
  }

  void SetRemaining(Context& ctx, uint32_t bytes)
  {
    switch (ctx.mode)
    {
      case Context::Mode::SEQUENCE:
        if (Remaining(ctx) > 0)
          throw std::logic_error("Transfer: cannot resize an in-flight sequence transfer");
        // 読み切ったビット列のまま。残量はビット列から決まるので0のまま
        break;
      case Context::Mode::NOT_STARTED:
        SetOffset(ctx, 0);
        break;
      case Context::Mode::STORAGE:
        break;
    }
    ctx.bytes_left = bytes;
  }

  void AdvanceBytes(Context& ctx, uint32_t bytes)
  {
    if (ctx.mode != Context::Mode::STORAGE)
      throw std::logic_error("Transfer: byte advance on a non-storage transfer");
    if (bytes > ctx.bytes_left)
      throw std::logic_error("Transfer: byte advance past end of transfer");
    ctx.byte_offset += bytes;
    ctx.bytes_left  -= bytes;
  }

  void AdvanceBits(Context& ctx, uint32_t bits)
  {
    if (ctx.mode != Context::Mode::SEQUENCE)
      throw std::logic_error("Transfer: bit advance on a non-sequence transfer");
    if ((uint64_t)ctx.bit_offset + bits > ctx.seq.Length())
      throw std::logic_error("Transfer: bit advance past end of sequence");
    ctx.bit_offset += bits;
  }

  void Reset(Context& ctx)
  {
    ctx.mode        = Context::Mode::NOT_STARTED;
    ctx.byte_offset = 0;
    ctx.bytes_left  = 0;
    ctx.seq         = BitSeq();
    ctx.bit_offset  = 0;
  }

} // namespace Transfer
} // namespace Sdemu
