/* src/Transfer.hpp - 転送中の読み出し/書き込みコンテキスト */
#pragma once
#include "BitSeq.hpp"
#include <cstdint>

namespace Sdemu
{
namespace Transfer
{

  // 転送コンテキスト
  //   モードごとにオフセットの単位が違うので、進める関数も単位別に分けている
  struct Context
  {
    enum class Mode
    {
      NOT_STARTED, // 転送なし
      STORAGE,     // ストレージ上の byte_offset から bytes_left バイト
      SEQUENCE     // seq の bit_offset 以降
    } mode = Mode::NOT_STARTED;

    // STORAGE
    uint32_t byte_offset = 0;
    uint32_t bytes_left  = 0;

    // SEQUENCE
    BitSeq   seq;
    uint32_t bit_offset = 0;
  };

  // ストレージ転送に切り替え (ビット列は破棄)
  void SetOffset(Context& ctx, uint32_t byte_offset);
  // ビット列転送に切り替え (bit_offset は0から)
  void SetData(Context& ctx, const BitSeq& seq);

  // 残りバイト数
  uint32_t Remaining(const Context& ctx);
  // 残りバイト数を直接設定
  //   ビット列転送中 (残り>0) の変更は std::logic_error
  //   読み切ったビット列転送では値を保持するだけで転送は再開しない
  //   NOT_STARTED ならオフセット0のストレージ転送になる
  void SetRemaining(Context& ctx, uint32_t bytes);

  inline bool IsActive(const Context& ctx) { return Remaining(ctx) > 0; }
  inline bool CanAccept(const Context& ctx, uint32_t bytes) { return bytes <= Remaining(ctx); }

  // モードと単位が合わない、または残りを超える場合は std::logic_error
  void AdvanceBytes(Context& ctx, uint32_t bytes);
  void AdvanceBits(Context& ctx, uint32_t bits);

  void Reset(Context& ctx);

} // namespace Transfer
} // namespace Sdemu
