/* src/BitSeq.hpp - 長さ付きビット列
 *
 * ビット番号: bit0 = bytes[0] の LSB, bit8 = bytes[1] の LSB ...
 * 長さを超える読み出しは std::out_of_range
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Sdemu
{

  // 不変ビット列 (レスポンス・レジスタ値)
  class BitSeq
  {
  public:
    BitSeq() = default;
    BitSeq(std::vector<uint8_t> bytes, uint32_t length);

    // value の下位 width ビットから生成 (width <= 32)
    static BitSeq FromUInt32(uint32_t value, uint32_t width);

    uint32_t Length() const { return length; }
    bool     Empty() const  { return length == 0; }

    bool     Bit(uint32_t idx) const;
    // [offset, offset+width) を数値化 (width <= 32)
    uint32_t Field(uint32_t offset, uint32_t width) const;
    // 下位 min(Length, 32) ビットを数値化
    uint32_t ToUInt32() const;

    // bit_offset から count バイト切り出す
    std::vector<uint8_t> ToBytes(uint32_t bit_offset, uint32_t count) const;

    // 下位 bits ビットを取り除いたビット列
    BitSeq Skip(uint32_t bits) const;

    // 上位桁から16進表記 (ログ用)
    std::string ToString() const;

    bool operator==(const BitSeq& rhs) const;
    bool operator!=(const BitSeq& rhs) const { return !(*this == rhs); }

  private:
    std::vector<uint8_t> bytes;
    uint32_t length = 0;
  };

  // (値, 幅, オフセット) を積み上げて固定幅のビット列を組み立てる
  class BitStacker
  {
  public:
    explicit BitStacker(uint32_t width);

    // value の下位 width ビットで [offset, offset+width) を上書き
    BitStacker& Stack(uint32_t value, uint32_t width, uint32_t offset);
    // value の下位 width ビットを offset に OR 合成
    BitStacker& Merge(uint32_t value, uint32_t width, uint32_t offset);

    BitSeq Build() const { return BitSeq(bytes, width); }

  private:
    void Put(uint32_t value, uint32_t width, uint32_t offset, bool overwrite);

    std::vector<uint8_t> bytes;
    uint32_t width;
  };

  // 下位 width ビットのマスク (width <= 32)
  inline uint32_t MaskBits(uint32_t value, uint32_t width)
  {
    return (width >= 32) ? value : (value & ((1u << width) - 1u));
  }

} // namespace Sdemu
