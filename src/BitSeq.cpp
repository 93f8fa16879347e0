/* src/BitSeq.cpp - 長さ付きビット列 */
#include "BitSeq.hpp"
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace Sdemu
{

  static uint32_t BytesFor(uint32_t bits) { return (bits + 7) / 8; }

  BitSeq::BitSeq(std::vector<uint8_t> bytes_, uint32_t length_)
    : bytes(std::move(bytes_)), length(length_)
  {
    if (bytes.size() < BytesFor(length))
      throw std::logic_error("BitSeq: byte buffer shorter than bit length");
    bytes.resize(BytesFor(length));
    // 長さ外の端数ビットは常に0
    if (length % 8)
      bytes.back() &= (uint8_t)((1u << (length % 8)) - 1u);
  }

  BitSeq BitSeq::FromUInt32(uint32_t value, uint32_t width)
  {
    if (width > 32) throw std::logic_error("BitSeq: width over 32 bits");
    return BitStacker(width).Stack(value, width, 0).Build();
  }

  bool BitSeq::Bit(uint32_t idx) const
  {
    if (idx >= length)
      throw std::out_of_range("BitSeq: bit index past end of sequence");
    return (bytes[idx / 8] >> (idx % 8)) & 1;
  }

  uint32_t BitSeq::Field(uint32_t offset, uint32_t width) const
  {
    if (width > 32) throw std::logic_error("BitSeq: field wider than 32 bits");
    if ((uint64_t)offset + width > length)
      throw std::out_of_range("BitSeq: field past end of sequence");

    uint32_t v = 0;
    for (uint32_t i = 0; i < width; i++)
      if ((bytes[(offset + i) / 8] >> ((offset + i) % 8)) & 1) v |= (1u << i);
    return v;
  }

  uint32_t BitSeq::ToUInt32() const
  {
    return Field(0, length < 32 ? length : 32);
  }

  std::vector<uint8_t> BitSeq::ToBytes(uint32_t bit_offset, uint32_t count) const
  {
    if ((uint64_t)bit_offset + (uint64_t)count * 8 > length)
      throw std::out_of_range("BitSeq: byte range past end of sequence");

    std::vector<uint8_t> out(count);
    for (uint32_t i = 0; i < count; i++)
      out[i] = (uint8_t)Field(bit_offset + i * 8, 8);
    return out;
  }

  BitSeq BitSeq::Skip(uint32_t bits) const
  {
    if (bits > length)
      throw std::out_of_range("BitSeq: skip past end of sequence");

    const uint32_t n = length - bits;
    BitStacker st(n);
    for (uint32_t i = 0; i < n; i += 32)
    {
      uint32_t w = (n - i < 32) ? n - i : 32;
      st.Stack(Field(bits + i, w), w, i);
    }
    return st.Build();
  }

  std::string BitSeq::ToString() const
  {
    if (length == 0) return "<empty>";
    std::string s;
    char buf[4];
    for (size_t i = bytes.size(); i > 0; i--)
    {
      snprintf(buf, sizeof(buf), "%02X", bytes[i - 1]);
      s += buf;
    }
    return s + " (" + std::to_string(length) + " bits)";
  }

  bool BitSeq::operator==(const BitSeq& rhs) const
  {
    return length == rhs.length && bytes == rhs.bytes;
  }

  // ---------- BitStacker ----------

  BitStacker::BitStacker(uint32_t width_)
    : bytes(BytesFor(width_), 0), width(width_)
  {
  }

  BitStacker& BitStacker::Stack(uint32_t value, uint32_t w, uint32_t offset)
  {
    Put(value, w, offset, true);
    return *this;
  }

  BitStacker& BitStacker::Merge(uint32_t value, uint32_t w, uint32_t offset)
  {
    Put(value, w, offset, false);
    return *this;
  }

  void BitStacker::Put(uint32_t value, uint32_t w, uint32_t offset, bool overwrite)
  {
    if (w > 32) throw std::logic_error("BitStacker: fragment wider than 32 bits");
    if ((uint64_t)offset + w > width)
      throw std::out_of_range("BitStacker: fragment past end of register");

    value = MaskBits(value, w);
    for (uint32_t i = 0; i < w; i++)
    {
      uint32_t pos = offset + i;
      uint8_t  bit = (uint8_t)(1u << (pos % 8));
      if (overwrite) bytes[pos / 8] &= (uint8_t)~bit;
      if ((value >> i) & 1) bytes[pos / 8] |= bit;
    }
  }

} // namespace Sdemu
