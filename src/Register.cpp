/* src/Register.cpp - ビットフィールド断片からレジスタ値を合成 */
#include "Register.hpp"
#include <utility>

namespace Sdemu
{

  Register& Register::Define(uint32_t offset, uint32_t w, uint32_t value, const char* name)
  {
    Fragment f;
    f.offset = offset;
    f.width  = w;
    f.value  = MaskBits(value, w);
    f.name   = name;
    fragments.push_back(std::move(f));
    return *this;
  }

  Register& Register::Define(uint32_t offset, uint32_t w, std::function<uint32_t()> fn,
                             const char* name)
  {
    Fragment f;
    f.offset = offset;
    f.width  = w;
    f.fn     = std::move(fn);
    f.name   = name;
    fragments.push_back(std::move(f));
    return *this;
  }

  BitSeq Register::Synthesize(uint32_t skip) const
  {
    BitStacker st(width);
    for (const Fragment& f : fragments)
    {
      // コールバックはここで評価するのでカードの現在状態が反映される
      uint32_t v = f.fn ? f.fn() : f.value;
      st.Merge(v, f.width, f.offset);
    }
    BitSeq bits = st.Build();
    return skip ? bits.Skip(skip) : bits;
  }

  bool FindOverlap(const Register& reg, const Fragment** a, const Fragment** b)
  {
    const auto& fr = reg.Fragments();
    for (size_t i = 0; i < fr.size(); i++)
    {
      for (size_t j = i + 1; j < fr.size(); j++)
      {
        uint64_t lo = fr[i].offset > fr[j].offset ? fr[i].offset : fr[j].offset;
        uint64_t hi_i = (uint64_t)fr[i].offset + fr[i].width;
        uint64_t hi_j = (uint64_t)fr[j].offset + fr[j].width;
        uint64_t hi = hi_i < hi_j ? hi_i : hi_j;
        if (lo < hi)
        {
          if (a) *a = &fr[i];
          if (b) *b = &fr[j];
          return true;
        }
      }
    }
    return false;
  }

} // namespace Sdemu
