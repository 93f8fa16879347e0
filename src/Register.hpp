/* src/Register.hpp - ビットフィールド断片からレジスタ値を合成 */
#pragma once
#include "BitSeq.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace Sdemu
{

  // レジスタ断片 (定数 or 読み出し時に評価するコールバック)
  struct Fragment
  {
    uint32_t offset = 0;
    uint32_t width  = 0;
    uint32_t value  = 0;                 // fn が空のとき使う (マスク済み)
    std::function<uint32_t()> fn;
    const char* name = "";
  };

  // 固定幅レジスタ
  //   断片同士の重なりは禁止 (テストで FindOverlap を使って確認する)
  class Register
  {
  public:
    explicit Register(uint32_t width) : width(width) {}

    Register& Define(uint32_t offset, uint32_t width, uint32_t value, const char* name);
    Register& Define(uint32_t offset, uint32_t width, std::function<uint32_t()> fn,
                     const char* name);

    // 全断片を評価して OR 合成し、下位 skip ビットを落として返す
    BitSeq Synthesize(uint32_t skip = 0) const;

    uint32_t Width() const { return width; }
    const std::vector<Fragment>& Fragments() const { return fragments; }

  private:
    uint32_t width;
    std::vector<Fragment> fragments;
  };

  // 重なっている断片の組を探す。見つかれば true
  bool FindOverlap(const Register& reg, const Fragment** a = nullptr,
                   const Fragment** b = nullptr);

} // namespace Sdemu
