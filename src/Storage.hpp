/* src/Storage.hpp - カードイメージのバイト単位バックエンド */
#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace Sdemu
{
namespace Storage
{

  struct State
  {
    // バックエンド種別
    //   FILE_BACKED: イメージファイルに直接書き込む (persistent)
    //   MEMORY     : イメージのプライベートコピー上で動作、元ファイルは不変
    enum Kind { NONE, FILE_BACKED, MEMORY } kind = NONE;

    FILE* fp = nullptr;
    std::vector<uint8_t> mem;
    std::string path;

    uint64_t length = 0; // バイト長 (オープン後は固定)
    uint64_t pos    = 0; // カーソル
  };

  // イメージを開く
  //   size: 明示サイズ [byte]。0 なら既存イメージの長さを使う (新規作成時は必須)
  //   persistent: true ならイメージに直接書き込む
  // 開けなければ false
  bool Open(State& st, const std::string& path, uint64_t size, bool persistent);
  void Close(State& st);

  bool     IsOpen(const State& st);
  uint64_t Length(const State& st);
  void     SetPosition(State& st, uint64_t offset);

  // カーソル位置から読み書きしてカーソルを進める
  // 戻り値が count 未満になるのは末尾に達したときのみ
  size_t Read(State& st, uint8_t* dst, size_t count);
  size_t Write(State& st, const uint8_t* src, size_t count);

} // namespace Storage
} // namespace Sdemu
