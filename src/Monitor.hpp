/* src/Monitor.hpp - sdmon のコマンド解釈
 *
 * コマンド (数値は10進/0x16進):
 *   cmd <idx> [arg]     コマンド発行、レスポンス表示
 *   acmd <idx> [arg]    CMD55 + ACMD<idx>
 *   read <n>            データポートから n バイト読んでダンプ
 *   write <n> [byte]    データポートへ byte を n 回書く (既定 0x00)
 *   blocks <n>          CMD18 用ブロック数
 *   rca <n>             カードアドレス設定
 *   reset               ハードリセット
 *   status              STAT/IFR 表示
 *   help
 */
#pragma once
#include <csignal>
#include <cstdio>
#include <string>

namespace Sdemu
{
  struct System;

  namespace Monitor
  {
    // 1行実行。不明なコマンドは報告して false
    bool Execute(System& sys, const std::string& line, FILE* out);

    // ';' 区切りのコマンド列を実行。stop が立ったら中断
    // 戻り値は失敗した行の数
    int RunList(System& sys, const std::string& list, FILE* out,
                const volatile sig_atomic_t* stop = nullptr);

    // ファイルから1行1コマンドで実行。開けなければ -1
    int RunScript(System& sys, const std::string& path, FILE* out,
                  const volatile sig_atomic_t* stop = nullptr);
  }
}
