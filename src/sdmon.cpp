/* src/sdmon.cpp - SDカードモデルのヘッドレスモニタ
 *
 * 引数 (key=value):
 *   image=sdcard.img  size=<bytes>  persistent=false
 *   script=<file>  run=<commands>  verbose=false
 * run の値に空白を含める場合は sokol_args の規則どおり値自体を引用符で囲む:
 *   sdmon image=card.img run='"cmd 16 512; cmd 17 0; read 512"'
 * script も run も無ければ標準入力から1行ずつ読む
 */
#include "SdemuSystem.hpp"
#include "Monitor.hpp"
#include "Log.hpp"
#include "sokol_args.h"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

// 実行継続フラグ (Ctrl+C で1)
volatile sig_atomic_t g_stop = 0;
// Ctrl+C ハンドラ
void handle_sigint(int) { g_stop = 1; }

int main(int argc, char* argv[])
{
  // コマンドライン引数パース
  sargs_desc sargs_d = {};
  sargs_d.argc = argc;
  sargs_d.argv = argv;
  sargs_setup(&sargs_d);

  Sdemu::Log::SetVerbose(sargs_boolean("verbose"));

  std::string image = sargs_value_def("image", "sdcard.img");
  uint64_t size = 0;
  if (sargs_exists("size"))
    size = strtoull(sargs_value("size"), nullptr, 0);
  bool persistent = sargs_boolean("persistent");

  // System は 32KB の RAM を抱えるのでヒープに置く
  auto sys = std::make_unique<Sdemu::System>();

  // SDカードイメージをマウント
  if (!Sdemu::Sd::MountImg(sys->card, image, size, persistent))
  {
    fprintf(stderr, "Error: failed to mount SD card image '%s'\n", image.c_str());
    sargs_shutdown();
    return 1;
  }

  signal(SIGINT, handle_sigint);

  int failed = 0;
  if (sargs_exists("script"))
  {
    failed = Sdemu::Monitor::RunScript(*sys, sargs_value("script"), stdout, &g_stop);
  }
  else if (sargs_exists("run"))
  {
    failed = Sdemu::Monitor::RunList(*sys, sargs_value("run"), stdout, &g_stop);
  }
  else
  {
    // 対話モード
    char buf[256];
    printf("sdmon> ");
    fflush(stdout);
    while (!g_stop && fgets(buf, sizeof(buf), stdin))
    {
      std::string line(buf);
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
      if (line == "quit" || line == "exit") break;
      if (!Sdemu::Monitor::Execute(*sys, line, stdout)) failed++;
      printf("sdmon> ");
      fflush(stdout);
    }
  }

  Sdemu::Sd::UnmountImg(sys->card);
  sargs_shutdown();
  return failed == 0 ? 0 : 1;
}
