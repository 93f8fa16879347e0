/* src/Log.cpp - sokol_log 経由のログ出力 */
#include "Log.hpp"
#include "sokol_log.h"
#include <cstdarg>
#include <cstdio>

namespace Sdemu
{
namespace Log
{

  static bool s_verbose = false;

  void Write(const char* tag, uint32_t level, uint32_t line, const char* file,
             const char* fmt, ...)
  {
    char msg[512];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    // log_item は使わないので 0 固定
    slog_func(tag, level, 0, msg, line, file, nullptr);
  }

  void SetVerbose(bool on) { s_verbose = on; }
  bool Verbose() { return s_verbose; }

} // namespace Log
} // namespace Sdemu
