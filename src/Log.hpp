/* src/Log.hpp - sokol_log 経由のログ出力 */
#pragma once
#include <cstdint>

namespace Sdemu
{
namespace Log
{

  // sokol_log のログレベル
  enum Level : uint32_t
  {
    PANIC = 0,
    ERROR = 1,
    WARN  = 2,
    INFO  = 3,
  };

  // printf 形式で整形して slog_func に渡す
  void Write(const char* tag, uint32_t level, uint32_t line, const char* file,
             const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 5, 6)))
#endif
    ;

  // デバッグ出力(受信コマンド等)の有効/無効
  void SetVerbose(bool on);
  bool Verbose();

} // namespace Log
} // namespace Sdemu

// 各ペリフェラルは自分のタグを渡して使う
#define SDEMU_LOG(tag, level, ...) \
  ::Sdemu::Log::Write(tag, level, __LINE__, __FILE__, __VA_ARGS__)

#define SDEMU_WARN(tag, ...)  SDEMU_LOG(tag, ::Sdemu::Log::WARN, __VA_ARGS__)
#define SDEMU_ERROR(tag, ...) SDEMU_LOG(tag, ::Sdemu::Log::ERROR, __VA_ARGS__)
#define SDEMU_INFO(tag, ...)  SDEMU_LOG(tag, ::Sdemu::Log::INFO, __VA_ARGS__)

// verbose 時のみ info レベルで出す
#define SDEMU_DEBUG(tag, ...) \
  do { if (::Sdemu::Log::Verbose()) SDEMU_INFO(tag, __VA_ARGS__); } while (0)
