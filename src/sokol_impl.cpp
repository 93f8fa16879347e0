/* src/sokol_impl.cpp - Sokol 実装定義 (ヘッドレス: log と args のみ) */

#define SOKOL_IMPL
#include "sokol_log.h"
#include "sokol_args.h"
