/* src/Storage.cpp - カードイメージのバイト単位バックエンド */
#include "Storage.hpp"
#include "Log.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>   // ftruncate

namespace Sdemu
{
namespace Storage
{

  // ---------- 内部ヘルパー----------
  static bool FileLength(FILE* fp, uint64_t& out)
  {
    if (fseeko(fp, 0, SEEK_END) != 0) return false;
    off_t end = ftello(fp);
    if (end < 0) return false;
    out = (uint64_t)end;
    rewind(fp);
    return true;
  }

  static bool OpenPersistent(State& st, uint64_t size)
  {
    st.fp = fopen(st.path.c_str(), "r+b");
    if (!st.fp)
    {
      if (size == 0)
      {
        SDEMU_ERROR("storage", "Image '%s' not found and no size given", st.path.c_str());
        return false;
      }
      st.fp = fopen(st.path.c_str(), "w+b");
      if (!st.fp)
      {
        SDEMU_ERROR("storage", "Could not create image '%s': %s", st.path.c_str(), strerror(errno));
        return false;
      }
    }

    if (!FileLength(st.fp, st.length))
    {
      SDEMU_ERROR("storage", "Could not determine length of '%s'", st.path.c_str());
      return false;
    }

    // 明示サイズに合わせて伸縮
    if (size != 0 && size != st.length)
    {
      fflush(st.fp);
      if (ftruncate(fileno(st.fp), (off_t)size) != 0)
      {
        SDEMU_ERROR("storage", "Could not resize '%s' to %llu bytes: %s",
                    st.path.c_str(), (unsigned long long)size, strerror(errno));
        return false;
      }
      st.length = size;
    }
    st.kind = State::FILE_BACKED;
    return true;
  }

  static bool OpenPrivateCopy(State& st, uint64_t size)
  {
    FILE* fp = fopen(st.path.c_str(), "rb");
    if (fp)
    {
      uint64_t len = 0;
      if (!FileLength(fp, len))
      {
        fclose(fp);
        SDEMU_ERROR("storage", "Could not determine length of '%s'", st.path.c_str());
        return false;
      }
      st.mem.resize(len);
      size_t r = len ? fread(st.mem.data(), 1, len, fp) : 0;
      fclose(fp);
      if (r != len)
      {
        SDEMU_ERROR("storage", "Short read while copying '%s'", st.path.c_str());
        return false;
      }
    }
    else if (size == 0)
    {
      SDEMU_ERROR("storage", "Image '%s' not found and no size given", st.path.c_str());
      return false;
    }

    if (size != 0) st.mem.resize(size, 0);
    st.length = st.mem.size();
    st.kind = State::MEMORY;
    return true;
  }
  // ---------- 内部ヘルパー----------

  bool Open(State& st, const std::string& path, uint64_t size, bool persistent)
  {
    Close(st);
    st.path = path;

    bool ok = persistent ? OpenPersistent(st, size) : OpenPrivateCopy(st, size);
    if (!ok)
    {
      Close(st);
      return false;
    }

    SDEMU_INFO("storage", "Opened '%s' (%llu bytes, %s)", path.c_str(),
               (unsigned long long)st.length, persistent ? "persistent" : "private copy");
    return true;
  }

  void Close(State& st)
  {
    if (st.fp)
    {
      fflush(st.fp);
      fclose(st.fp);
      st.fp = nullptr;
    }
    st.mem.clear();
    st.mem.shrink_to_fit();
    st.kind   = State::NONE;
    st.length = 0;
    st.pos    = 0;
  }

  bool IsOpen(const State& st) { return st.kind != State::NONE; }

  uint64_t Length(const State& st) { return st.length; }

  void SetPosition(State& st, uint64_t offset) { st.pos = offset; }

  size_t Read(State& st, uint8_t* dst, size_t count)
  {
    if (st.pos >= st.length) return 0;
    if (count > st.length - st.pos) count = (size_t)(st.length - st.pos);

    size_t r = 0;
    if (st.kind == State::MEMORY)
    {
      memcpy(dst, st.mem.data() + st.pos, count);
      r = count;
    }
    else if (st.kind == State::FILE_BACKED)
    {
      if (fseeko(st.fp, (off_t)st.pos, SEEK_SET) != 0) return 0;
      r = fread(dst, 1, count, st.fp);
    }
    st.pos += r;
    return r;
  }

  size_t Write(State& st, const uint8_t* src, size_t count)
  {
    if (st.pos >= st.length) return 0;
    if (count > st.length - st.pos) count = (size_t)(st.length - st.pos);

    size_t w = 0;
    if (st.kind == State::MEMORY)
    {
      memcpy(st.mem.data() + st.pos, src, count);
      w = count;
    }
    else if (st.kind == State::FILE_BACKED)
    {
      if (fseeko(st.fp, (off_t)st.pos, SEEK_SET) != 0) return 0;
      w = fwrite(src, 1, count, st.fp);
      fflush(st.fp);
    }
    st.pos += w;
    return w;
  }

} // namespace Storage
} // namespace Sdemu
