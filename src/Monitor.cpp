/* src/Monitor.cpp - sdmon のコマンド解釈 */
#include "Monitor.hpp"
#include "SdemuSystem.hpp"
#include "Log.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace Sdemu
{
namespace Monitor
{

  // ---------- 内部ヘルパー----------
  static bool ParseNum(const std::string& s, uint32_t& out)
  {
    if (s.empty()) return false;
    char* end = nullptr;
    unsigned long v = strtoul(s.c_str(), &end, 0);
    if (*end != '\0') return false;
    out = (uint32_t)v;
    return true;
  }

  static void SetReg(System& sys, uint8_t reg, uint8_t val) { BusWrite(sys, SDHOST_BASE + reg, val); }
  static uint8_t GetReg(System& sys, uint8_t reg) { return BusRead(sys, SDHOST_BASE + reg); }

  // バス経由でコマンドを発行してレスポンスを表示
  static void Issue(System& sys, uint32_t idx, uint32_t arg, FILE* out)
  {
    SetReg(sys, SdHost::Reg::ARG0, (uint8_t)(arg));
    SetReg(sys, SdHost::Reg::ARG1, (uint8_t)(arg >> 8));
    SetReg(sys, SdHost::Reg::ARG2, (uint8_t)(arg >> 16));
    SetReg(sys, SdHost::Reg::ARG3, (uint8_t)(arg >> 24));
    SetReg(sys, SdHost::Reg::CMD,  (uint8_t)idx);

    uint8_t bits = GetReg(sys, SdHost::Reg::RLEN);
    fprintf(out, "CMD%u arg=0x%08X -> ", idx, arg);
    if (bits == 0)
    {
      fprintf(out, "(no response)\n");
      return;
    }
    // 上位バイトから表示
    for (int i = (bits + 7) / 8 - 1; i >= 0; i--)
    {
      SetReg(sys, SdHost::Reg::RSEL, (uint8_t)i);
      fprintf(out, "%02X", GetReg(sys, SdHost::Reg::RDAT));
    }
    fprintf(out, " [%u bits]\n", bits);
  }

  static void Dump(const std::vector<uint8_t>& d, FILE* out)
  {
    for (size_t i = 0; i < d.size(); i++)
    {
      if (i % 16 == 0) fprintf(out, "%04zX:", i);
      fprintf(out, " %02X", d[i]);
      if (i % 16 == 15 || i + 1 == d.size()) fprintf(out, "\n");
    }
  }

  static void PrintHelp(FILE* out)
  {
    fprintf(out,
      "cmd <idx> [arg] | acmd <idx> [arg] | read <n> | write <n> [byte]\n"
      "blocks <n> | rca <n> | reset | status | help\n");
  }
  // ---------- 内部ヘルパー----------

  bool Execute(System& sys, const std::string& line, FILE* out)
  {
    std::istringstream is(line);
    std::string op;
    std::vector<std::string> args;
    is >> op;
    if (op.empty() || op[0] == '#') return true; // 空行・コメント
    for (std::string a; is >> a; ) args.push_back(a);

    std::vector<uint32_t> n(args.size());
    for (size_t i = 0; i < args.size(); i++)
    {
      if (!ParseNum(args[i], n[i]))
      {
        fprintf(out, "bad number '%s'\n", args[i].c_str());
        return false;
      }
    }

    if ((op == "cmd" || op == "acmd") && (n.size() == 1 || n.size() == 2))
    {
      uint32_t arg = n.size() == 2 ? n[1] : 0;
      if (op == "acmd") Issue(sys, (uint32_t)Sd::Cmd::APP_CMD, 0, out);
      Issue(sys, n[0] & 0x3F, arg, out);
      return true;
    }
    if (op == "read" && n.size() == 1)
    {
      // 読めなくなったら打ち切る (以降は 0xFF が返るだけ)
      std::vector<uint8_t> d;
      for (uint32_t i = 0; i < n[0]; i++)
      {
        if (!(GetReg(sys, SdHost::Reg::STAT) & SdHost::STAT_READ_READY))
        {
          fprintf(out, "read stopped after %u of %u bytes\n", i, n[0]);
          break;
        }
        d.push_back(GetReg(sys, SdHost::Reg::DATA));
      }
      Dump(d, out);
      return true;
    }
    if (op == "write" && (n.size() == 1 || n.size() == 2))
    {
      uint8_t val = n.size() == 2 ? (uint8_t)n[1] : 0x00;
      for (uint32_t i = 0; i < n[0]; i++) SetReg(sys, SdHost::Reg::DATA, val);
      return true;
    }
    if (op == "blocks" && n.size() == 1)
    {
      SetReg(sys, SdHost::Reg::BCNTL, (uint8_t)n[0]);
      SetReg(sys, SdHost::Reg::BCNTH, (uint8_t)(n[0] >> 8));
      return true;
    }
    if (op == "rca" && n.size() == 1)
    {
      sys.card.card_address = (uint16_t)n[0];
      return true;
    }
    if (op == "reset" && n.empty())
    {
      Reset(sys);
      return true;
    }
    if (op == "status" && n.empty())
    {
      fprintf(out, "STAT=%02X IFR=%02X IRQ=%d\n",
              GetReg(sys, SdHost::Reg::STAT), GetReg(sys, SdHost::Reg::IFR), sys.irq ? 1 : 0);
      return true;
    }
    if (op == "help")
    {
      PrintHelp(out);
      return true;
    }

    SDEMU_WARN("sdmon", "Unknown monitor command: %s", line.c_str());
    fprintf(out, "unknown command: %s\n", line.c_str());
    return false;
  }

  int RunList(System& sys, const std::string& list, FILE* out, const volatile sig_atomic_t* stop)
  {
    int failed = 0;
    std::istringstream is(list);
    for (std::string line; std::getline(is, line, ';'); )
    {
      if (stop && *stop) break;
      if (!Execute(sys, line, out)) failed++;
    }
    return failed;
  }

  int RunScript(System& sys, const std::string& path, FILE* out, const volatile sig_atomic_t* stop)
  {
    std::ifstream is(path);
    if (!is)
    {
      SDEMU_ERROR("sdmon", "Could not open script '%s'", path.c_str());
      return -1;
    }
    int failed = 0;
    // 行の長さに上限なし
    for (std::string line; std::getline(is, line); )
    {
      if (stop && *stop) break;
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!Execute(sys, line, out)) failed++;
    }
    return failed;
  }

}
}
