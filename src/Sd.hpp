/* src/Sd.hpp - SD/MMC カードモデル (SDモード, コマンド/レスポンス単位)
 *
 * 未対応:
 *   - カード選択/非選択の切り替え
 *   - RCA (relative card address) によるフィルタリング
 *   そのため1つのコントローラに複数枚のカードを同時に接続すると正しく動かない場合がある
 */
#pragma once
#include "BitSeq.hpp"
#include "Register.hpp"
#include "Storage.hpp"
#include "Transfer.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Sdemu
{
namespace Sd
{

  // 標準コマンド
  enum class Cmd : uint32_t
  {
    GO_IDLE_STATE        = 0,
    ALL_SEND_CID         = 2,
    SEND_RELATIVE_ADDR   = 3,
    SELECT_DESELECT_CARD = 7,
    SEND_IF_COND         = 8,  // v2.0 で追加。応答しなくてよい
    SEND_CSD             = 9,
    STOP_TRANSMISSION    = 12,
    SEND_STATUS          = 13,
    SET_BLOCKLEN         = 16,
    READ_SINGLE_BLOCK    = 17,
    READ_MULTIPLE_BLOCK  = 18,
    WRITE_BLOCK          = 24,
    APP_CMD              = 55,
  };

  // CMD55 直後のみ有効なアプリケーション固有コマンド
  enum class AppCmd : uint32_t
  {
    SD_STATUS       = 13,
    SD_SEND_OP_COND = 41,
    SEND_SCR        = 51,
  };

  // CSD フィールド値
  namespace Csd
  {
    constexpr uint32_t SIZE_MULT_512      = 7;    // C_SIZE_MULT
    constexpr uint32_t DEVICE_SIZE_MAX    = 0xFFF;
    constexpr uint32_t READ_BL_LEN_2048   = 11;   // 9=512, 10=1024, 11=2048
    constexpr uint32_t CCC_CLASS0         = 1u << 0;
    constexpr uint32_t TRAN_RATE_10MBIT   = 2;    // 0=100k, 1=1M, 2=10M, 3=100M
    constexpr uint32_t TRAN_MULT_2_5      = 6;
  }

  // レジスタ幅 [bit]
  constexpr uint32_t STATUS_BITS    = 32;
  constexpr uint32_t OCR_BITS       = 32;
  constexpr uint32_t CSD_BITS       = 128;
  constexpr uint32_t CID_BITS       = 128;
  constexpr uint32_t SCR_BITS       = 64;
  constexpr uint32_t SD_STATUS_BITS = 512;
  // CID/CSD は末尾の CRC バイトを落として返す
  constexpr uint32_t CRC_SKIP_BITS  = 8;

  // カード状態
  //   レジスタ断片のコールバックが this を参照するのでコピー不可
  struct Card
  {
    Card();
    ~Card();
    Card(const Card&) = delete;
    Card& operator=(const Card&) = delete;

    Storage::State storage;

    Transfer::Context read_ctx;
    Transfer::Context write_ctx;

    uint32_t block_len    = 0;     // CMD16 で設定。Reset では消えない
    uint16_t card_address = 0;     // RCA (外部から割り当て)
    bool     is_acmd      = false; // 次がACMDか

    Register status_reg;
    Register ocr_reg;
    Register csd_reg;
    Register cid_reg;
  };

  // イメージを開いてカードに挿入
  //   size: 明示サイズ [byte] (0=既存イメージの長さ)。新規イメージでは必須
  bool MountImg(Card& card, const std::string& path, uint64_t size = 0,
                bool persistent = false);
  void UnmountImg(Card& card);
  bool IsMounted(const Card& card);

  // ハードウェアリセット相当 (block_len は保持)
  void Reset(Card& card);

  // コマンド処理。レスポンスは 0/32/120/128 ビット
  BitSeq HandleCommand(Card& card, uint32_t index, uint32_t arg);

  // データ転送
  void WriteData(Card& card, const std::vector<uint8_t>& data);
  std::vector<uint8_t> ReadData(Card& card, uint32_t count);
  // CMD18 の後、最初の ReadData より前にコントローラが呼ぶ
  void SetReadLimit(Card& card, uint32_t bytes);

  bool IsReadyForReading(const Card& card);
  bool IsReadyForWriting(const Card& card);

  // レジスタ値
  BitSeq CardStatus(const Card& card);
  BitSeq OperatingConditions(const Card& card);
  BitSeq CardSpecificData(const Card& card);
  BitSeq CardIdentification(const Card& card);
  BitSeq SdStatus();
  BitSeq SdConfiguration();

  // CMD3 (R6) レスポンス
  //   status の [12:0] をそのまま、bit13 を bit19、[15:14] を [23:22] に置き
  //   下位16ビットを card_address で上書きする
  BitSeq RelativeAddress(uint32_t status, uint16_t card_address);

}
}
