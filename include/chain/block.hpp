// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace walletsync {
namespace chain {

using HeaderHash = uint256;
using TxId = uint256;
using Address = std::string;
using Coin = uint64_t;
using ChainDifficulty = uint64_t;

// Slot coordinates: epoch index plus slot index local to the epoch
struct SlotId {
  uint64_t epoch{0};
  uint32_t slot{0};

  friend bool operator==(const SlotId &a, const SlotId &b) {
    return a.epoch == b.epoch && a.slot == b.slot;
  }
};

// ============================================================================
// Transactions
// ============================================================================

struct TxIn {
  TxId prev_id;       // Transaction that created the spent output
  uint32_t index{0};  // Output index within that transaction
};

struct TxOut {
  Address address;
  Coin value{0};

  friend bool operator==(const TxOut &a, const TxOut &b) {
    return a.address == b.address && a.value == b.value;
  }
};

struct Tx {
  TxId id;
  std::vector<TxIn> inputs;
  std::vector<TxOut> outputs;
};

// Outputs spent by a transaction's inputs, index-aligned with Tx::inputs.
// Needed to reverse the transaction during rollback.
using TxUndo = std::vector<TxOut>;

// Per-block undo data, index-aligned with MainBlock::txs
struct Undo {
  std::vector<TxUndo> tx_undo;
};

// ============================================================================
// Headers
// ============================================================================

// Epoch boundary block header. Carries no transactions and has no slot
// start time of its own.
struct GenesisBlockHeader {
  HeaderHash hash;
  HeaderHash prev_hash;
  uint64_t epoch{0};
  ChainDifficulty difficulty{0};
};

struct MainBlockHeader {
  HeaderHash hash;
  HeaderHash prev_hash;
  SlotId slot;
  ChainDifficulty difficulty{0};
};

using BlockHeader = std::variant<GenesisBlockHeader, MainBlockHeader>;

HeaderHash HeaderHashOf(const BlockHeader &header);
HeaderHash PrevHashOf(const BlockHeader &header);
ChainDifficulty DifficultyOf(const BlockHeader &header);
bool IsGenesis(const BlockHeader &header);

// One-line description, e.g. "main(1a2b3c4d, epoch=2, slot=17, diff=40)"
std::string HeaderToString(const BlockHeader &header);

// ============================================================================
// Blocks
// ============================================================================

struct GenesisBlock {
  GenesisBlockHeader header;
};

struct MainBlock {
  MainBlockHeader header;
  std::vector<Tx> txs;
};

using Block = std::variant<GenesisBlock, MainBlock>;

BlockHeader GetBlockHeader(const Block &block);

// Block paired with its undo data. Undo is empty for genesis blocks.
struct Blund {
  Block block;
  Undo undo;
};

HeaderHash BlundHash(const Blund &blund);
HeaderHash BlundPrevHash(const Blund &blund);

} // namespace chain
} // namespace walletsync
