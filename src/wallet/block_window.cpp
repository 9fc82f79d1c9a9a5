// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/block_window.hpp"
#include <algorithm>

namespace walletsync {
namespace wallet {

std::vector<TxWithUndo> ExtractTxsWithUndo(const chain::Blund &blund,
                                           const util::SafeLogger &logger) {
  const auto *main = std::get_if<chain::MainBlock>(&blund.block);
  if (!main) {
    return {};
  }

  const auto &txs = main->txs;
  const auto &undo = blund.undo.tx_undo;
  if (txs.size() != undo.size()) {
    logger.Public().warn("Block {} has {} txs but {} undo entries, using first {}",
                         main->header.hash.ShortHex(), txs.size(), undo.size(),
                         std::min(txs.size(), undo.size()));
  }

  const chain::BlockHeader header = main->header;
  const size_t n = std::min(txs.size(), undo.size());
  std::vector<TxWithUndo> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(TxWithUndo{&txs[i], &undo[i], header});
  }
  return out;
}

std::vector<TxWithUndo> FlattenForApply(const chain::OldestFirst<chain::Blund> &window,
                                        const util::SafeLogger &logger) {
  std::vector<TxWithUndo> out;
  for (const auto &blund : window.Get()) {
    auto block_txs = ExtractTxsWithUndo(blund, logger);
    out.insert(out.end(), block_txs.begin(), block_txs.end());
  }
  return out;
}

std::vector<TxWithUndo> FlattenForRollback(const chain::NewestFirst<chain::Blund> &window,
                                           const util::SafeLogger &logger) {
  std::vector<TxWithUndo> out;
  for (const auto &blund : window.Get()) {
    auto block_txs = ExtractTxsWithUndo(blund, logger);
    out.insert(out.end(), block_txs.rbegin(), block_txs.rend());
  }
  return out;
}

chain::HeaderHash ApplyWindowNewTip(const chain::OldestFirst<chain::Blund> &window) {
  return chain::BlundHash(window.Newest());
}

chain::HeaderHash RollbackWindowNewTip(const chain::NewestFirst<chain::Blund> &window) {
  return chain::BlundPrevHash(window.Oldest());
}

} // namespace wallet
} // namespace walletsync
