// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace walletsync {
namespace chain {

HeaderHash HeaderHashOf(const BlockHeader &header) {
  return std::visit([](const auto &h) { return h.hash; }, header);
}

HeaderHash PrevHashOf(const BlockHeader &header) {
  return std::visit([](const auto &h) { return h.prev_hash; }, header);
}

ChainDifficulty DifficultyOf(const BlockHeader &header) {
  return std::visit([](const auto &h) { return h.difficulty; }, header);
}

bool IsGenesis(const BlockHeader &header) {
  return std::holds_alternative<GenesisBlockHeader>(header);
}

std::string HeaderToString(const BlockHeader &header) {
  return std::visit(
      [](const auto &h) -> std::string {
        using T = std::decay_t<decltype(h)>;
        if constexpr (std::is_same_v<T, GenesisBlockHeader>) {
          return fmt::format("genesis({}, epoch={}, diff={})", h.hash.ShortHex(),
                             h.epoch, h.difficulty);
        } else {
          return fmt::format("main({}, epoch={}, slot={}, diff={})",
                             h.hash.ShortHex(), h.slot.epoch, h.slot.slot,
                             h.difficulty);
        }
      },
      header);
}

BlockHeader GetBlockHeader(const Block &block) {
  return std::visit([](const auto &b) -> BlockHeader { return b.header; }, block);
}

HeaderHash BlundHash(const Blund &blund) {
  return std::visit([](const auto &b) { return b.header.hash; }, blund.block);
}

HeaderHash BlundPrevHash(const Blund &blund) {
  return std::visit([](const auto &b) { return b.header.prev_hash; }, blund.block);
}

} // namespace chain
} // namespace walletsync
