// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/modifier.hpp"
#include <spdlog/fmt/fmt.h>

namespace walletsync {
namespace wallet {

bool WalletModifier::IsEmpty() const {
  return utxo_added.empty() && utxo_spent.empty() && history.empty() &&
         used_addresses.empty() && ptx_confirmed.empty();
}

std::string WalletModifier::ToString(util::SecurityLevel sl) const {
  std::string out = fmt::format(
      "modifier(utxo +{} -{}, history {}, used addresses {}, ptx {})",
      utxo_added.size(), utxo_spent.size(), history.size(),
      used_addresses.size(), ptx_confirmed.size());
  if (sl == util::SecurityLevel::Public) {
    return out;
  }

  for (const auto &[op, out_entry] : utxo_added) {
    out += fmt::format("\n  + {}:{} {} {}", op.tx_id.ShortHex(), op.index,
                       out_entry.address, out_entry.value);
  }
  for (const auto &[op, out_entry] : utxo_spent) {
    out += fmt::format("\n  - {}:{} {} {}", op.tx_id.ShortHex(), op.index,
                       out_entry.address, out_entry.value);
  }
  for (const auto &[id, entry] : history) {
    out += fmt::format("\n  tx {} received={} spent={}", id.ShortHex(),
                       entry.received, entry.spent);
  }
  for (const auto &[address, hash] : used_addresses) {
    out += fmt::format("\n  used {} @ {}", address, hash.ShortHex());
  }
  return out;
}

} // namespace wallet
} // namespace walletsync
