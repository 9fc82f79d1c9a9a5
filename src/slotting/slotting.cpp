// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "slotting/slotting.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace walletsync {
namespace slotting {

void SlottingData::AddEpoch(uint64_t epoch, const EpochSlottingData &data) {
  epochs_[epoch] = data;
}

void SlottingData::AddUniformEpochs(uint64_t first, uint64_t last,
                                    std::chrono::milliseconds slot_duration,
                                    uint32_t slots_per_epoch,
                                    std::chrono::microseconds first_start_diff) {
  if (first > last) {
    throw std::invalid_argument("uniform epoch range is empty");
  }
  if (slot_duration.count() <= 0 || slots_per_epoch == 0) {
    throw std::invalid_argument("uniform epochs need positive slot duration and count");
  }
  runs_.push_back(UniformRun{first, last, slot_duration, slots_per_epoch, first_start_diff});
}

std::optional<EpochSlottingData> SlottingData::Find(uint64_t epoch) const {
  auto it = epochs_.find(epoch);
  if (it != epochs_.end()) {
    return it->second;
  }

  // Most recently added run wins where runs overlap
  for (auto run = runs_.rbegin(); run != runs_.rend(); ++run) {
    if (epoch < run->first || epoch > run->last) {
      continue;
    }
    const auto epoch_length = std::chrono::duration_cast<std::chrono::microseconds>(
        run->slot_duration * run->slots_per_epoch);
    return EpochSlottingData{run->slot_duration,
                             run->first_start_diff +
                                 epoch_length * static_cast<int64_t>(epoch - run->first)};
  }
  return std::nullopt;
}

std::optional<uint64_t> SlottingData::LastKnownEpoch() const {
  std::optional<uint64_t> last;
  if (!epochs_.empty()) {
    last = epochs_.rbegin()->first;
  }
  for (const auto &run : runs_) {
    if (!last || run.last > *last) {
      last = run.last;
    }
  }
  return last;
}

std::optional<Timestamp> GetSlotStart(Timestamp system_start,
                                      const chain::SlotId &slot,
                                      const SlottingData &sd) {
  const std::optional<EpochSlottingData> epoch = sd.Find(slot.epoch);
  if (!epoch) {
    return std::nullopt;
  }
  return system_start + epoch->start_diff +
         std::chrono::duration_cast<Timestamp>(epoch->slot_duration * slot.slot);
}

// ============================================================================
// FixedSlotting
// ============================================================================

FixedSlotting::FixedSlotting(Timestamp system_start,
                             std::chrono::milliseconds slot_duration,
                             uint32_t slots_per_epoch, uint64_t lookahead_epochs)
    : system_start_(system_start),
      slot_duration_(slot_duration),
      slots_per_epoch_(slots_per_epoch),
      lookahead_epochs_(lookahead_epochs) {
  if (slot_duration_.count() <= 0) {
    throw std::invalid_argument("slot duration must be positive");
  }
  if (slots_per_epoch_ == 0) {
    throw std::invalid_argument("slots per epoch must be positive");
  }
}

uint64_t FixedSlotting::CurrentEpoch() const {
  const Timestamp now(util::GetTimeMicros());
  if (now <= system_start_) {
    return 0;
  }
  const auto epoch_length =
      std::chrono::duration_cast<Timestamp>(slot_duration_ * slots_per_epoch_);
  return static_cast<uint64_t>((now - system_start_) / epoch_length);
}

SlottingData FixedSlotting::GetSlottingData() const {
  SlottingData sd;
  const uint64_t last = CurrentEpoch() + lookahead_epochs_;
  sd.AddUniformEpochs(0, last, slot_duration_, slots_per_epoch_, std::chrono::microseconds(0));
  LOG_SLOTTING_DEBUG("Slotting data covers epochs 0..{}", last);
  return sd;
}

HeaderTimestampFn MakeHeaderTimestampFn(Timestamp system_start, SlottingData sd) {
  return [system_start, sd = std::move(sd)](
             const chain::BlockHeader &header) -> std::optional<Timestamp> {
    return std::visit(
        [&](const auto &h) -> std::optional<Timestamp> {
          using T = std::decay_t<decltype(h)>;
          if constexpr (std::is_same_v<T, chain::GenesisBlockHeader>) {
            return std::nullopt;
          } else {
            return GetSlotStart(system_start, h.slot, sd);
          }
        },
        header);
  };
}

} // namespace slotting
} // namespace walletsync
