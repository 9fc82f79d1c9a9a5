// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace walletsync {
namespace slotting {

// Microseconds since the Unix epoch
using Timestamp = std::chrono::microseconds;

// Slotting parameters of a single epoch
struct EpochSlottingData {
  std::chrono::milliseconds slot_duration{0};
  // Offset of the epoch's first slot from the system start
  std::chrono::microseconds start_diff{0};
};

/**
 * Slotting parameters for every epoch the node knows about
 *
 * Epochs are either recorded one by one (AddEpoch) or as a run of epochs
 * sharing one slot duration and length (AddUniformEpochs). A run is stored
 * as one rule; each epoch's data is computed on lookup. An epoch recorded
 * with AddEpoch takes precedence over any run covering it.
 */
class SlottingData {
public:
  void AddEpoch(uint64_t epoch, const EpochSlottingData &data);

  // Epochs first..last (inclusive), `slots_per_epoch` slots of `slot_duration`
  // each, epoch `first` starting `first_start_diff` after the system start.
  // @throws std::invalid_argument on an empty range or non-positive sizes
  void AddUniformEpochs(uint64_t first, uint64_t last,
                        std::chrono::milliseconds slot_duration,
                        uint32_t slots_per_epoch,
                        std::chrono::microseconds first_start_diff);

  // std::nullopt for an epoch the data does not cover
  std::optional<EpochSlottingData> Find(uint64_t epoch) const;

  // std::nullopt if no epoch has been added
  std::optional<uint64_t> LastKnownEpoch() const;

  bool Empty() const { return epochs_.empty() && runs_.empty(); }

private:
  struct UniformRun {
    uint64_t first;
    uint64_t last;
    std::chrono::milliseconds slot_duration;
    uint32_t slots_per_epoch;
    std::chrono::microseconds first_start_diff;
  };

  std::map<uint64_t, EpochSlottingData> epochs_;
  std::vector<UniformRun> runs_;
};

// Start time of `slot`, or std::nullopt when its epoch is not covered by `sd`
std::optional<Timestamp> GetSlotStart(Timestamp system_start,
                                      const chain::SlotId &slot,
                                      const SlottingData &sd);

// Slotting capability: system start, per-epoch data and current slot length
class Slotting {
public:
  virtual ~Slotting() = default;
  virtual Timestamp GetSystemStart() const = 0;
  virtual SlottingData GetSlottingData() const = 0;
  virtual std::chrono::milliseconds GetCurrentEpochSlotDuration() const = 0;
};

/**
 * FixedSlotting - uniform slot duration and epoch length
 *
 * Covers epochs 0..N where N is the current epoch derived from
 * util::GetTimeMicros() (mockable), plus `lookahead_epochs` more so blocks
 * slightly ahead of the local clock still resolve to a timestamp. The whole
 * range is one uniform run of SlottingData.
 */
class FixedSlotting : public Slotting {
public:
  FixedSlotting(Timestamp system_start, std::chrono::milliseconds slot_duration,
                uint32_t slots_per_epoch, uint64_t lookahead_epochs = 1);

  Timestamp GetSystemStart() const override { return system_start_; }
  SlottingData GetSlottingData() const override;
  std::chrono::milliseconds GetCurrentEpochSlotDuration() const override {
    return slot_duration_;
  }

  uint64_t CurrentEpoch() const;
  uint32_t SlotsPerEpoch() const { return slots_per_epoch_; }

private:
  Timestamp system_start_;
  std::chrono::milliseconds slot_duration_;
  uint32_t slots_per_epoch_;
  uint64_t lookahead_epochs_;
};

// Header -> timestamp: genesis headers never have one; main headers resolve
// through GetSlotStart
using HeaderTimestampFn =
    std::function<std::optional<Timestamp>(const chain::BlockHeader &)>;

HeaderTimestampFn MakeHeaderTimestampFn(Timestamp system_start, SlottingData sd);

} // namespace slotting
} // namespace walletsync
