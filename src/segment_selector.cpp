/**
 * @file segment_selector.cpp
 * @brief Seeded clip and BGM selection implementation
 */

#include "clip_mix/segment_selector.hpp"

#include <chrono>
#include <numeric>
#include <utility>

namespace clip_mix {

std::uint64_t derive_job_seed(std::uint64_t run_seed, int job_index) {
  std::uint64_t z = run_seed + 0x9E3779B97F4A7C15ULL *
                                   static_cast<std::uint64_t>(job_index + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

std::uint64_t generate_run_seed() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  std::random_device rd;
  return static_cast<std::uint64_t>(us) ^
         (static_cast<std::uint64_t>(rd()) << 32);
}

SegmentSelection SegmentSelector::select_with(Engine &rng) const {
  SegmentSelection selection;
  const size_t available = assets_.size();
  const size_t wanted = static_cast<size_t>(count_ > 0 ? count_ : 0);
  if (available == 0 || wanted == 0)
    return selection;

  selection.reserve(wanted);

  if (wanted <= available) {
    /// Partial Fisher-Yates over indices: distinct clips, shuffled order
    std::vector<size_t> order(available);
    std::iota(order.begin(), order.end(), 0);
    for (size_t i = 0; i < wanted; ++i) {
      std::uniform_int_distribution<size_t> pick(i, available - 1);
      std::swap(order[i], order[pick(rng)]);
      selection.push_back({assets_[order[i]], trim_});
    }
  } else {
    /// Not enough clips: sample with replacement
    std::uniform_int_distribution<size_t> pick(0, available - 1);
    for (size_t i = 0; i < wanted; ++i) {
      selection.push_back({assets_[pick(rng)], trim_});
    }
  }
  return selection;
}

JobDraw SegmentSelector::draw_with(Engine rng) const {
  JobDraw result;
  result.selection = select_with(rng);
  if (!bgm_tracks_.empty()) {
    std::uniform_int_distribution<size_t> pick(0, bgm_tracks_.size() - 1);
    result.bgm_path = bgm_tracks_[pick(rng)];
  }
  return result;
}

SegmentSelection SegmentSelector::select(int count, std::uint64_t seed) const {
  SegmentSelector copy(assets_, bgm_tracks_, trim_);
  copy.set_count(count);
  Engine rng(seed);
  return copy.select_with(rng);
}

} // namespace clip_mix
