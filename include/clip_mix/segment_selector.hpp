/**
 * @file segment_selector.hpp
 * @brief Seeded random choice of clips and BGM for one output job
 *
 * @details Every job draws from its own std::mt19937_64, seeded from the
 *          run seed and the job index. The engine is passed by value, so
 *          concurrent jobs never share or perturb a random sequence and a
 *          (run seed, job index) pair always reproduces the same draw.
 */

#ifndef CLIP_MIX_SEGMENT_SELECTOR_HPP
#define CLIP_MIX_SEGMENT_SELECTOR_HPP

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "types.hpp"

namespace clip_mix {

/**
 * @brief Derive a per-job seed from the run seed (splitmix64 mix).
 * @note Distinct job indices give unrelated streams.
 */
std::uint64_t derive_job_seed(std::uint64_t run_seed, int job_index);

/// Fresh run seed from the clock, for runs without RUN_SEED
std::uint64_t generate_run_seed();

/**
 * @struct JobDraw
 * @brief Result of one job's draw.
 */
struct JobDraw {
  SegmentSelection selection;
  std::string bgm_path;
};

/**
 * @class SegmentSelector
 * @brief Draws an ordered clip selection and a BGM track.
 *
 * @attention SAMPLING:
 *
 *   - count <= available: distinct clips in shuffled order
 *
 *   - count > available: sampling with replacement, duplicates allowed
 *
 *   - The BGM pick comes from the same per-job stream, after the clips
 */
class SegmentSelector {
public:
  using Engine = std::mt19937_64;

  SegmentSelector(const std::vector<SourceAsset> &assets,
                  const std::vector<std::string> &bgm_tracks, TrimSpec trim)
      : assets_(assets), bgm_tracks_(bgm_tracks), trim_(trim) {}

  /// Draw for a job seed
  JobDraw draw(std::uint64_t seed) const { return draw_with(Engine(seed)); }

  /// Draw from an explicit engine (taken by value)
  JobDraw draw_with(Engine rng) const;

  /// Clip selection only, same algorithm as draw()
  SegmentSelection select(int count, std::uint64_t seed) const;

  void set_count(int count) { count_ = count; }
  int count() const { return count_; }

private:
  SegmentSelection select_with(Engine &rng) const;

  const std::vector<SourceAsset> &assets_;
  const std::vector<std::string> &bgm_tracks_;
  TrimSpec trim_;
  int count_ = 1;
};

} // namespace clip_mix

#endif // CLIP_MIX_SEGMENT_SELECTOR_HPP
