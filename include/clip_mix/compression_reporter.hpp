/**
 * @file compression_reporter.hpp
 * @brief Input vs. output size of a finished job
 */

#ifndef CLIP_MIX_COMPRESSION_REPORTER_HPP
#define CLIP_MIX_COMPRESSION_REPORTER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace clip_mix {

/**
 * @class CompressionReporter
 * @brief Compares whole source files against the final output.
 * @note Never throws: an unreadable size yields known == false.
 */
class CompressionReporter {
public:
  /**
   * @param sources Selected source files, duplicates counted every time
   * @param output Final output video
   */
  static CompressionStats report(const std::vector<std::string> &sources,
                                 const std::string &output);

  /// Report for a finished JobResult (its sources and output path)
  static CompressionStats report(const JobResult &result);
};

} // namespace clip_mix

#endif // CLIP_MIX_COMPRESSION_REPORTER_HPP
