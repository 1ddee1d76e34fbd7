/**
 * @file compression_reporter.cpp
 * @brief Compression ratio implementation
 */

#include "clip_mix/compression_reporter.hpp"

#include <filesystem>
#include <system_error>

#include "clip_mix/logging.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

CompressionStats
CompressionReporter::report(const std::vector<std::string> &sources,
                            const std::string &output) {
  CompressionStats stats;
  std::error_code ec;

  for (const auto &src : sources) {
    auto size = fs::file_size(src, ec);
    if (ec) {
      LOG_WARN("Size unknown for {}: {}", src, ec.message());
      return CompressionStats{};
    }
    stats.input_bytes += size;
  }

  stats.output_bytes = fs::file_size(output, ec);
  if (ec || stats.input_bytes == 0) {
    return CompressionStats{};
  }

  stats.ratio = static_cast<double>(stats.output_bytes) /
                static_cast<double>(stats.input_bytes);
  stats.known = true;
  return stats;
}

CompressionStats CompressionReporter::report(const JobResult &result) {
  return report(result.sources, result.output_path);
}

} // namespace clip_mix
