/**
 * @file errors.hpp
 * @brief Exception taxonomy for run-fatal and job-fatal failures
 *
 * @details Run-fatal: EmptyCatalog, ExternalToolMissing, InvalidSettings.
 *          These abort a run before any job is dispatched.
 *
 *          Job-fatal: SegmentBuildFailed, ProfileMismatch, MuxFailed.
 *          These are caught at the job boundary and recorded in the
 *          job's JobResult.
 *
 *          HardwareEncoderUnavailable triggers a per-job software fallback
 *          and only becomes a failure if the software path fails too.
 */

#ifndef CLIP_MIX_ERRORS_HPP
#define CLIP_MIX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace clip_mix {

/// Base of every clip_mix exception
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

class InvalidSettings : public Error {
public:
  explicit InvalidSettings(const std::string &reason)
      : Error("invalid settings: " + reason) {}
};

class EmptyCatalog : public Error {
public:
  explicit EmptyCatalog(const std::string &location)
      : Error("no usable input files in " + location), location_(location) {}

  const std::string &location() const { return location_; }

private:
  std::string location_;
};

class ExternalToolMissing : public Error {
public:
  explicit ExternalToolMissing(const std::string &tool)
      : Error("external tool not found: " + tool), tool_(tool) {}

  const std::string &tool() const { return tool_; }

private:
  std::string tool_;
};

class SegmentBuildFailed : public Error {
public:
  SegmentBuildFailed(const std::string &asset, const std::string &cause)
      : Error("segment build failed for " + asset + ": " + cause),
        asset_(asset), cause_(cause) {}

  const std::string &asset() const { return asset_; }
  const std::string &cause() const { return cause_; }

private:
  std::string asset_;
  std::string cause_;
};

class HardwareEncoderUnavailable : public Error {
public:
  explicit HardwareEncoderUnavailable(const std::string &cause)
      : Error("hardware encoder unavailable: " + cause), cause_(cause) {}

  const std::string &cause() const { return cause_; }

private:
  std::string cause_;
};

class ProfileMismatch : public Error {
public:
  explicit ProfileMismatch(const std::string &detail)
      : Error("normalization profile mismatch: " + detail) {}
};

class MuxFailed : public Error {
public:
  explicit MuxFailed(const std::string &cause)
      : Error("audio mux failed: " + cause), cause_(cause) {}

  const std::string &cause() const { return cause_; }

private:
  std::string cause_;
};

} // namespace clip_mix

#endif // CLIP_MIX_ERRORS_HPP
