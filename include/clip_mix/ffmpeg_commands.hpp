/**
 * @file ffmpeg_commands.hpp
 * @brief Argument lists for every ffmpeg invocation of a run
 *
 * @details One builder per external step:
 *
 *          - encoder probe and version check
 *
 *          - clip transcode (trim, normalize, strip audio)
 *
 *          - stream-copy concatenation through a concat list
 *
 *          - background music replacement
 *
 * @note Every builder puts the output path last. Nothing here runs a
 *       process; the lists are handed to a CommandRunner.
 */

#ifndef CLIP_MIX_FFMPEG_COMMANDS_HPP
#define CLIP_MIX_FFMPEG_COMMANDS_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace clip_mix {
namespace ffmpeg {

using Args = std::vector<std::string>;

/// "-version", used to check the executable can be launched at all
Args version(const std::string &bin);

/// "-encoders" listing, scanned for hevc_nvenc
Args list_encoders(const std::string &bin);

/**
 * @brief Scale/pad/crop filter chain for a normalization profile.
 *
 * @details pad:  scale to fit (decrease), centre on black
 *
 *          crop: scale to fill (increase), centre-crop
 *
 *          Both end in fps, pixel format and a timestamp reset.
 */
std::string video_filter(const NormalizationProfile &profile);

/// Encoder selection and rate-control arguments of a profile
Args encoder_args(const EncodingProfile &encoding);

/**
 * @brief Transcode one source clip into a silent MPEG-TS segment.
 *
 * @param bin ffmpeg executable
 * @param source Source video
 * @param start Seconds skipped at the head
 * @param length Seconds kept (<= 0 keeps everything after start)
 * @param profile Target geometry and frame rate
 * @param encoding Encoder and quality knobs
 * @param output Destination path
 */
Args transcode(const std::string &bin, const std::string &source, double start,
               double length, const NormalizationProfile &profile,
               const EncodingProfile &encoding, const std::string &output);

/// Stream-copy concat of the list file into a silent MP4
Args concat(const std::string &bin, const std::string &list_path,
            const std::string &output);

/**
 * @brief Replace the audio of a silent video with a looping BGM track.
 * @param target_duration Output length in seconds (<= 0 ends with the video)
 */
Args mux_audio(const std::string &bin, const std::string &video,
               const std::string &bgm, double target_duration,
               const std::string &audio_bitrate, const std::string &output);

} // namespace ffmpeg
} // namespace clip_mix

#endif // CLIP_MIX_FFMPEG_COMMANDS_HPP
