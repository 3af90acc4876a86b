#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "mp3split/audio_io.hpp"
#include "mp3split/config.hpp"

namespace mp3split {

// ─── Progress Hooks ─────────────────────────────────────────────────────────

struct ClipPlan {
    size_t clip_count;
    size_t samples_per_clip;
    int clip_duration; // seconds
};

struct ClipWritten {
    size_t index;      // 0-based
    size_t clip_count;
    std::string path;
    float duration;    // seconds, padding included
};

// Invoked synchronously from the splitting loop. Either may be empty.
struct SplitHooks {
    std::function<void(const AudioData &, const ClipPlan &)> on_decoded;
    std::function<void(const ClipWritten &)> on_clip;
};

// ─── Splitting ──────────────────────────────────────────────────────────────

// "<stem>_clip_<index+1, zero-padded to 3 digits>.wav"
std::string clip_filename(const std::string &stem, size_t index);

/// Decode `input_file`, split it into `clip_duration`-second clips at
/// `sample_rate`, and write them as WAV files into `output_dir`.
///
/// Steps run strictly in order: validate the configuration and input path,
/// create `output_dir` (with parents), decode, then write clip 0, 1, ...
/// Returns the written paths in clip order. A failure while writing clip k
/// leaves clips 0..k-1 on disk.
std::vector<std::string>
split_mp3_to_wav_clips(const std::string &input_file,
                       const std::string &output_dir = "output_clips",
                       int clip_duration = 10, int sample_rate = 16000,
                       const SplitHooks &hooks = {});

std::vector<std::string> split_mp3_to_wav_clips(const std::string &input_file,
                                                const SplitConfig &config,
                                                const SplitHooks &hooks = {});

/// Split already-decoded audio. Output files are named after `stem` and
/// written at `audio.sample_rate`.
std::vector<std::string>
split_audio_to_wav_clips(const AudioData &audio, const std::string &stem,
                         const std::string &output_dir, int clip_duration,
                         const SplitHooks &hooks = {});

} // namespace mp3split
