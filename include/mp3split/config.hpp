#pragma once

#include <string>

namespace mp3split {

// ─── Split Config ───────────────────────────────────────────────────────────

struct SplitConfig {
    std::string output_dir = "output_clips";
    int clip_duration = 10;  // seconds per clip
    int sample_rate = 16000; // target rate of decoded audio and output WAVs
};

// Throws InvalidConfigurationError on a non-positive duration or rate.
void validate(const SplitConfig &config);

} // namespace mp3split
