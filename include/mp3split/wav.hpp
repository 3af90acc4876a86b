#pragma once

#include <cstddef>
#include <string>

#include <axiom/axiom.hpp>

namespace mp3split {

struct WavData {
    axiom::Tensor samples; // float32, shape (num_samples,)
    int sample_rate;
    int num_channels; // original channel count before downmix
    int num_samples;  // number of frames (after downmix = mono samples)
    int bits_per_sample;
};

// Write mono float32 samples as a 32-bit IEEE float WAV file. An existing
// file at path is overwritten. Throws EncodeError if the file cannot be
// created or not every frame reaches disk.
void write_wav(const std::string &path, const float *samples,
               size_t num_samples, int sample_rate);

void write_wav(const std::string &path, const axiom::Tensor &samples,
               int sample_rate);

// Read a WAV file and return float32 samples in [-1, 1].
// Multi-channel audio is downmixed to mono.
WavData read_wav(const std::string &path);

} // namespace mp3split
