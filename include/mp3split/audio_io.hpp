#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <axiom/axiom.hpp>

namespace mp3split {

enum class AudioFormat { Unknown, MP3 };

struct AudioData {
    axiom::Tensor samples;    // float32, (num_samples,), mono, [-1,1]
    int sample_rate;          // target rate after read_mp3 / read_audio
    int original_sample_rate; // source rate before resampling
    int num_channels;         // original channel count before downmix
    int num_samples;          // = samples.shape()[0], 0 for an empty stream
    float duration;           // seconds, measured at the source rate
    AudioFormat format;
};

// Decode an MP3 file to mono float32 and resample to target_sample_rate.
// Throws InvalidInputError (missing file), UnsupportedFormatError (not .mp3),
// InvalidConfigurationError (target_sample_rate <= 0) before touching the
// decoder, and DecodeError if dr_mp3 rejects the stream.
AudioData read_mp3(const std::string &path, int target_sample_rate = 16000);

// Memory buffer: raw float32 mono PCM. Throws DecodeError if the resampled
// length would not fit AudioData::num_samples.
AudioData read_audio(const float *pcm, size_t num_samples, int sample_rate,
                     int target_sample_rate = 16000);

// Memory buffer: raw int16 mono PCM
AudioData read_audio(const int16_t *pcm, size_t num_samples, int sample_rate,
                     int target_sample_rate = 16000);

// Public resampler
axiom::Tensor resample(const axiom::Tensor &samples, int src_rate,
                       int dst_rate);

// Case-insensitive extension check, no content sniffing.
AudioFormat detect_format_by_extension(const std::string &path);

} // namespace mp3split
