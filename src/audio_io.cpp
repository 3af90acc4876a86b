// Audio I/O: MP3 loading, mono downmix, resampling, raw PCM input
//
// Uses single-header C decoders from mackron/dr_libs:
//   - dr_mp3 for decoding
//   - dr_wav for the WAV writer/reader in wav.cpp

#define DR_WAV_IMPLEMENTATION
#define DR_MP3_IMPLEMENTATION

#include "dr_wav.h"
#include "dr_mp3.h"

#include "mp3split/audio_io.hpp"
#include "mp3split/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <limits>
#include <numeric>
#include <vector>

namespace mp3split {

// ─── Format Detection ────────────────────────────────────────────────────────

AudioFormat detect_format_by_extension(const std::string &path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext.empty())
        return AudioFormat::Unknown;

    ext.erase(0, 1); // leading '.'
    for (auto &c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    return ext == "mp3" ? AudioFormat::MP3 : AudioFormat::Unknown;
}

// ─── Sinc Resampler ──────────────────────────────────────────────────────────

namespace {

// Modified Bessel function I0 (for Kaiser window)
double bessel_i0(double x) {
    double sum = 1.0;
    double term = 1.0;
    for (int k = 1; k < 30; ++k) {
        term *= (x * x) / (4.0 * k * k);
        sum += term;
        if (term < 1e-12 * sum)
            break;
    }
    return sum;
}

double kaiser_window(double n, double N, double beta) {
    double arg = 2.0 * n / N - 1.0;
    double val = std::max(0.0, 1.0 - arg * arg);
    return bessel_i0(beta * std::sqrt(val)) / bessel_i0(beta);
}

// ceil(len * dst / src), reduced by gcd so the product stays in range
uint64_t resampled_length(size_t input_len, int src_rate, int dst_rate) {
    if (src_rate == dst_rate)
        return input_len;
    int g = std::gcd(src_rate, dst_rate);
    uint64_t up = static_cast<uint64_t>(dst_rate / g);
    uint64_t down = static_cast<uint64_t>(src_rate / g);
    return (static_cast<uint64_t>(input_len) * up + down - 1) / down;
}

// Windowed sinc interpolation
std::vector<float> sinc_resample(const float *input, size_t input_len,
                                 int src_rate, int dst_rate) {
    if (src_rate == dst_rate || input_len == 0) {
        return std::vector<float>(input, input + input_len);
    }

    size_t output_len = resampled_length(input_len, src_rate, dst_rate);
    std::vector<float> output(output_len);

    // 80dB stopband, 16-tap half-width
    constexpr int HALF_WIDTH = 16;
    constexpr double BETA = 7.857;

    double ratio = static_cast<double>(src_rate) / dst_rate;
    double cutoff = std::min(1.0, 1.0 / std::max(ratio, 1.0));
    double sample_ratio = static_cast<double>(dst_rate) / src_rate;

    // Widen the filter when downsampling
    double width_factor = std::max(1.0, ratio);

    for (size_t i = 0; i < output_len; ++i) {
        double src_pos = static_cast<double>(i) / sample_ratio;
        int64_t center = static_cast<int64_t>(std::floor(src_pos));

        double sum = 0.0;
        double weight_sum = 0.0;

        int64_t start = std::max<int64_t>(0, center - HALF_WIDTH + 1);
        int64_t end = std::min<int64_t>(static_cast<int64_t>(input_len) - 1,
                                        center + HALF_WIDTH);

        for (int64_t j = start; j <= end; ++j) {
            double dist = src_pos - static_cast<double>(j);
            double window_pos = dist / width_factor;
            if (std::abs(window_pos) > HALF_WIDTH)
                continue;

            double w = kaiser_window(window_pos + HALF_WIDTH,
                                     2.0 * HALF_WIDTH, BETA);

            double x = dist * cutoff * M_PI;
            double sinc_val = (std::abs(x) < 1e-10) ? 1.0 : std::sin(x) / x;

            double weight = sinc_val * w * cutoff;
            sum += input[j] * weight;
            weight_sum += weight;
        }

        output[i] =
            (weight_sum > 1e-10) ? static_cast<float>(sum / weight_sum) : 0.0f;
    }

    return output;
}

// Downmix interleaved multi-channel to mono by averaging
std::vector<float> downmix_to_mono(const float *interleaved, size_t total,
                                   int channels) {
    if (channels == 1) {
        return std::vector<float>(interleaved, interleaved + total);
    }
    size_t frames = total / channels;
    std::vector<float> mono(frames);
    float inv_ch = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = sum * inv_ch;
    }
    return mono;
}

void check_rate(int rate, const char *what) {
    if (rate <= 0) {
        throw InvalidConfigurationError(std::string(what) +
                                        " must be positive, got " +
                                        std::to_string(rate));
    }
}

// AudioData counts samples in int; longer streams are rejected before the
// resampler allocates anything.
AudioData make_audio_data(std::vector<float> &&mono, int src_rate,
                          int target_rate, int original_channels,
                          AudioFormat fmt, const std::string &source) {
    size_t num_mono = mono.size();
    uint64_t out_len = resampled_length(num_mono, src_rate, target_rate);
    if (out_len > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw DecodeError(source, std::to_string(out_len) +
                                      " samples at " +
                                      std::to_string(target_rate) +
                                      " Hz exceeds the supported length");
    }

    std::vector<float> final_samples;
    if (src_rate != target_rate) {
        final_samples =
            sinc_resample(mono.data(), mono.size(), src_rate, target_rate);
    } else {
        final_samples = std::move(mono);
    }

    int num_samples = static_cast<int>(final_samples.size());
    float duration =
        static_cast<float>(num_mono) / static_cast<float>(src_rate);

    axiom::Tensor tensor;
    if (num_samples > 0) {
        tensor = axiom::Tensor::from_data(
            final_samples.data(),
            axiom::Shape{static_cast<size_t>(num_samples)}, true);
    }

    return AudioData{
        std::move(tensor),
        target_rate,
        src_rate,
        original_channels,
        num_samples,
        duration,
        fmt,
    };
}

} // namespace

// ─── Public Resampler ────────────────────────────────────────────────────────

axiom::Tensor resample(const axiom::Tensor &samples, int src_rate,
                       int dst_rate) {
    check_rate(src_rate, "Source sample rate");
    check_rate(dst_rate, "Target sample rate");
    if (src_rate == dst_rate)
        return samples;

    auto cont = samples.ascontiguousarray();
    const float *data = cont.typed_data<float>();
    size_t len = cont.shape()[0];

    auto resampled = sinc_resample(data, len, src_rate, dst_rate);
    return axiom::Tensor::from_data(resampled.data(),
                                    axiom::Shape{resampled.size()}, true);
}

// ─── MP3 Loading ─────────────────────────────────────────────────────────────

AudioData read_mp3(const std::string &path, int target_sample_rate) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw InvalidInputError("Input file not found: " + path);
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw InvalidInputError("Input is not a regular file: " + path);
    }
    if (detect_format_by_extension(path) != AudioFormat::MP3) {
        throw UnsupportedFormatError(
            "Input file must be MP3 format, got: '" +
            std::filesystem::path(path).extension().string() + "'");
    }
    check_rate(target_sample_rate, "Target sample rate");

    drmp3_config config;
    drmp3_uint64 total_frames = 0;
    float *interleaved = drmp3_open_file_and_read_pcm_frames_f32(
        path.c_str(), &config, &total_frames, nullptr);

    if (!interleaved) {
        throw DecodeError(path, "dr_mp3 found no decodable MPEG audio frames");
    }

    int channels = static_cast<int>(config.channels);
    int sample_rate = static_cast<int>(config.sampleRate);
    if (channels <= 0 || sample_rate <= 0) {
        drmp3_free(interleaved, nullptr);
        throw DecodeError(path, "invalid stream header: channels=" +
                                    std::to_string(channels) + " rate=" +
                                    std::to_string(sample_rate));
    }

    auto mono = downmix_to_mono(interleaved, total_frames * channels, channels);
    drmp3_free(interleaved, nullptr);

    return make_audio_data(std::move(mono), sample_rate, target_sample_rate,
                           channels, AudioFormat::MP3, path);
}

// ─── Memory Buffer: Raw float32 PCM ──────────────────────────────────────────

AudioData read_audio(const float *pcm, size_t num_samples, int sample_rate,
                     int target_sample_rate) {
    check_rate(sample_rate, "Source sample rate");
    check_rate(target_sample_rate, "Target sample rate");
    std::vector<float> mono(pcm, pcm + num_samples);
    return make_audio_data(std::move(mono), sample_rate, target_sample_rate, 1,
                           AudioFormat::Unknown, "<pcm buffer>");
}

// ─── Memory Buffer: Raw int16 PCM ────────────────────────────────────────────

AudioData read_audio(const int16_t *pcm, size_t num_samples, int sample_rate,
                     int target_sample_rate) {
    check_rate(sample_rate, "Source sample rate");
    check_rate(target_sample_rate, "Target sample rate");
    std::vector<float> mono(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        mono[i] = static_cast<float>(pcm[i]) / 32768.0f;
    }
    return make_audio_data(std::move(mono), sample_rate, target_sample_rate, 1,
                           AudioFormat::Unknown, "<pcm buffer>");
}

} // namespace mp3split
