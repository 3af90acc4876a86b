#include "dr_wav.h"

#include "mp3split/errors.hpp"
#include "mp3split/wav.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace mp3split {

// ─── Writer ──────────────────────────────────────────────────────────────────

void write_wav(const std::string &path, const float *samples,
               size_t num_samples, int sample_rate) {
    if (sample_rate <= 0) {
        throw EncodeError(path, "invalid sample rate " +
                                    std::to_string(sample_rate));
    }

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_IEEE_FLOAT;
    format.channels = 1;
    format.sampleRate = static_cast<drwav_uint32>(sample_rate);
    format.bitsPerSample = 32;

    // Encoded in memory, then written through a checked stream; the size
    // fields are patched before any byte reaches the file.
    void *encoded = nullptr;
    size_t encoded_size = 0;
    drwav wav;
    if (!drwav_init_memory_write(&wav, &encoded, &encoded_size, &format,
                                 nullptr)) {
        throw EncodeError(path, "dr_wav could not start the encoder");
    }

    drwav_uint64 written = 0;
    if (num_samples > 0) {
        written = drwav_write_pcm_frames(&wav, num_samples, samples);
    }
    drwav_result closed = drwav_uninit(&wav);

    std::vector<char> bytes;
    if (encoded) {
        const char *begin = static_cast<const char *>(encoded);
        bytes.assign(begin, begin + encoded_size);
        drwav_free(encoded, nullptr);
    }

    if (written != num_samples) {
        throw EncodeError(path, "short write: " + std::to_string(written) +
                                    " of " + std::to_string(num_samples) +
                                    " frames");
    }
    if (closed != DRWAV_SUCCESS || bytes.empty()) {
        throw EncodeError(path, "dr_wav failed to finalize the header (" +
                                    std::to_string(closed) + ")");
    }

    // Truncates an existing file
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw EncodeError(path, errno != 0 ? std::strerror(errno)
                                           : "cannot open for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw EncodeError(path, errno != 0 ? std::strerror(errno)
                                           : "write failed");
    }
    out.close();
    if (out.fail()) {
        throw EncodeError(path, errno != 0 ? std::strerror(errno)
                                           : "close failed");
    }
}

void write_wav(const std::string &path, const axiom::Tensor &samples,
               int sample_rate) {
    auto cont = samples.ascontiguousarray();
    write_wav(path, cont.typed_data<float>(), cont.shape()[0], sample_rate);
}

// ─── Reader ──────────────────────────────────────────────────────────────────

WavData read_wav(const std::string &path) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        throw std::runtime_error("Cannot open WAV file: " + path);
    }

    size_t total_frames = static_cast<size_t>(wav.totalPCMFrameCount);
    int channels = wav.channels;
    int sample_rate = static_cast<int>(wav.sampleRate);
    int bits = wav.bitsPerSample;

    std::vector<float> interleaved(total_frames * channels);
    size_t frames_read = 0;
    if (total_frames > 0) {
        frames_read = static_cast<size_t>(
            drwav_read_pcm_frames_f32(&wav, total_frames, interleaved.data()));
    }
    drwav_uninit(&wav);

    if (frames_read != total_frames) {
        throw std::runtime_error("Truncated WAV data: " + path);
    }

    // Multi-channel -> mono (average channels)
    std::vector<float> mono(frames_read);
    for (size_t i = 0; i < frames_read; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = sum / static_cast<float>(channels);
    }

    axiom::Tensor tensor;
    if (!mono.empty()) {
        tensor = axiom::Tensor::from_data(mono.data(), axiom::Shape{mono.size()},
                                          true);
    }

    return WavData{
        std::move(tensor),
        sample_rate,
        channels,
        static_cast<int>(frames_read),
        bits,
    };
}

} // namespace mp3split
