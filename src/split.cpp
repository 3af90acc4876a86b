#include "mp3split/split.hpp"
#include "mp3split/errors.hpp"
#include "mp3split/partition.hpp"
#include "mp3split/wav.hpp"

#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace mp3split {

namespace {

void create_output_dir(const std::string &output_dir) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw EncodeError(output_dir,
                          "cannot create output directory: " + ec.message());
    }
}

// Existence and extension are checked up front so that a bad path fails
// before the output directory is created.
void validate_input(const std::string &input_file) {
    std::error_code ec;
    if (!fs::exists(input_file, ec)) {
        throw InvalidInputError("Input file not found: " + input_file);
    }
    if (detect_format_by_extension(input_file) != AudioFormat::MP3) {
        throw UnsupportedFormatError(
            "Input file must be MP3 format, got: '" +
            fs::path(input_file).extension().string() + "'");
    }
}

} // namespace

std::string clip_filename(const std::string &stem, size_t index) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "_clip_%03zu.wav", index + 1);
    return stem + suffix;
}

std::vector<std::string>
split_audio_to_wav_clips(const AudioData &audio, const std::string &stem,
                         const std::string &output_dir, int clip_duration,
                         const SplitHooks &hooks) {
    ClipPartitioner parts(audio, clip_duration);
    create_output_dir(output_dir);

    if (hooks.on_decoded) {
        hooks.on_decoded(audio, ClipPlan{parts.clip_count(),
                                         parts.samples_per_clip(),
                                         clip_duration});
    }

    std::vector<std::string> created;
    created.reserve(parts.clip_count());

    for (const Clip &clip : parts) {
        std::string path =
            (fs::path(output_dir) / clip_filename(stem, clip.index)).string();
        write_wav(path, clip.samples, audio.sample_rate);
        created.push_back(path);

        if (hooks.on_clip) {
            float duration = static_cast<float>(parts.samples_per_clip()) /
                             static_cast<float>(audio.sample_rate);
            hooks.on_clip(
                ClipWritten{clip.index, parts.clip_count(), path, duration});
        }
    }

    return created;
}

std::vector<std::string> split_mp3_to_wav_clips(const std::string &input_file,
                                                const SplitConfig &config,
                                                const SplitHooks &hooks) {
    validate(config);
    validate_input(input_file);
    create_output_dir(config.output_dir);

    auto audio = read_mp3(input_file, config.sample_rate);

    std::string stem = fs::path(input_file).stem().string();
    return split_audio_to_wav_clips(audio, stem, config.output_dir,
                                    config.clip_duration, hooks);
}

std::vector<std::string>
split_mp3_to_wav_clips(const std::string &input_file,
                       const std::string &output_dir, int clip_duration,
                       int sample_rate, const SplitHooks &hooks) {
    SplitConfig config;
    config.output_dir = output_dir;
    config.clip_duration = clip_duration;
    config.sample_rate = sample_rate;
    return split_mp3_to_wav_clips(input_file, config, hooks);
}

} // namespace mp3split
