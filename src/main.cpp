#include "mp3split/mp3split.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cout
        << "Usage: " << prog << " <input_file.mp3> [options]\n"
        << "\nConvert an MP3 file to WAV and split it into clips.\n"
        << "\nOptions:\n"
        << "  --output-dir DIR     Output directory for WAV clips"
           " (default: output_clips)\n"
        << "  --clip-duration N    Duration of each clip in seconds"
           " (default: 10)\n"
        << "  --sample-rate N      Target sample rate for output files"
           " (default: 16000)\n"
        << "  -h, --help           Show this message\n"
        << "\nExamples:\n"
        << "  " << prog << " audio.mp3\n"
        << "  " << prog << " audio.mp3 --output-dir my_clips\n"
        << "  " << prog << " audio.mp3 --clip-duration 5 --sample-rate 22050\n"
        << std::endl;
}

// Strict integer parse; rejects trailing garbage like "10s".
static bool parse_int(const std::string &text, int &out) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != text.size())
            return false;
        out = value;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

int main(int argc, char *argv[]) {
    using namespace mp3split;

    std::string input_file;
    SplitConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--output-dir" && i + 1 < argc) {
            config.output_dir = argv[++i];
        } else if ((arg == "--clip-duration" || arg == "--sample-rate") &&
                   i + 1 < argc) {
            int &target = arg == "--clip-duration" ? config.clip_duration
                                                   : config.sample_rate;
            if (!parse_int(argv[++i], target)) {
                std::cout << "Invalid integer for " << arg << ": " << argv[i]
                          << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else if (!arg.empty() && arg[0] != '-' && input_file.empty()) {
            input_file = arg;
        } else {
            std::cout << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    SplitHooks hooks;
    hooks.on_decoded = [&](const AudioData &audio, const ClipPlan &plan) {
        std::cout << "Original sample rate: " << audio.original_sample_rate
                  << ", Target sample rate: " << audio.sample_rate
                  << std::endl;
        std::cout << "Audio duration: " << std::fixed << std::setprecision(2)
                  << static_cast<double>(audio.num_samples) /
                         audio.sample_rate
                  << " seconds" << std::endl;
        std::cout << "Audio shape: (" << audio.num_samples << ",)"
                  << std::endl;
        std::cout << "Splitting into " << plan.clip_count << " clips of "
                  << plan.clip_duration << " seconds each" << std::endl;
    };
    hooks.on_clip = [](const ClipWritten &clip) {
        std::cout << "  [" << clip.index + 1 << "/" << clip.clip_count
                  << "] Created: "
                  << std::filesystem::path(clip.path).filename().string()
                  << " (duration: " << std::fixed << std::setprecision(2)
                  << clip.duration << "s)" << std::endl;
    };

    try {
        std::cout << "Loading audio file: " << input_file << std::endl;
        auto created = split_mp3_to_wav_clips(input_file, config, hooks);

        std::cout << "\nSuccess! Created " << created.size()
                  << " WAV clips in '" << config.output_dir << "'"
                  << std::endl;
        std::cout << "Output directory: "
                  << std::filesystem::absolute(config.output_dir).string()
                  << std::endl;
    } catch (const std::exception &e) {
        std::cout << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
