#include "mp3split/config.hpp"
#include "mp3split/errors.hpp"

namespace mp3split {

void validate(const SplitConfig &config) {
    if (config.clip_duration <= 0) {
        throw InvalidConfigurationError(
            "Clip duration must be a positive number of seconds, got " +
            std::to_string(config.clip_duration));
    }
    if (config.sample_rate <= 0) {
        throw InvalidConfigurationError("Sample rate must be positive, got " +
                                        std::to_string(config.sample_rate));
    }
    if (config.output_dir.empty()) {
        throw InvalidConfigurationError("Output directory must not be empty");
    }
}

} // namespace mp3split
