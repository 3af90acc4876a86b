#include "mp3split/partition.hpp"
#include "mp3split/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace mp3split {

ClipPartitioner::ClipPartitioner(const AudioData &audio,
                                 int clip_duration_seconds)
    : num_samples_(static_cast<size_t>(std::max(audio.num_samples, 0))),
      sample_rate_(audio.sample_rate) {
    if (num_samples_ > 0) {
        storage_ = audio.samples.ascontiguousarray();
        data_ = storage_.typed_data<float>();
    }
    init(clip_duration_seconds);
}

ClipPartitioner::ClipPartitioner(const float *samples, size_t num_samples,
                                 int sample_rate, int clip_duration_seconds)
    : data_(samples), num_samples_(num_samples), sample_rate_(sample_rate) {
    init(clip_duration_seconds);
}

void ClipPartitioner::init(int clip_duration_seconds) {
    if (clip_duration_seconds <= 0) {
        throw InvalidConfigurationError(
            "Clip duration must be positive, got " +
            std::to_string(clip_duration_seconds));
    }
    if (sample_rate_ <= 0) {
        throw InvalidConfigurationError("Sample rate must be positive, got " +
                                        std::to_string(sample_rate_));
    }

    samples_per_clip_ = static_cast<size_t>(clip_duration_seconds) *
                        static_cast<size_t>(sample_rate_);
    // ceil(L / n); zero-length input yields no clips
    clip_count_ = (num_samples_ + samples_per_clip_ - 1) / samples_per_clip_;
}

ClipSpec ClipPartitioner::spec(size_t index) const {
    if (index >= clip_count_) {
        throw std::out_of_range("Clip index " + std::to_string(index) +
                                " out of range (" +
                                std::to_string(clip_count_) + " clips)");
    }
    size_t start = index * samples_per_clip_;
    size_t end = std::min(start + samples_per_clip_, num_samples_);
    return ClipSpec{index, start, samples_per_clip_, end - start};
}

Clip ClipPartitioner::clip(size_t index) const {
    ClipSpec s = spec(index);

    // Zero-initialized, so the tail past raw_samples is the padding
    std::vector<float> buf(s.sample_count, 0.0f);
    std::copy(data_ + s.start_sample, data_ + s.start_sample + s.raw_samples,
              buf.begin());

    auto tensor =
        axiom::Tensor::from_data(buf.data(), axiom::Shape{buf.size()}, true);
    return Clip{index, std::move(tensor), s.raw_samples};
}

const Clip &ClipPartitioner::iterator::operator*() const {
    if (!loaded_) {
        current_ = owner_->clip(index_);
        loaded_ = true;
    }
    return current_;
}

} // namespace mp3split
