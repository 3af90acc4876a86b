#pragma once

#include <cstddef>
#include <iterator>

#include <axiom/axiom.hpp>

#include "mp3split/audio_io.hpp"

namespace mp3split {

// ─── Clip Types ─────────────────────────────────────────────────────────────

struct ClipSpec {
    size_t index;        // 0-based
    size_t start_sample; // offset into the source buffer
    size_t sample_count; // fixed clip length, identical for every clip
    size_t raw_samples;  // source samples in this clip, rest is zero padding
};

struct Clip {
    size_t index;
    axiom::Tensor samples; // float32, (sample_count,)
    size_t raw_samples;
};

// ─── Clip Partitioner ───────────────────────────────────────────────────────
// Splits a mono buffer into clips of clip_duration_seconds * sample_rate
// samples. The last clip is zero-padded to full length. Clips are built on
// demand, one per iterator dereference; iterating again starts over.
//
//   ClipPartitioner parts(audio, 10);
//   for (const Clip &clip : parts) { ... }
//
// The source samples must outlive the partitioner when constructed from a
// raw pointer. The AudioData overload keeps its own reference.

class ClipPartitioner {
  public:
    ClipPartitioner(const AudioData &audio, int clip_duration_seconds);
    ClipPartitioner(const float *samples, size_t num_samples, int sample_rate,
                    int clip_duration_seconds);

    size_t num_samples() const { return num_samples_; }
    int sample_rate() const { return sample_rate_; }
    size_t samples_per_clip() const { return samples_per_clip_; }
    size_t clip_count() const { return clip_count_; }
    bool empty() const { return clip_count_ == 0; }

    // Bounds for clip `index`. Throws std::out_of_range past clip_count().
    ClipSpec spec(size_t index) const;

    // Materialize clip `index` (copy + zero padding).
    Clip clip(size_t index) const;

    class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Clip;
        using difference_type = std::ptrdiff_t;
        using pointer = const Clip *;
        using reference = const Clip &;

        iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }

        iterator &operator++() {
            ++index_;
            loaded_ = false;
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const iterator &other) const {
            return owner_ == other.owner_ && index_ == other.index_;
        }
        bool operator!=(const iterator &other) const {
            return !(*this == other);
        }

      private:
        friend class ClipPartitioner;
        iterator(const ClipPartitioner *owner, size_t index)
            : owner_(owner), index_(index) {}

        const ClipPartitioner *owner_ = nullptr;
        size_t index_ = 0;
        mutable Clip current_{};
        mutable bool loaded_ = false;
    };

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, clip_count_); }

  private:
    axiom::Tensor storage_; // keeps AudioData samples alive and contiguous
    const float *data_ = nullptr;
    size_t num_samples_ = 0;
    int sample_rate_ = 0;
    size_t samples_per_clip_ = 0;
    size_t clip_count_ = 0;

    void init(int clip_duration_seconds);
};

} // namespace mp3split
