#pragma once
#include "segmentation/segmenter_config.hpp"
#include "segmentation/segmenter_state.hpp"
#include "segmentation/speech_event.hpp"
#include <cstdint>
#include <optional>

namespace vadseg {

// Hysteresis-based speech segmentation over a stream of per-frame speech
// probabilities. Emits at most one start or end event per frame, with offsets
// in samples since construction or the last reset().
//
// Not thread-safe: one engine per audio stream.
class SegmentationEngine {
public:
    using Config = SegmenterConfig;

    // Throws std::invalid_argument for an invalid configuration.
    explicit SegmentationEngine(const Config& config);

    // Throws std::invalid_argument if probability is outside [0, 1] or the
    // frame length is not positive. State is untouched in that case.
    std::optional<SpeechEvent> process(float probability, std::int64_t frameLengthSamples);

    void reset();

    bool isTriggered() const { return state_.triggered(); }
    std::int64_t currentSample() const { return state_.currentSample; }
    const SegmenterState& state() const { return state_; }
    const SegmenterParams& params() const { return params_; }
    int sampleRate() const { return params_.sampleRate; }

private:
    SegmenterParams params_;
    SegmenterState state_;
};

} // namespace vadseg
