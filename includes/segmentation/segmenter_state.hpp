#pragma once
#include "segmentation/segmenter_config.hpp"
#include "segmentation/speech_event.hpp"
#include <cstdint>
#include <optional>

namespace vadseg {

// Explicit state of the segmentation state machine.
//
// Idle:     no speech in progress. speechStartSample and pendingSilenceSample
//           carry no meaning.
// Speaking: speech started at speechStartSample (before padding). While
//           pendingSilenceSample is set, a silence run began at that sample and
//           a provisional end is waiting to mature.
struct SegmenterState {
    enum class Phase { Idle, Speaking };

    Phase phase{Phase::Idle};
    std::int64_t currentSample{0};
    std::int64_t speechStartSample{0};
    std::optional<std::int64_t> pendingSilenceSample;
    std::int64_t lastEmittedOffset{0};

    bool triggered() const { return phase == Phase::Speaking; }

    bool operator==(const SegmenterState& other) const {
        return phase == other.phase && currentSample == other.currentSample &&
               speechStartSample == other.speechStartSample &&
               pendingSilenceSample == other.pendingSilenceSample &&
               lastEmittedOffset == other.lastEmittedOffset;
    }
    bool operator!=(const SegmenterState& other) const { return !(*this == other); }
};

struct Transition {
    SegmenterState state;
    std::optional<SpeechEvent> event;
};

// Pure transition functions. Each one covers a single branch of the per-frame
// update so it can be exercised on its own; step() chains them in order.
namespace transitions {

// Throws std::invalid_argument unless probability is in [0, 1] and
// frameLengthSamples > 0.
void checkFrameInput(float probability, std::int64_t frameLengthSamples);

SegmenterState advance(const SegmenterState& state, std::int64_t frameLengthSamples);

// Speech at or above the speech threshold clears a pending end. Frames in the
// hysteresis band leave it running.
SegmenterState cancelPendingEnd(const SegmenterParams& params,
                                const SegmenterState& state,
                                float probability);

// Idle -> Speaking. Returns nothing when the frame does not start speech.
// The Start offset is current - pad - frame, floored at lastEmittedOffset
// (0 after construction or reset), so offsets never decrease.
std::optional<Transition> tryStart(const SegmenterParams& params,
                                   const SegmenterState& state,
                                   float probability,
                                   std::int64_t frameLengthSamples);

// Silence handling while Speaking. Returns nothing when the frame is not
// below the silence threshold or the engine is idle. The End offset is
// provisional end + pad - frame, floored at lastEmittedOffset like Start.
std::optional<Transition> evaluateEnd(const SegmenterParams& params,
                                      const SegmenterState& state,
                                      float probability,
                                      std::int64_t frameLengthSamples);

Transition step(const SegmenterParams& params,
                const SegmenterState& state,
                float probability,
                std::int64_t frameLengthSamples);

} // namespace transitions

} // namespace vadseg
