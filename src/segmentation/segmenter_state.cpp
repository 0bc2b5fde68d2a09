#include "segmentation/segmenter_state.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace vadseg {
namespace transitions {

namespace {

// Offsets never go below zero or behind an offset already reported.
SpeechEvent emit(SegmenterState& state, SpeechEvent::Type type, std::int64_t offset) {
    offset = std::max(offset, state.lastEmittedOffset);
    state.lastEmittedOffset = offset;
    return SpeechEvent{type, offset};
}

SegmenterState toIdle(const SegmenterState& state) {
    SegmenterState next = state;
    next.phase = SegmenterState::Phase::Idle;
    next.speechStartSample = 0;
    next.pendingSilenceSample.reset();
    return next;
}

} // namespace

void checkFrameInput(float probability, std::int64_t frameLengthSamples) {
    if (!(probability >= 0.0f && probability <= 1.0f)) {
        throw std::invalid_argument("probability must be in [0, 1], got " +
                                    std::to_string(probability));
    }
    if (frameLengthSamples <= 0) {
        throw std::invalid_argument("frame length must be > 0 samples, got " +
                                    std::to_string(frameLengthSamples));
    }
}

SegmenterState advance(const SegmenterState& state, std::int64_t frameLengthSamples) {
    SegmenterState next = state;
    next.currentSample += frameLengthSamples;
    return next;
}

SegmenterState cancelPendingEnd(const SegmenterParams& params,
                                const SegmenterState& state,
                                float probability) {
    if (probability < params.speechThreshold || !state.pendingSilenceSample) {
        return state;
    }
    SegmenterState next = state;
    next.pendingSilenceSample.reset();
    return next;
}

std::optional<Transition> tryStart(const SegmenterParams& params,
                                   const SegmenterState& state,
                                   float probability,
                                   std::int64_t frameLengthSamples) {
    if (probability < params.speechThreshold || state.triggered()) {
        return std::nullopt;
    }
    Transition t{state, std::nullopt};
    t.state.phase = SegmenterState::Phase::Speaking;
    t.state.speechStartSample = state.currentSample;
    t.state.pendingSilenceSample.reset();
    // currentSample already points past the triggering frame; report its beginning.
    const std::int64_t offset =
        state.currentSample - params.speechPadSamples - frameLengthSamples;
    t.event = emit(t.state, SpeechEvent::Type::Start, offset);
    return t;
}

std::optional<Transition> evaluateEnd(const SegmenterParams& params,
                                      const SegmenterState& state,
                                      float probability,
                                      std::int64_t frameLengthSamples) {
    if (probability >= params.silenceThreshold || !state.triggered()) {
        return std::nullopt;
    }
    Transition t{state, std::nullopt};
    if (!t.state.pendingSilenceSample) {
        t.state.pendingSilenceSample = state.currentSample;
    }
    const std::int64_t provisionalEnd = *t.state.pendingSilenceSample;

    if (t.state.currentSample - provisionalEnd < params.minSilenceDurationSamples) {
        return t;
    }

    if (provisionalEnd - t.state.speechStartSample < params.minSpeechDurationSamples) {
        // Too short to be an utterance: drop it without an end event.
        t.state = toIdle(t.state);
        return t;
    }

    t.state = toIdle(t.state);
    const std::int64_t offset = provisionalEnd + params.speechPadSamples - frameLengthSamples;
    t.event = emit(t.state, SpeechEvent::Type::End, offset);
    return t;
}

Transition step(const SegmenterParams& params,
                const SegmenterState& state,
                float probability,
                std::int64_t frameLengthSamples) {
    checkFrameInput(probability, frameLengthSamples);

    SegmenterState next = advance(state, frameLengthSamples);
    next = cancelPendingEnd(params, next, probability);

    if (auto started = tryStart(params, next, probability, frameLengthSamples)) {
        return *started;
    }
    if (auto ended = evaluateEnd(params, next, probability, frameLengthSamples)) {
        return *ended;
    }
    return Transition{next, std::nullopt};
}

} // namespace transitions
} // namespace vadseg
