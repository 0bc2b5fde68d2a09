#include "segmentation/segmentation_engine.hpp"

namespace vadseg {

SegmentationEngine::SegmentationEngine(const Config& config)
    : params_(config.resolve()) {
}

std::optional<SpeechEvent> SegmentationEngine::process(float probability,
                                                       std::int64_t frameLengthSamples) {
    Transition t = transitions::step(params_, state_, probability, frameLengthSamples);
    state_ = t.state;
    return t.event;
}

void SegmentationEngine::reset() {
    state_ = SegmenterState{};
}

} // namespace vadseg
