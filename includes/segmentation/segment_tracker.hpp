#pragma once
#include "segmentation/speech_event.hpp"
#include <cstdint>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace vadseg {

struct Segment {
    std::int64_t startSample{0};
    std::int64_t endSample{0};
    int frameCount{0};

    std::int64_t lengthSamples() const { return endSample - startSample; }
};

// Event sink that pairs start/end events into segments and keeps per-segment
// frame counts. Call onFrame() once after every SegmentationEngine::process().
class SegmentTracker {
public:
    // Returns the completed segment when this frame closed one.
    std::optional<Segment> onFrame(const std::optional<SpeechEvent>& event,
                                   bool engineTriggered);

    bool speaking() const { return open_.has_value(); }
    const std::vector<Segment>& segments() const { return segments_; }
    int discardedCount() const { return discarded_; }
    int framesSeen() const { return framesSeen_; }

    void reset();

    nlohmann::json summaryJson(int sampleRate) const;

private:
    struct OpenSegment {
        std::int64_t startSample;
        int frameCount;
    };

    std::optional<OpenSegment> open_;
    std::vector<Segment> segments_;
    int discarded_{0};
    int framesSeen_{0};
};

} // namespace vadseg
