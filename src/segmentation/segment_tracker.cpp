#include "segmentation/segment_tracker.hpp"

namespace vadseg {

std::optional<Segment> SegmentTracker::onFrame(const std::optional<SpeechEvent>& event,
                                               bool engineTriggered) {
    ++framesSeen_;

    if (event && event->type == SpeechEvent::Type::Start) {
        // A start while one is open means the engine was reset underneath us.
        if (open_) ++discarded_;
        open_ = OpenSegment{event->offsetSamples, 1};
        return std::nullopt;
    }

    if (event && event->type == SpeechEvent::Type::End) {
        if (!open_) return std::nullopt;
        Segment seg;
        seg.startSample = open_->startSample;
        seg.endSample = event->offsetSamples;
        seg.frameCount = open_->frameCount + 1;
        open_.reset();
        segments_.push_back(seg);
        return seg;
    }

    if (open_) {
        if (!engineTriggered) {
            // Engine went idle without an end: the start was a short blip.
            open_.reset();
            ++discarded_;
        } else {
            ++open_->frameCount;
        }
    }
    return std::nullopt;
}

void SegmentTracker::reset() {
    open_.reset();
    segments_.clear();
    discarded_ = 0;
    framesSeen_ = 0;
}

nlohmann::json SegmentTracker::summaryJson(int sampleRate) const {
    nlohmann::json out;
    nlohmann::json list = nlohmann::json::array();
    std::int64_t totalSamples = 0;
    for (const auto& seg : segments_) {
        list.push_back({
            {"start_sample", seg.startSample},
            {"end_sample", seg.endSample},
            {"start_seconds", static_cast<double>(seg.startSample) / sampleRate},
            {"end_seconds", static_cast<double>(seg.endSample) / sampleRate},
            {"frames", seg.frameCount}
        });
        totalSamples += seg.lengthSamples();
    }
    out["segments"] = list;
    out["segment_count"] = segments_.size();
    out["discarded_count"] = discarded_;
    out["frames_seen"] = framesSeen_;
    out["speech_seconds"] = static_cast<double>(totalSamples) / sampleRate;
    out["open"] = speaking();
    return out;
}

} // namespace vadseg
