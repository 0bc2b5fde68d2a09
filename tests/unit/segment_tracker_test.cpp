#include "io/event_json.hpp"
#include "segmentation/segment_tracker.hpp"
#include "segmentation/segmentation_engine.hpp"
#include "test_util.hpp"

#include <sstream>
#include <string>

using namespace vadseg;

namespace {

SpeechEvent start_at(std::int64_t offset) { return SpeechEvent{SpeechEvent::Type::Start, offset}; }
SpeechEvent end_at(std::int64_t offset) { return SpeechEvent{SpeechEvent::Type::End, offset}; }

int test_pairs_events() {
    SegmentTracker tracker;
    if (require(!tracker.onFrame(std::nullopt, false), "idle frame closes nothing")) return 1;
    if (require(!tracker.onFrame(start_at(100), true), "start closes nothing")) return 1;
    if (require(tracker.speaking(), "start opens a segment")) return 1;
    tracker.onFrame(std::nullopt, true);
    tracker.onFrame(std::nullopt, true);

    auto closed = tracker.onFrame(end_at(900), false);
    if (require(closed.has_value(), "end closes the segment")) return 1;
    if (require(closed->startSample == 100 && closed->endSample == 900, "segment bounds")) return 1;
    if (require(closed->frameCount == 4, "start, two frames and the end frame")) return 1;
    if (require(closed->lengthSamples() == 800, "segment length")) return 1;
    if (require(!tracker.speaking(), "end closes the open segment")) return 1;
    if (require(tracker.segments().size() == 1, "one completed segment")) return 1;
    if (require(tracker.framesSeen() == 5, "frames counted")) return 1;

    if (require(!tracker.onFrame(end_at(1000), false), "stray end is ignored")) return 1;
    return 0;
}

int test_discarded_start() {
    SegmentTracker tracker;
    tracker.onFrame(start_at(0), true);
    tracker.onFrame(std::nullopt, true);
    tracker.onFrame(std::nullopt, false);  // engine dropped the blip
    if (require(!tracker.speaking(), "dropped start is closed")) return 1;
    if (require(tracker.discardedCount() == 1, "dropped start counted")) return 1;
    if (require(tracker.segments().empty(), "dropped start is not a segment")) return 1;

    tracker.reset();
    if (require(tracker.discardedCount() == 0 && tracker.framesSeen() == 0, "reset clears counters")) return 1;
    return 0;
}

int test_summary_json() {
    SegmentTracker tracker;
    tracker.onFrame(start_at(800), true);
    tracker.onFrame(end_at(1600), false);
    tracker.onFrame(start_at(4000), true);
    tracker.onFrame(std::nullopt, false);

    auto summary = tracker.summaryJson(8000);
    if (require(summary["segment_count"] == 1, "segment count")) return 1;
    if (require(summary["discarded_count"] == 1, "discarded count")) return 1;
    if (require(summary["frames_seen"] == 4, "frames seen")) return 1;
    if (require(summary["open"] == false, "nothing open")) return 1;
    if (require(summary["segments"][0]["start_sample"] == 800, "start sample")) return 1;
    if (require(nearly_equal(summary["segments"][0]["end_seconds"].get<double>(), 0.2), "end seconds")) return 1;
    if (require(nearly_equal(summary["speech_seconds"].get<double>(), 0.1), "speech seconds")) return 1;
    return 0;
}

int test_event_json() {
    auto j = toJson(start_at(512), 8000);
    if (require(j["event"] == "start", "event name")) return 1;
    if (require(j["offset_samples"] == 512, "offset samples")) return 1;
    if (require(nearly_equal(j["offset_seconds"].get<double>(), 0.064), "offset seconds")) return 1;
    if (require(std::string(toString(SpeechEvent::Type::End)) == "end", "end name")) return 1;

    std::ostringstream out;
    EventLineWriter writer(out, 8000);
    writer.write(start_at(512));
    writer.write(end_at(2560));
    if (require(writer.written() == 2, "two lines written")) return 1;

    std::istringstream lines(out.str());
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);
    auto a = nlohmann::json::parse(first);
    auto b = nlohmann::json::parse(second);
    if (require(a["event"] == "start" && b["event"] == "end", "one event per line")) return 1;
    if (require(nearly_equal(b["offset_seconds"].get<double>(), 0.32), "end seconds")) return 1;
    return 0;
}

int test_summary_stays_one_line() {
    SegmentTracker tracker;
    tracker.onFrame(start_at(800), true);
    tracker.onFrame(end_at(1600), false);

    std::ostringstream out;
    EventLineWriter writer(out, 8000);
    writer.write(start_at(800));
    writer.writeLine(tracker.summaryJson(8000));

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    nlohmann::json last;
    while (std::getline(lines, line)) {
        last = nlohmann::json::parse(line);
        ++count;
    }
    if (require(count == 2, "summary adds exactly one line")) return 1;
    if (require(last["segment_count"] == 1, "last line is the summary")) return 1;
    if (require(writer.written() == 2, "summary counted as written")) return 1;
    return 0;
}

int test_with_engine() {
    SegmenterConfig cfg;
    cfg.sampleRate = 8000;
    cfg.speechThreshold = 0.5f;
    cfg.silenceThreshold = 0.2f;
    cfg.minSilenceDurationSamples = 512;
    cfg.minSpeechDurationSamples = 1024;
    SegmentationEngine engine(cfg);
    SegmentTracker tracker;

    // One kept utterance (8 frames) then one blip (2 frames).
    const float probs[] = {0.1f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f,
                           0.1f, 0.1f, 0.1f, 0.1f,
                           0.9f, 0.9f, 0.1f, 0.1f, 0.1f, 0.1f};
    for (float p : probs) {
        auto ev = engine.process(p, 256);
        tracker.onFrame(ev, engine.isTriggered());
    }
    if (require(tracker.segments().size() == 1, "one kept segment")) return 1;
    if (require(tracker.discardedCount() == 1, "one discarded blip")) return 1;
    const auto& seg = tracker.segments()[0];
    if (require(seg.startSample == 256, "segment starts at frame 2")) return 1;
    if (require(seg.endSample == 2560 - 256, "segment ends at provisional end minus a frame")) return 1;
    return 0;
}

}

int main() {
    int failures = 0;
    failures += test_pairs_events();
    failures += test_discarded_start();
    failures += test_summary_json();
    failures += test_event_json();
    failures += test_summary_stays_one_line();
    failures += test_with_engine();
    if (failures == 0) std::printf("segment_tracker_test: OK\n");
    return failures == 0 ? 0 : 1;
}
