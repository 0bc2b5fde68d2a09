#pragma once
#include "segmentation/speech_event.hpp"
#include <ostream>
#include <nlohmann/json.hpp>

namespace vadseg {

// {"event":"start","offset_samples":512,"offset_seconds":0.064}
nlohmann::json toJson(const SpeechEvent& event, int sampleRate);

// Writes one JSON object per line and flushes, so a downstream reader sees
// each event as soon as it is emitted.
class EventLineWriter {
public:
    EventLineWriter(std::ostream& out, int sampleRate) : out_(out), sampleRate_(sampleRate) {}

    void write(const SpeechEvent& event);
    // Any other record, kept on a single line.
    void writeLine(const nlohmann::json& record);
    int written() const { return written_; }

private:
    std::ostream& out_;
    int sampleRate_;
    int written_{0};
};

} // namespace vadseg
