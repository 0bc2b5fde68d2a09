#include "io/event_json.hpp"
#include <stdexcept>

namespace vadseg {

nlohmann::json toJson(const SpeechEvent& event, int sampleRate) {
    return nlohmann::json{
        {"event", toString(event.type)},
        {"offset_samples", event.offsetSamples},
        {"offset_seconds", event.offsetSeconds(sampleRate)}
    };
}

void EventLineWriter::write(const SpeechEvent& event) {
    writeLine(toJson(event, sampleRate_));
}

void EventLineWriter::writeLine(const nlohmann::json& record) {
    out_ << record.dump() << '\n' << std::flush;
    if (!out_) {
        throw std::runtime_error("Failed to write JSON line");
    }
    ++written_;
}

} // namespace vadseg
