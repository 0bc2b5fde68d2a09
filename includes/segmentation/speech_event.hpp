#pragma once
#include <cstdint>

namespace vadseg {

struct SpeechEvent {
    enum class Type { Start, End };

    Type type{Type::Start};
    std::int64_t offsetSamples{0};

    double offsetSeconds(int sampleRate) const {
        return static_cast<double>(offsetSamples) / static_cast<double>(sampleRate);
    }

    bool operator==(const SpeechEvent& other) const {
        return type == other.type && offsetSamples == other.offsetSamples;
    }
    bool operator!=(const SpeechEvent& other) const { return !(*this == other); }
};

// "start" / "end"
const char* toString(SpeechEvent::Type type);

} // namespace vadseg
