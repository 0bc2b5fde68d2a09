#pragma once
#include <cstdint>
#include <optional>

namespace vadseg {

// Thresholds and durations after validation, with the silence threshold resolved.
struct SegmenterParams {
    int sampleRate{0};
    float speechThreshold{0.0f};
    float silenceThreshold{0.0f};
    std::int64_t minSilenceDurationSamples{0};
    std::int64_t minSpeechDurationSamples{0};
    std::int64_t speechPadSamples{0};
};

struct SegmenterConfig {
    static constexpr float SILENCE_THRESHOLD_MARGIN = 0.15f;
    static constexpr float MIN_DERIVED_SILENCE_THRESHOLD = 0.01f;

    int sampleRate{8000};
    float speechThreshold{0.5f};
    std::optional<float> silenceThreshold;  // derived from speechThreshold when unset
    std::int64_t minSilenceDurationSamples{0};
    std::int64_t minSpeechDurationSamples{0};
    std::int64_t speechPadSamples{0};

    // Durations are converted as sampleRate * ms / 1000, rounded down.
    static SegmenterConfig fromMilliseconds(int sampleRate,
                                            float speechThreshold,
                                            int minSilenceMs,
                                            int minSpeechMs,
                                            int speechPadMs,
                                            std::optional<float> silenceThreshold = std::nullopt);

    float effectiveSilenceThreshold() const;

    // Throws std::invalid_argument naming the first invalid field.
    SegmenterParams resolve() const;
};

std::int64_t samplesForMilliseconds(int sampleRate, int ms);

// Frame length for a fixed frame duration, e.g. 256 samples for 32 ms at 8 kHz.
std::int64_t samplesPerFrame(int sampleRate, int frameMs);

} // namespace vadseg
