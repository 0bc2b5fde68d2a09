#include "segmentation/segmenter_config.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace vadseg {

namespace {

void requireNonNegative(const char* field, std::int64_t value) {
    if (value < 0) {
        throw std::invalid_argument(std::string(field) + " must be >= 0, got " +
                                    std::to_string(value));
    }
}

} // namespace

std::int64_t samplesForMilliseconds(int sampleRate, int ms) {
    if (sampleRate <= 0) {
        throw std::invalid_argument("sample_rate must be > 0, got " + std::to_string(sampleRate));
    }
    if (ms < 0) {
        throw std::invalid_argument("duration must be >= 0 ms, got " + std::to_string(ms));
    }
    return static_cast<std::int64_t>(sampleRate) * ms / 1000;
}

std::int64_t samplesPerFrame(int sampleRate, int frameMs) {
    const auto samples = samplesForMilliseconds(sampleRate, frameMs);
    if (samples <= 0) {
        throw std::invalid_argument("frame of " + std::to_string(frameMs) + " ms at " +
                                    std::to_string(sampleRate) + " Hz holds no samples");
    }
    return samples;
}

SegmenterConfig SegmenterConfig::fromMilliseconds(int sampleRate,
                                                  float speechThreshold,
                                                  int minSilenceMs,
                                                  int minSpeechMs,
                                                  int speechPadMs,
                                                  std::optional<float> silenceThreshold) {
    SegmenterConfig cfg;
    cfg.sampleRate = sampleRate;
    cfg.speechThreshold = speechThreshold;
    cfg.silenceThreshold = silenceThreshold;
    cfg.minSilenceDurationSamples = samplesForMilliseconds(sampleRate, minSilenceMs);
    cfg.minSpeechDurationSamples = samplesForMilliseconds(sampleRate, minSpeechMs);
    cfg.speechPadSamples = samplesForMilliseconds(sampleRate, speechPadMs);
    return cfg;
}

float SegmenterConfig::effectiveSilenceThreshold() const {
    if (silenceThreshold) return *silenceThreshold;
    return std::max(speechThreshold - SILENCE_THRESHOLD_MARGIN, MIN_DERIVED_SILENCE_THRESHOLD);
}

SegmenterParams SegmenterConfig::resolve() const {
    if (sampleRate <= 0) {
        throw std::invalid_argument("sample_rate must be > 0, got " + std::to_string(sampleRate));
    }
    // Negated comparisons so NaN fails as well.
    if (!(speechThreshold > 0.0f && speechThreshold <= 1.0f)) {
        throw std::invalid_argument("speech_threshold must be in (0, 1], got " +
                                    std::to_string(speechThreshold));
    }
    const float silence = effectiveSilenceThreshold();
    if (!(silence >= 0.0f && silence < speechThreshold)) {
        throw std::invalid_argument("silence_threshold must be in [0, speech_threshold), got " +
                                    std::to_string(silence) + " with speech_threshold " +
                                    std::to_string(speechThreshold));
    }
    requireNonNegative("min_silence_duration_samples", minSilenceDurationSamples);
    requireNonNegative("min_speech_duration_samples", minSpeechDurationSamples);
    requireNonNegative("speech_pad_samples", speechPadSamples);

    SegmenterParams params;
    params.sampleRate = sampleRate;
    params.speechThreshold = speechThreshold;
    params.silenceThreshold = silence;
    params.minSilenceDurationSamples = minSilenceDurationSamples;
    params.minSpeechDurationSamples = minSpeechDurationSamples;
    params.speechPadSamples = speechPadSamples;
    return params;
}

} // namespace vadseg
