#pragma once
#include "segmentation/segmenter_config.hpp"
#include <optional>
#include <string>

namespace vadseg {

struct AppConfig {
    std::optional<int> sample_rate;            // --sr
    std::optional<int> frame_ms;               // --frame-ms

    std::optional<float> speech_threshold;     // --threshold
    std::optional<float> silence_threshold;    // --silence-threshold
    std::optional<int> min_silence_ms;         // --silence-ms
    std::optional<int> min_speech_ms;          // --speech-ms
    std::optional<int> speech_pad_ms;          // --pad-ms

    std::optional<std::string> db_path;        // --db
};

// Fallbacks used when neither the file nor the command line sets a value.
struct AppDefaults {
    static constexpr int SAMPLE_RATE = 8000;
    static constexpr int FRAME_MS = 32;                // 256 samples @ 8k
    static constexpr float SPEECH_THRESHOLD = 0.45f;
    static constexpr int MIN_SILENCE_MS = 1000;
    static constexpr int MIN_SPEECH_MS = 0;
    static constexpr int SPEECH_PAD_MS = 100;
};

// Returns $XDG_CONFIG_HOME/vadseg/vadseg.toml or ~/.config/vadseg/vadseg.toml
std::string default_config_path();

// Returns $XDG_DATA_HOME/vadseg/vadseg.db or ~/.local/share/vadseg/vadseg.db
std::string default_db_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
AppConfig load_config_file(const std::string& path);

// Values set in `over` win over those in `base`.
AppConfig merge_config(const AppConfig& base, const AppConfig& over);

// Applies AppDefaults and converts to a segmenter configuration.
// Throws std::invalid_argument for negative durations or a bad sample rate.
SegmenterConfig to_segmenter_config(const AppConfig& cfg);
std::int64_t frame_length_samples(const AppConfig& cfg);

// Command-line value conversions. Throw std::invalid_argument naming the
// option and the rejected value.
int int_option(const std::string& option, const std::string& value);
float float_option(const std::string& option, const std::string& value);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

} // namespace vadseg
