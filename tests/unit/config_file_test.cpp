#include "config.hpp"
#include "test_util.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace vadseg;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("vadseg_config_test_" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

int test_parse_file(const fs::path& dir) {
    const fs::path path = dir / "vadseg.toml";
    {
        std::ofstream out(path);
        out << "# replay settings\n"
            << "Sample_Rate = 16000\n"
            << "frame_ms: 20\n"
            << "threshold = 0.6   ; alias of speech_threshold\n"
            << "silence_threshold = '0.3'\n"
            << "silence_ms = 1200\n"
            << "min_speech_ms = 250\n"
            << "pad_ms = not-a-number\n"
            << "db_path = \"/var/tmp/vadseg.db\"\n"
            << "unknown_key = 5\n"
            << "line without separator\n";
    }

    AppConfig cfg = load_config_file(path.string());
    if (require(cfg.sample_rate == 16000, "case-insensitive key")) return 1;
    if (require(cfg.frame_ms == 20, "colon separator")) return 1;
    if (require(cfg.speech_threshold && nearly_equal(*cfg.speech_threshold, 0.6), "threshold alias")) return 1;
    if (require(cfg.silence_threshold && nearly_equal(*cfg.silence_threshold, 0.3), "quoted value")) return 1;
    if (require(cfg.min_silence_ms == 1200, "silence_ms alias")) return 1;
    if (require(cfg.min_speech_ms == 250, "min_speech_ms")) return 1;
    if (require(!cfg.speech_pad_ms, "unparseable value left unset")) return 1;
    if (require(cfg.db_path == std::string("/var/tmp/vadseg.db"), "db path")) return 1;

    auto seg = to_segmenter_config(cfg);
    if (require(seg.sampleRate == 16000, "rate carried over")) return 1;
    if (require(seg.minSilenceDurationSamples == 19200, "1200 ms at 16 kHz")) return 1;
    if (require(seg.minSpeechDurationSamples == 4000, "250 ms at 16 kHz")) return 1;
    if (require(seg.speechPadSamples == 1600, "default padding at 16 kHz")) return 1;
    if (require(frame_length_samples(cfg) == 320, "20 ms frame at 16 kHz")) return 1;
    return 0;
}

int test_missing_file_and_defaults(const fs::path& dir) {
    AppConfig cfg = load_config_file((dir / "absent.toml").string());
    if (require(!cfg.sample_rate && !cfg.speech_threshold && !cfg.db_path, "missing file is empty")) return 1;

    auto seg = to_segmenter_config(cfg);
    if (require(seg.sampleRate == 8000, "default rate")) return 1;
    if (require(nearly_equal(seg.speechThreshold, 0.45), "default threshold")) return 1;
    if (require(!seg.silenceThreshold, "silence threshold derived by default")) return 1;
    if (require(seg.minSilenceDurationSamples == 8000, "default silence 1000 ms")) return 1;
    if (require(seg.minSpeechDurationSamples == 0, "default min speech 0")) return 1;
    if (require(seg.speechPadSamples == 800, "default pad 100 ms")) return 1;
    if (require(frame_length_samples(cfg) == 256, "default frame 256 samples")) return 1;

    AppConfig negative;
    negative.min_silence_ms = -5;
    if (require(throws_invalid_argument([&] { to_segmenter_config(negative); }),
                "negative milliseconds rejected")) return 1;
    return 0;
}

int test_merge() {
    AppConfig file;
    file.sample_rate = 16000;
    file.speech_threshold = 0.6f;
    file.db_path = std::string("/from/file.db");

    AppConfig flags;
    flags.speech_threshold = 0.7f;
    flags.speech_pad_ms = 50;

    AppConfig merged = merge_config(file, flags);
    if (require(merged.sample_rate == 16000, "file value kept when flag unset")) return 1;
    if (require(merged.speech_threshold && nearly_equal(*merged.speech_threshold, 0.7), "flag wins")) return 1;
    if (require(merged.speech_pad_ms == 50, "flag-only value")) return 1;
    if (require(merged.db_path == std::string("/from/file.db"), "file-only value")) return 1;
    return 0;
}

std::string invalid_argument_text(void (*fn)()) {
    try {
        fn();
    } catch (const std::invalid_argument& e) {
        return e.what();
    }
    return {};
}

int test_option_values() {
    if (require(int_option("--sr", "16000") == 16000, "integer option")) return 1;
    if (require(nearly_equal(float_option("--threshold", "0.6"), 0.6), "float option")) return 1;

    const std::string bad_rate = invalid_argument_text([] { int_option("--sr", "abc"); });
    if (require(bad_rate.find("--sr") != std::string::npos, "error names the option")) return 1;
    if (require(bad_rate.find("'abc'") != std::string::npos, "error quotes the value")) return 1;

    const std::string trailing = invalid_argument_text([] { int_option("--pad-ms", "100ms"); });
    if (require(trailing.find("--pad-ms") != std::string::npos, "trailing garbage rejected")) return 1;
    const std::string bad_threshold = invalid_argument_text([] { float_option("--threshold", "high"); });
    if (require(bad_threshold.find("--threshold") != std::string::npos, "bad float rejected")) return 1;
    const std::string overflow = invalid_argument_text([] { int_option("--sr", "99999999999"); });
    if (require(overflow.find("--sr") != std::string::npos, "out of range rejected")) return 1;
    return 0;
}

int test_paths() {
    setenv("HOME", "/home/tester", 1);
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_DATA_HOME");
    if (require(expand_path("~/vad/db.sqlite") == "/home/tester/vad/db.sqlite", "tilde expansion")) return 1;
    if (require(expand_path("/abs/path") == "/abs/path", "absolute path untouched")) return 1;
    if (require(default_config_path() == "/home/tester/.config/vadseg/vadseg.toml", "config under HOME")) return 1;
    if (require(default_db_path() == "/home/tester/.local/share/vadseg/vadseg.db", "db under HOME")) return 1;

    setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
    setenv("XDG_DATA_HOME", "/xdg/data", 1);
    if (require(default_config_path() == "/xdg/config/vadseg/vadseg.toml", "XDG config")) return 1;
    if (require(default_db_path() == "/xdg/data/vadseg/vadseg.db", "XDG data")) return 1;
    return 0;
}

}

int main() {
    const fs::path dir = scratch_dir();
    int failures = 0;
    failures += test_parse_file(dir);
    failures += test_missing_file_and_defaults(dir);
    failures += test_merge();
    failures += test_option_values();
    failures += test_paths();
    fs::remove_all(dir);
    if (failures == 0) std::printf("config_file_test: OK\n");
    return failures == 0 ? 0 : 1;
}
