#include "config.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace vadseg {

using std::string;

static inline string unquote(const string& s) {
    if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
        return s.substr(1, s.size()-2);
    }
    return s;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/vadseg/vadseg.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/vadseg/vadseg.toml";
}

std::string default_db_path() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return string(xdg) + "/vadseg/vadseg.db";
    const char* home = std::getenv("HOME");
    return string(home ? home : ".") + "/.local/share/vadseg/vadseg.db";
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    while (std::getline(f, line)) {
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty()) continue;

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;
        val = unquote(val);

        if (ieq(key, "sample_rate")) cfg.sample_rate = as_int(val);
        else if (ieq(key, "frame_ms")) cfg.frame_ms = as_int(val);
        else if (ieq(key, "speech_threshold") || ieq(key, "threshold")) cfg.speech_threshold = as_float(val);
        else if (ieq(key, "silence_threshold")) cfg.silence_threshold = as_float(val);
        else if (ieq(key, "min_silence_ms") || ieq(key, "silence_ms")) cfg.min_silence_ms = as_int(val);
        else if (ieq(key, "min_speech_ms")) cfg.min_speech_ms = as_int(val);
        else if (ieq(key, "speech_pad_ms") || ieq(key, "pad_ms")) cfg.speech_pad_ms = as_int(val);
        else if (ieq(key, "db_path")) cfg.db_path = expand_path(val);
    }
    return cfg;
}

AppConfig merge_config(const AppConfig& base, const AppConfig& over) {
    AppConfig out = base;
    if (over.sample_rate)       out.sample_rate = over.sample_rate;
    if (over.frame_ms)          out.frame_ms = over.frame_ms;
    if (over.speech_threshold)  out.speech_threshold = over.speech_threshold;
    if (over.silence_threshold) out.silence_threshold = over.silence_threshold;
    if (over.min_silence_ms)    out.min_silence_ms = over.min_silence_ms;
    if (over.min_speech_ms)     out.min_speech_ms = over.min_speech_ms;
    if (over.speech_pad_ms)     out.speech_pad_ms = over.speech_pad_ms;
    if (over.db_path)           out.db_path = over.db_path;
    return out;
}

SegmenterConfig to_segmenter_config(const AppConfig& cfg) {
    return SegmenterConfig::fromMilliseconds(
        cfg.sample_rate.value_or(AppDefaults::SAMPLE_RATE),
        cfg.speech_threshold.value_or(AppDefaults::SPEECH_THRESHOLD),
        cfg.min_silence_ms.value_or(AppDefaults::MIN_SILENCE_MS),
        cfg.min_speech_ms.value_or(AppDefaults::MIN_SPEECH_MS),
        cfg.speech_pad_ms.value_or(AppDefaults::SPEECH_PAD_MS),
        cfg.silence_threshold);
}

int int_option(const std::string& option, const std::string& value) {
    auto v = as_int(value);
    if (!v) throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    return *v;
}

float float_option(const std::string& option, const std::string& value) {
    auto v = as_float(value);
    if (!v) throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    return *v;
}

std::int64_t frame_length_samples(const AppConfig& cfg) {
    return samplesPerFrame(cfg.sample_rate.value_or(AppDefaults::SAMPLE_RATE),
                           cfg.frame_ms.value_or(AppDefaults::FRAME_MS));
}

} // namespace vadseg
