#include "io/probability_trace.hpp"
#include "text_util.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace vadseg {

namespace {

[[noreturn]] void parseError(const std::string& source, int lineNo, const std::string& what) {
    throw std::runtime_error(source + ":" + std::to_string(lineNo) + ": " + what);
}

} // namespace

ProbabilityTraceReader::ProbabilityTraceReader(std::istream& in,
                                               std::string sourceName,
                                               std::int64_t defaultFrameLength)
    : in_(&in), sourceName_(std::move(sourceName)), defaultFrameLength_(defaultFrameLength) {
    if (defaultFrameLength_ <= 0) {
        throw std::invalid_argument("default frame length must be > 0, got " +
                                    std::to_string(defaultFrameLength_));
    }
}

ProbabilityTraceReader ProbabilityTraceReader::open(const std::string& path,
                                                    std::int64_t defaultFrameLength) {
    if (path == "-") {
        return ProbabilityTraceReader(std::cin, "<stdin>", defaultFrameLength);
    }
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open()) {
        throw std::runtime_error("Cannot open probability trace: " + path);
    }
    ProbabilityTraceReader reader(*file, path, defaultFrameLength);
    reader.owned_ = std::move(file);
    return reader;
}

std::optional<TraceFrame> ProbabilityTraceReader::next() {
    std::string line;
    while (std::getline(*in_, line)) {
        ++lineNo_;
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        trim_inplace(line);
        if (line.empty()) continue;

        std::istringstream fields(line);
        std::string probText;
        std::string lengthText;
        std::string extra;
        fields >> probText >> lengthText >> extra;
        if (!extra.empty()) {
            parseError(sourceName_, lineNo_, "too many fields: '" + line + "'");
        }

        TraceFrame frame;
        auto probability = as_float(probText);
        if (!probability) {
            parseError(sourceName_, lineNo_, "invalid probability '" + probText + "'");
        }
        frame.probability = *probability;

        frame.lengthSamples = defaultFrameLength_;
        if (!lengthText.empty()) {
            auto length = as_int64(lengthText);
            if (!length) {
                parseError(sourceName_, lineNo_, "invalid frame length '" + lengthText + "'");
            }
            if (*length <= 0) {
                parseError(sourceName_, lineNo_, "frame length must be > 0");
            }
            frame.lengthSamples = *length;
        }
        ++framesRead_;
        samplesRead_ += frame.lengthSamples;
        return frame;
    }
    if (in_->bad()) {
        throw std::runtime_error("Read error on probability trace: " + sourceName_);
    }
    return std::nullopt;
}

} // namespace vadseg
