#pragma once
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace vadseg {

struct TraceFrame {
    float probability{0.0f};
    std::int64_t lengthSamples{0};
};

// Reads recorded per-frame speech probabilities, used in place of a live
// capture plus scorer. Text format, one frame per line:
//
//   # comment
//   0.12
//   0.87 256
//
// A line without a length uses the default frame length. Probability range is
// not checked here; the engine rejects bad values.
//
// Frames are read one line at a time, so a pipe is consumed as it is written.
class ProbabilityTraceReader {
public:
    // Reads from `in`, which must outlive the reader.
    ProbabilityTraceReader(std::istream& in, std::string sourceName, std::int64_t defaultFrameLength);

    // "-" reads standard input. Throws std::runtime_error if the file cannot be opened.
    static ProbabilityTraceReader open(const std::string& path, std::int64_t defaultFrameLength);

    // Next frame, or nothing at end of input. Throws std::runtime_error naming
    // the source and line for malformed lines or read errors.
    std::optional<TraceFrame> next();

    const std::string& sourceName() const { return sourceName_; }
    int lineNumber() const { return lineNo_; }
    std::size_t framesRead() const { return framesRead_; }
    std::int64_t samplesRead() const { return samplesRead_; }

private:
    std::unique_ptr<std::istream> owned_;
    std::istream* in_;
    std::string sourceName_;
    std::int64_t defaultFrameLength_;
    int lineNo_{0};
    std::size_t framesRead_{0};
    std::int64_t samplesRead_{0};
};

} // namespace vadseg
