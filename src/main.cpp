#include "config.hpp"
#include "logging.hpp"
#include "sqlite_logger.hpp"
#include "io/event_json.hpp"
#include "io/probability_trace.hpp"
#include "segmentation/segment_tracker.hpp"
#include "segmentation/segmentation_engine.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace vadseg;

struct Args {
    std::string config_path = default_config_path();
    std::string input = "-";
    bool use_db = true;
    bool summary = false;
    AppConfig overrides;
};

Args parse_args(int argc, char** argv) {
    Args a{};
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      ((s == "--config" || s == "-c") && i + 1 < argc) a.config_path = argv[++i];
        else if ((s == "--input" || s == "-i") && i + 1 < argc) a.input = argv[++i];
        else if (s == "--db" && i + 1 < argc) a.overrides.db_path = expand_path(argv[++i]);
        else if (s == "--no-db") a.use_db = false;
        else if (s == "--summary") a.summary = true;

        else if (s == "--sr" && i + 1 < argc) a.overrides.sample_rate = int_option(s, argv[++i]);
        else if (s == "--frame-ms" && i + 1 < argc) a.overrides.frame_ms = int_option(s, argv[++i]);
        else if (s == "--threshold" && i + 1 < argc) a.overrides.speech_threshold = float_option(s, argv[++i]);
        else if (s == "--silence-threshold" && i + 1 < argc) a.overrides.silence_threshold = float_option(s, argv[++i]);
        else if (s == "--silence-ms" && i + 1 < argc) a.overrides.min_silence_ms = int_option(s, argv[++i]);
        else if (s == "--speech-ms" && i + 1 < argc) a.overrides.min_speech_ms = int_option(s, argv[++i]);
        else if (s == "--pad-ms" && i + 1 < argc) a.overrides.speech_pad_ms = int_option(s, argv[++i]);

        else if (s == "--help" || s == "-h") {
            std::cout << "vadseg replay: speech segmentation over a probability trace\n"
                      << "  -c, --config <path>            Settings file (default XDG)\n"
                      << "  -i, --input <path>             Trace file, '-' for stdin (default)\n"
                      << "      --db <path>                SQLite DB path (default XDG)\n"
                      << "      --no-db                    Do not record the session\n"
                      << "      --summary                  Print the segment summary as a last JSON line\n"
                      << "      --sr <Hz>                  Sample rate (default 8000)\n"
                      << "      --frame-ms <ms>            Default frame duration (default 32)\n"
                      << "      --threshold <p>            Speech threshold (default 0.45)\n"
                      << "      --silence-threshold <p>    Silence threshold (default threshold - 0.15)\n"
                      << "      --silence-ms <ms>          Min silence to end speech (default 1000)\n"
                      << "      --speech-ms <ms>           Min speech to keep a segment (default 0)\n"
                      << "      --pad-ms <ms>              Speech padding (default 100)\n";
            std::exit(0);
        }
        else {
            throw std::invalid_argument("Unknown or incomplete option: " + s);
        }
    }
    return a;
}

int main(int argc, char** argv) {
    std::unique_ptr<SessionLogger> logger;
    std::optional<std::int64_t> session_id;
    std::int64_t total_samples = 0;

    try {
        Args args = parse_args(argc, argv);

        AppConfig cfg = merge_config(load_config_file(args.config_path), args.overrides);
        SegmentationEngine engine(to_segmenter_config(cfg));
        const auto frame_length = frame_length_samples(cfg);

        const auto& p = engine.params();
        log_info("sample_rate=" + std::to_string(p.sampleRate) +
                 " frame=" + std::to_string(frame_length) +
                 " speech_threshold=" + std::to_string(p.speechThreshold) +
                 " silence_threshold=" + std::to_string(p.silenceThreshold) +
                 " min_silence=" + std::to_string(p.minSilenceDurationSamples) +
                 " min_speech=" + std::to_string(p.minSpeechDurationSamples) +
                 " pad=" + std::to_string(p.speechPadSamples));

        ProbabilityTraceReader trace = ProbabilityTraceReader::open(args.input, frame_length);

        if (args.use_db) {
            logger = std::make_unique<SessionLogger>(cfg.db_path.value_or(default_db_path()));
            session_id = logger->start_session(p.sampleRate);
            log_info("Recording session " + std::to_string(*session_id) + " in " + logger->path());
        }

        EventLineWriter writer(std::cout, p.sampleRate);
        SegmentTracker tracker;
        while (auto frame = trace.next()) {
            auto event = engine.process(frame->probability, frame->lengthSamples);
            total_samples = engine.currentSample();
            auto closed = tracker.onFrame(event, engine.isTriggered());
            if (event) {
                writer.write(*event);
                if (logger) logger->log_event(*session_id, *event);
            }
            if (closed && logger) logger->log_segment(*session_id, *closed);
        }
        if (trace.framesRead() == 0) {
            log_warn("Probability trace is empty: " + trace.sourceName());
        }

        if (tracker.speaking()) {
            log_warn("Trace ended inside a speech segment");
        }
        log_info(std::to_string(tracker.segments().size()) + " segment(s), " +
                 std::to_string(tracker.discardedCount()) + " discarded");

        if (args.summary) {
            writer.writeLine(tracker.summaryJson(p.sampleRate));
        }

        if (logger) logger->end_session(*session_id, total_samples);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (logger && session_id) {
            try {
                logger->end_session(*session_id, total_samples);
            } catch (const std::exception& close_err) {
                log_error(std::string("Could not close session: ") + close_err.what());
            }
        }
        return 1;
    }
}
