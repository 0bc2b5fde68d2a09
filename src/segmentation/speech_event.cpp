#include "segmentation/speech_event.hpp"

namespace vadseg {

const char* toString(SpeechEvent::Type type) {
    switch (type) {
        case SpeechEvent::Type::Start: return "start";
        case SpeechEvent::Type::End:   return "end";
    }
    return "unknown";
}

} // namespace vadseg
