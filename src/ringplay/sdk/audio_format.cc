#include <ringplay/sdk/audio_format.hh>
#include <ostream>

namespace ringplay {

unsigned audio_format_byte_size(audio_format fmt) {
    switch (fmt) {
        case audio_format::s16le:
            return 2;
        case audio_format::s32le:
        case audio_format::f32le:
        case audio_format::f32be:
            return 4;
        default:
            return 0;
    }
}

std::ostream& operator<<(std::ostream& os, audio_format fmt) {
    switch (fmt) {
        case audio_format::unknown:
            os << "unknown";
            break;
        case audio_format::s16le:
            os << "s16le";
            break;
        case audio_format::s32le:
            os << "s32le";
            break;
        case audio_format::f32le:
            os << "f32le";
            break;
        case audio_format::f32be:
            os << "f32be";
            break;
        default:
            os << "audio_format(" << static_cast<int>(fmt) << ")";
            break;
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const audio_spec& spec) {
    os << "audio_spec{"
       << "format=" << spec.format << ", "
       << "channels=" << static_cast<int>(spec.channels) << ", "
       << "freq=" << spec.freq << ", "
       << "period_frames=" << spec.period_frames
       << "}";
    return os;
}

} // namespace ringplay
