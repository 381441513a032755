#include "sdl3_audio_stream.hh"
#include <ringplay/error.hh>
#include <algorithm>
#include <failsafe/failsafe.hh>
#include <string>

namespace ringplay {

// Custom deleter that checks if SDL is still initialized
static void safe_destroy_audio_stream(SDL_AudioStream* stream) {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
    // If SDL is not initialized, SDL_Quit() has cleaned it up already
}

static std::string sdl_error() {
    const char* error = SDL_GetError();
    return error ? error : "Unknown SDL error";
}

SDL_AudioFormat sdl3_audio_stream::to_sdl_format(audio_format fmt) {
    switch (fmt) {
        case audio_format::s16le:  return SDL_AUDIO_S16LE;
        case audio_format::s32le:  return SDL_AUDIO_S32LE;
        case audio_format::f32le:  return SDL_AUDIO_F32LE;
        case audio_format::f32be:  return SDL_AUDIO_F32BE;
        default:                   return SDL_AUDIO_UNKNOWN;
    }
}

sdl3_audio_stream::sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                                     audio_callback_t callback,
                                     void* userdata)
    : m_device_id(device_id)
    , m_callback(callback)
    , m_userdata(userdata)
    , m_period(static_cast<size_t>(spec.period_frames) * spec.channels)
    , m_period_bytes(static_cast<int>(m_period.size() * sizeof(float)))
    , m_bound(false) {

    if (!m_callback) {
        throw device_error("SDL3 stream requires a callback");
    }
    if (spec.format != audio_format::f32le || m_period.empty()) {
        throw device_error("SDL3 stream requires f32le samples and a non-empty period");
    }

    SDL_AudioSpec sdl_spec;
    sdl_spec.format = to_sdl_format(spec.format);
    sdl_spec.channels = spec.channels;
    sdl_spec.freq = static_cast<int>(spec.freq);

    // The device is already open:
    // 1. Get the device format
    // 2. Create a stream that converts from our format to the device format
    // 3. Set up the pull callback and bind the stream to the device
    SDL_AudioSpec device_spec;
    if (!SDL_GetAudioDeviceFormat(m_device_id, &device_spec, nullptr)) {
        throw device_error("Failed to get device format: " + sdl_error());
    }

    m_stream = std::shared_ptr<SDL_AudioStream>(
        SDL_CreateAudioStream(&sdl_spec, &device_spec),
        safe_destroy_audio_stream
    );
    if (!m_stream) {
        throw device_error("Failed to create audio stream: " + sdl_error());
    }

    if (!bind_to_device()) {
        throw device_error("Failed to bind stream to device: " + sdl_error());
    }
}

sdl3_audio_stream::~sdl3_audio_stream() {
    unbind_from_device();
}

// Runs on SDL's audio thread. Answers the pull with whole periods so the
// callback always sees the same frame count; the surplus stays queued in
// the SDL stream for the next pull.
void sdl3_audio_stream::sdl_callback(void* userdata,
    SDL_AudioStream* stream,
    int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || additional_amount <= 0) {
        return;
    }

    auto* bytes = reinterpret_cast<uint8_t*>(self->m_period.data());
    int remaining = additional_amount;
    while (remaining > 0) {
        if (self->m_paused.load(std::memory_order_acquire)) {
            std::fill(self->m_period.begin(), self->m_period.end(), 0.0f);
        } else {
            self->m_callback(self->m_userdata, bytes, self->m_period_bytes);
        }
        if (!SDL_PutAudioStreamData(stream, bytes, self->m_period_bytes)) {
            return;
        }
        remaining -= self->m_period_bytes;
    }
}

bool sdl3_audio_stream::pause() {
    m_paused.store(true, std::memory_order_release);
    return true;
}

bool sdl3_audio_stream::resume() {
    m_paused.store(false, std::memory_order_release);
    return true;
}

bool sdl3_audio_stream::is_paused() const {
    return m_paused.load(std::memory_order_acquire);
}

bool sdl3_audio_stream::bind_to_device() {
    if (!m_bound && m_stream) {
        if (!SDL_SetAudioStreamGetCallback(m_stream.get(), sdl_callback, this)) {
            return false;
        }
        if (SDL_BindAudioStream(m_device_id, m_stream.get())) {
            m_bound = true;
            return true;
        }
    }
    return false;
}

void sdl3_audio_stream::unbind_from_device() {
    if (m_bound && m_stream) {
        // Clearing the callback takes the stream lock, so an in-flight pull
        // finishes before this returns.
        if (!SDL_SetAudioStreamGetCallback(m_stream.get(), nullptr, nullptr)) {
            LOG_WARN("sdl3_audio_stream", "Failed to clear stream callback:", sdl_error());
        }
        SDL_UnbindAudioStream(m_stream.get());
        m_bound = false;
    }
}

} // namespace ringplay
