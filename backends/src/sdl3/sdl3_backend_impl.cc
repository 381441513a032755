#include "sdl3_backend_impl.hh"
#include "sdl3_audio_stream.hh"
#include <ringplay/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <string>

namespace ringplay {
    namespace {
        std::string get_sdl_error() {
            const char* error = SDL_GetError();
            return error ? error : "Unknown SDL error";
        }
#if defined(RINGPLAY_COMPILER_MSVC)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(RINGPLAY_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(RINGPLAY_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
        SDL_AudioDeviceID default_playback_id() {
            return SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK;
        }

        // Convert a device ID string to an SDL3 device ID
        SDL_AudioDeviceID get_sdl_device_id(const std::string& device_id) {
            if (device_id.empty() || device_id == "default") {
                return default_playback_id();
            }

            std::size_t parsed = 0;
            unsigned long value = 0;
            try {
                value = std::stoul(device_id, &parsed);
            } catch (const std::exception&) {
                throw device_error("Device not found: " + device_id);
            }
            if (parsed != device_id.size()) {
                throw device_error("Device not found: " + device_id);
            }
            return static_cast <SDL_AudioDeviceID>(value);
        }
#if defined(RINGPLAY_COMPILER_MSVC)
#pragma warning( pop )
#elif defined(RINGPLAY_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(RINGPLAY_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
    }

    audio_format sdl3_backend::sdl_to_ringplay_format(SDL_AudioFormat sdl_fmt) {
        switch (sdl_fmt) {
            case SDL_AUDIO_S16LE: return audio_format::s16le;
            case SDL_AUDIO_S32LE: return audio_format::s32le;
            case SDL_AUDIO_F32LE: return audio_format::f32le;
            case SDL_AUDIO_F32BE: return audio_format::f32be;
            default: return audio_format::unknown;
        }
    }

    SDL_AudioFormat sdl3_backend::ringplay_to_sdl_format(audio_format fmt) {
        switch (fmt) {
            case audio_format::s16le: return SDL_AUDIO_S16LE;
            case audio_format::s32le: return SDL_AUDIO_S32LE;
            case audio_format::f32le: return SDL_AUDIO_F32LE;
            case audio_format::f32be: return SDL_AUDIO_F32BE;
            default: return SDL_AUDIO_F32LE;
        }
    }

    sdl3_backend::~sdl3_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            throw device_error("SDL3 backend already initialized");
        }

        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            throw device_error("Failed to initialize SDL3 audio: " + get_sdl_error());
        }

        const char* driver = SDL_GetCurrentAudioDriver();
        LOG_INFO("sdl3_backend", "Audio driver:", driver ? driver : "none");
        m_initialized = true;
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }

        {
            std::lock_guard <std::mutex> lock(m_devices_mutex);
            for (const auto& [handle, info] : m_devices) {
                SDL_CloseAudioDevice(info.sdl_id);
            }
            m_devices.clear();
        }

        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
    }

    std::string sdl3_backend::get_name() const {
        return "SDL3";
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    std::vector <device_info> sdl3_backend::enumerate_devices() {
        if (!m_initialized) {
            throw device_error("Backend not initialized");
        }

        std::vector <device_info> devices;

        int count = 0;
        SDL_AudioDeviceID* sdl_devices = SDL_GetAudioPlaybackDevices(&count);

        // The default device has its own ID; resolve its name to mark it in the list
        std::string default_device_name;
        SDL_AudioSpec default_spec;
        if (SDL_GetAudioDeviceFormat(default_playback_id(), &default_spec, nullptr)) {
            const char* name = SDL_GetAudioDeviceName(default_playback_id());
            if (name) {
                default_device_name = name;
            }
        }

        if (sdl_devices) {
            for (size_t i = 0; i < static_cast <size_t>(count); i++) {
                const char* name = SDL_GetAudioDeviceName(sdl_devices[i]);
                if (!name) continue;

                SDL_AudioSpec spec;
                if (SDL_GetAudioDeviceFormat(sdl_devices[i], &spec, nullptr)) {
                    device_info info;
                    info.name = name;
                    info.id = std::to_string(sdl_devices[i]);
                    info.is_default = (!default_device_name.empty() && info.name == default_device_name);
                    info.channels = static_cast <channels_t>(spec.channels);
                    info.sample_rate = static_cast <sample_rate_t>(spec.freq);
                    devices.push_back(info);
                }
            }
            SDL_free(sdl_devices);
        }

        // Default device goes first
        auto default_it = std::find_if(devices.begin(), devices.end(),
            [](const device_info& dev) { return dev.is_default; });
        if (default_it != devices.end() && default_it != devices.begin()) {
            std::rotate(devices.begin(), default_it, default_it + 1);
        }

        if (!devices.empty() && std::none_of(devices.begin(), devices.end(),
            [](const device_info& dev) { return dev.is_default; })) {
            devices[0].is_default = true;
        }

        if (devices.empty()) {
            devices.push_back(get_default_device());
        }

        return devices;
    }

    device_info sdl3_backend::get_default_device() {
        device_info info;
        info.name = "Default Playback";
        info.id = "default";
        info.is_default = true;
        info.channels = 2;
        info.sample_rate = 48000;
        return info;
    }

    uint32_t sdl3_backend::open_device(const std::string& device_id,
                                       const audio_spec& spec,
                                       audio_spec& obtained_spec) {
        if (!m_initialized) {
            throw device_error("Backend not initialized");
        }

        SDL_AudioSpec wanted;
        SDL_zero(wanted);
        wanted.freq = static_cast <int>(spec.freq);
        wanted.format = ringplay_to_sdl_format(spec.format);
        wanted.channels = spec.channels;

        if (spec.period_frames > 0) {
            const auto frames = std::to_string(spec.period_frames);
            if (!SDL_SetHint(SDL_HINT_AUDIO_DEVICE_SAMPLE_FRAMES, frames.c_str())) {
                LOG_WARN("sdl3_backend", "Period hint rejected:", get_sdl_error());
            }
        }

        SDL_AudioDeviceID sdl_id = SDL_OpenAudioDevice(get_sdl_device_id(device_id), &wanted);
        if (sdl_id == 0) {
            throw device_error("Failed to open audio device: " + get_sdl_error());
        }

        SDL_AudioSpec obtained;
        int sample_frames = 0;
        if (!SDL_GetAudioDeviceFormat(sdl_id, &obtained, &sample_frames)) {
            SDL_CloseAudioDevice(sdl_id);
            throw device_error("Failed to get audio device format: " + get_sdl_error());
        }

        obtained_spec.freq = static_cast <sample_rate_t>(obtained.freq);
        obtained_spec.format = sdl_to_ringplay_format(obtained.format);
        obtained_spec.channels = static_cast <channels_t>(obtained.channels);
        obtained_spec.period_frames = sample_frames > 0 ? static_cast <frames_t>(sample_frames) : spec.period_frames;

        LOG_INFO("sdl3_backend", "Opened device", sdl_id, "with", obtained_spec.period_frames, "frame periods");

        uint32_t handle = 0; {
            std::lock_guard <std::mutex> lock(m_devices_mutex);
            handle = m_next_handle++;
            device_state& info = m_devices[handle];
            info.sdl_id = sdl_id;
            info.spec = obtained_spec;
        }

        return handle;
    }

    void sdl3_backend::close_device(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it != m_devices.end()) {
            SDL_CloseAudioDevice(it->second.sdl_id);
            m_devices.erase(it);
        }
        // Invalid handles are ignored so cleanup paths never throw
    }

    bool sdl3_backend::pause_device(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }

        return SDL_PauseAudioDevice(it->second.sdl_id);
    }

    bool sdl3_backend::resume_device(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }

        return SDL_ResumeAudioDevice(it->second.sdl_id);
    }

    bool sdl3_backend::is_device_paused(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            throw device_error("Invalid device handle");
        }

        return SDL_AudioDevicePaused(it->second.sdl_id);
    }

    std::unique_ptr <audio_stream_interface> sdl3_backend::create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            throw device_error("Invalid device handle");
        }

        return std::make_unique <sdl3_audio_stream>(it->second.sdl_id, spec, callback, userdata);
    }

    SDL_AudioDeviceID sdl3_backend::get_sdl_device(uint32_t handle) const {
        std::lock_guard <std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(handle);
        if (it == m_devices.end()) {
            return 0;
        }
        return it->second.sdl_id;
    }
} // namespace ringplay
