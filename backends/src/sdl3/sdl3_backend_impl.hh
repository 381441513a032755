/**
 * @file sdl3_backend_impl.hh
 * @brief SDL3 backend implementation
 * @ingroup sdl3_backend
 */

#ifndef RINGPLAY_SDL3_BACKEND_IMPL_HH
#define RINGPLAY_SDL3_BACKEND_IMPL_HH

#include <ringplay/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ringplay {

/**
 * @class sdl3_backend
 * @brief SDL3 implementation of the audio backend interface
 * @ingroup sdl3_backend
 *
 * - **Handle Mapping**: Maps ringplay handles to SDL3 device IDs
 * - **Period size**: Requested through SDL_HINT_AUDIO_DEVICE_SAMPLE_FRAMES
 *   before the device is opened; SDL may still pick another size, which
 *   the stream absorbs by answering pulls in whole periods
 * - **Format Conversion**: Left to SDL's audio streams
 *
 * @note This is an internal implementation class. Users should
 *       create instances via create_sdl3_backend().
 */
class sdl3_backend : public audio_backend {
private:
    bool m_initialized = false;

    struct device_state {
        SDL_AudioDeviceID sdl_id = 0;
        audio_spec spec;
    };

    std::map<uint32_t, device_state> m_devices;
    mutable std::mutex m_devices_mutex;
    uint32_t m_next_handle = 1;

    static audio_format sdl_to_ringplay_format(SDL_AudioFormat sdl_fmt);
    static SDL_AudioFormat ringplay_to_sdl_format(audio_format fmt);

public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    // Initialization
    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    // Device enumeration
    std::vector<device_info> enumerate_devices() override;
    device_info get_default_device() override;

    // Device management
    uint32_t open_device(const std::string& device_id,
                         const audio_spec& spec,
                         audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;

    // Device control
    bool pause_device(uint32_t device_handle) override;
    bool resume_device(uint32_t device_handle) override;
    bool is_device_paused(uint32_t device_handle) override;

    // Stream creation
    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) override;

    // SDL3-specific helper
    SDL_AudioDeviceID get_sdl_device(uint32_t handle) const;
};

} // namespace ringplay

#endif // RINGPLAY_SDL3_BACKEND_IMPL_HH
