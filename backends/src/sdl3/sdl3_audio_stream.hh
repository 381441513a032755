#ifndef RINGPLAY_SDL3_AUDIO_STREAM_HH
#define RINGPLAY_SDL3_AUDIO_STREAM_HH

#include <ringplay/sdk/audio_backend.hh>
#include <ringplay/sdk/audio_stream_interface.hh>
#include <ringplay/sdk/audio_format.hh>
#include <ringplay/sdk/buffer.hh>
#include "sdl3.hh"
#include <atomic>
#include <memory>

namespace ringplay {

class sdl3_audio_stream : public audio_stream_interface {
public:
    sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                      audio_callback_t callback,
                      void* userdata);
    ~sdl3_audio_stream() override;

    bool pause() override;
    bool resume() override;
    bool is_paused() const override;
    bool bind_to_device() override;
    void unbind_from_device() override;

private:
    static void sdl_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);
    static SDL_AudioFormat to_sdl_format(audio_format fmt);

    SDL_AudioDeviceID m_device_id;
    std::shared_ptr<SDL_AudioStream> m_stream;
    audio_callback_t m_callback;
    void* m_userdata;
    buffer<float> m_period;
    int m_period_bytes;
    std::atomic<bool> m_paused{false};
    bool m_bound;
};

} // namespace ringplay

#endif // RINGPLAY_SDL3_AUDIO_STREAM_HH
