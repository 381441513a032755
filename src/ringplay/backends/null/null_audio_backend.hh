#ifndef RINGPLAY_NULL_AUDIO_BACKEND_HH
#define RINGPLAY_NULL_AUDIO_BACKEND_HH

#include <ringplay/sdk/audio_backend.hh>
#include <ringplay/sdk/buffer.hh>
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace ringplay {

/**
 * Stream of the Null backend. A private thread stands in for the device
 * clock: it invokes the callback once per period into a buffer allocated
 * up front, then sleeps until the next period is due.
 */
class null_audio_stream : public audio_stream_interface {
public:
    null_audio_stream(const audio_spec& spec,
                      audio_callback_t callback,
                      void* userdata,
                      std::shared_ptr<std::atomic<bool>> device_paused);
    ~null_audio_stream() override;

    bool pause() override;
    bool resume() override;
    bool is_paused() const override;
    bool bind_to_device() override;
    void unbind_from_device() override;

private:
    void tick_loop();

    audio_spec m_spec;
    audio_callback_t m_callback;
    void* m_userdata;
    std::shared_ptr<std::atomic<bool>> m_device_paused;
    buffer<float> m_period;

    std::atomic<bool> m_paused{false};
    bool m_bound = false;
    bool m_unbinding = false;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
};

/**
 * Null audio backend for testing and headless environments.
 */
class null_audio_backend : public audio_backend {
public:
    null_audio_backend() = default;
    ~null_audio_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override { return "Null"; }
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices() override;
    device_info get_default_device() override;

    uint32_t open_device(const std::string& device_id,
                         const audio_spec& spec,
                         audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;

    bool pause_device(uint32_t device_handle) override;
    bool resume_device(uint32_t device_handle) override;
    bool is_device_paused(uint32_t device_handle) override;

    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) override;

private:
    struct device_state {
        audio_spec spec;
        std::shared_ptr<std::atomic<bool>> paused;
    };

    bool m_initialized = false;
    std::map<uint32_t, device_state> m_devices;
    mutable std::mutex m_devices_mutex;
    uint32_t m_next_handle = 1;
};

} // namespace ringplay

#endif // RINGPLAY_NULL_AUDIO_BACKEND_HH
