#ifndef RINGPLAY_MOCK_BACKENDS_HH
#define RINGPLAY_MOCK_BACKENDS_HH

#include <ringplay/sdk/audio_backend.hh>
#include <ringplay/sdk/audio_stream_interface.hh>
#include <ringplay/sdk/audio_format.hh>
#include <ringplay/error.hh>
#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace ringplay::test {

    class mock_backend;

    // Stream whose callback only runs when the test pumps it
    class mock_stream : public audio_stream_interface {
        private:
            mock_backend& m_backend;
            audio_spec m_spec;
            audio_callback_t m_callback;
            void* m_userdata;
            std::vector<float> m_period;
            bool m_paused{false};
            bool m_bound{false};

        public:
            // Statistics for testing
            std::atomic<int> pause_calls{0};
            std::atomic<int> resume_calls{0};
            std::atomic<int> unbind_calls{0};

            mock_stream(mock_backend& backend, const audio_spec& spec, audio_callback_t callback, void* userdata);
            ~mock_stream() override;

            bool pause() override {
                pause_calls++;
                m_paused = true;
                return true;
            }

            bool resume() override {
                resume_calls++;
                m_paused = false;
                return true;
            }

            bool is_paused() const override { return m_paused; }

            bool bind_to_device() override;
            void unbind_from_device() override;

            bool is_bound() const { return m_bound; }

            // Run one host period; returns the samples the consumer wrote
            const std::vector<float>& pump() {
                if (m_bound && !m_paused) {
                    m_callback(m_userdata, reinterpret_cast<uint8_t*>(m_period.data()),
                               static_cast<int>(m_period.size() * sizeof(float)));
                }
                return m_period;
            }
    };

    // Backend that records every call and lets tests drive the callback
    class mock_backend : public audio_backend {
        private:
            bool m_initialized{false};
            std::map<uint32_t, bool> m_device_paused;
            uint32_t m_next_handle{1};
            std::vector<mock_stream*> m_streams;
            mutable std::mutex m_mutex;

        public:
            // Statistics for testing
            std::atomic<int> open_device_calls{0};
            std::atomic<int> close_device_calls{0};
            std::atomic<int> create_stream_calls{0};

            // Error injection
            bool fail_open_device{false};
            bool fail_create_stream{false};

            // What open_device reports back
            frames_t obtained_period_frames{0};

            void init() override {
                if (m_initialized) {
                    throw device_error("Mock backend already initialized");
                }
                m_initialized = true;
            }

            void shutdown() override {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_initialized = false;
                m_device_paused.clear();
            }

            std::string get_name() const override { return "Mock"; }

            bool is_initialized() const override { return m_initialized; }

            std::vector<device_info> enumerate_devices() override {
                return {get_default_device()};
            }

            device_info get_default_device() override {
                device_info info;
                info.name = "Mock Default Device";
                info.id = "mock_default";
                info.is_default = true;
                info.channels = 2;
                info.sample_rate = 48000;
                return info;
            }

            uint32_t open_device(const std::string&, const audio_spec& spec, audio_spec& obtained_spec) override {
                open_device_calls++;
                if (fail_open_device) {
                    throw device_error("Mock device open failed");
                }
                obtained_spec = spec;
                if (obtained_period_frames != 0) {
                    obtained_spec.period_frames = obtained_period_frames;
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                const uint32_t handle = m_next_handle++;
                m_device_paused[handle] = true;
                return handle;
            }

            void close_device(uint32_t device_handle) override {
                close_device_calls++;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_device_paused.erase(device_handle);
            }

            bool pause_device(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_device_paused.find(device_handle);
                if (it == m_device_paused.end()) {
                    return false;
                }
                it->second = true;
                return true;
            }

            bool resume_device(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_device_paused.find(device_handle);
                if (it == m_device_paused.end()) {
                    return false;
                }
                it->second = false;
                return true;
            }

            bool is_device_paused(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_device_paused.find(device_handle);
                if (it == m_device_paused.end()) {
                    throw device_error("Invalid device handle");
                }
                return it->second;
            }

            std::unique_ptr<audio_stream_interface> create_stream(uint32_t device_handle,
                                                                  const audio_spec& spec,
                                                                  audio_callback_t callback,
                                                                  void* userdata) override {
                create_stream_calls++;
                if (fail_create_stream) {
                    throw device_error("Mock stream creation failed");
                }
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    if (m_device_paused.find(device_handle) == m_device_paused.end()) {
                        throw device_error("Invalid device handle");
                    }
                }
                return std::make_unique<mock_stream>(*this, spec, callback, userdata);
            }

            // Live streams, in creation order
            std::size_t stream_count() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_streams.size();
            }

            mock_stream* stream(std::size_t index = 0) const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return index < m_streams.size() ? m_streams[index] : nullptr;
            }

            void register_stream(mock_stream* s) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_streams.push_back(s);
            }

            void unregister_stream(mock_stream* s) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_streams.erase(std::remove(m_streams.begin(), m_streams.end(), s), m_streams.end());
            }
    };

    inline mock_stream::mock_stream(mock_backend& backend, const audio_spec& spec,
                                    audio_callback_t callback, void* userdata)
        : m_backend(backend),
          m_spec(spec),
          m_callback(callback),
          m_userdata(userdata),
          m_period(static_cast<std::size_t>(spec.period_frames) * spec.channels) {
        bind_to_device();
        m_backend.register_stream(this);
    }

    inline mock_stream::~mock_stream() {
        m_backend.unregister_stream(this);
    }

    inline bool mock_stream::bind_to_device() {
        if (m_bound) {
            return false;
        }
        m_bound = true;
        return true;
    }

    inline void mock_stream::unbind_from_device() {
        unbind_calls++;
        m_bound = false;
    }

} // namespace ringplay::test

#endif // RINGPLAY_MOCK_BACKENDS_HH
