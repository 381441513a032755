#include "null_audio_backend.hh"
#include <ringplay/backends/null/null_backend.hh>
#include <ringplay/error.hh>
#include <chrono>
#include <string>

namespace ringplay {

    // ------------------------------------------------------------------------
    // null_audio_stream
    // ------------------------------------------------------------------------

    null_audio_stream::null_audio_stream(const audio_spec& spec,
                                         audio_callback_t callback,
                                         void* userdata,
                                         std::shared_ptr<std::atomic<bool>> device_paused)
        : m_spec(spec),
          m_callback(callback),
          m_userdata(userdata),
          m_device_paused(std::move(device_paused)),
          m_period(static_cast<std::size_t>(spec.period_frames) * spec.channels) {
        if (spec.period_frames == 0 || spec.channels == 0 || spec.freq == 0) {
            throw device_error("Null stream needs a positive period, channel count and rate");
        }
        bind_to_device();
    }

    null_audio_stream::~null_audio_stream() {
        unbind_from_device();
    }

    bool null_audio_stream::pause() {
        m_paused.store(true, std::memory_order_release);
        return true;
    }

    bool null_audio_stream::resume() {
        m_paused.store(false, std::memory_order_release);
        return true;
    }

    bool null_audio_stream::is_paused() const {
        return m_paused.load(std::memory_order_acquire);
    }

    bool null_audio_stream::bind_to_device() {
        std::lock_guard <std::mutex> lock(m_mutex);
        if (m_bound || !m_callback) {
            return false;
        }
        m_bound = true;
        m_unbinding = false;
        m_thread = std::thread([this] { tick_loop(); });
        return true;
    }

    void null_audio_stream::unbind_from_device() {
        {
            std::lock_guard <std::mutex> lock(m_mutex);
            if (!m_bound) {
                return;
            }
            m_unbinding = true;
        }
        m_cv.notify_all();
        if (m_thread.joinable()) {
            m_thread.join();
        }
        std::lock_guard <std::mutex> lock(m_mutex);
        m_bound = false;
    }

    void null_audio_stream::tick_loop() {
        using clock = std::chrono::steady_clock;
        const auto period = std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double>(static_cast<double>(m_spec.period_frames) / m_spec.freq));
        const auto bytes = static_cast<int>(m_period.size() * sizeof(float));

        auto next = clock::now();
        while (true) {
            const bool device_paused = m_device_paused && m_device_paused->load(std::memory_order_acquire);
            if (!device_paused && !m_paused.load(std::memory_order_acquire)) {
                m_callback(m_userdata, reinterpret_cast<uint8_t*>(m_period.data()), bytes);
            }

            next += period;
            std::unique_lock <std::mutex> lock(m_mutex);
            if (m_cv.wait_until(lock, next, [this] { return m_unbinding; })) {
                return;
            }
        }
    }

    // ------------------------------------------------------------------------
    // null_audio_backend
    // ------------------------------------------------------------------------

    null_audio_backend::~null_audio_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void null_audio_backend::init() {
        if (m_initialized) {
            throw device_error("Null backend already initialized");
        }
        m_initialized = true;
    }

    void null_audio_backend::shutdown() {
        if (!m_initialized) {
            return;
        }
        {
            std::lock_guard <std::mutex> lock(m_devices_mutex);
            m_devices.clear();
        }
        m_initialized = false;
    }

    bool null_audio_backend::is_initialized() const {
        return m_initialized;
    }

    std::vector <device_info> null_audio_backend::enumerate_devices() {
        if (!m_initialized) {
            throw device_error("Backend not initialized");
        }
        return {get_default_device()};
    }

    device_info null_audio_backend::get_default_device() {
        device_info info;
        info.name = "Null Output";
        info.id = "null";
        info.is_default = true;
        info.channels = 2;
        info.sample_rate = 48000;
        return info;
    }

    uint32_t null_audio_backend::open_device(const std::string& device_id,
                                             const audio_spec& spec,
                                             audio_spec& obtained_spec) {
        if (!m_initialized) {
            throw device_error("Backend not initialized");
        }
        if (!device_id.empty() && device_id != "null" && device_id != "default") {
            throw device_error("Device not found: " + device_id);
        }

        obtained_spec = spec;
        obtained_spec.format = audio_format::f32le;

        std::lock_guard <std::mutex> lock(m_devices_mutex);
        const uint32_t handle = m_next_handle++;
        device_state& state = m_devices[handle];
        state.spec = obtained_spec;
        state.paused = std::make_shared<std::atomic<bool>>(false);
        return handle;
    }

    void null_audio_backend::close_device(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);
        m_devices.erase(device_handle);
    }

    bool null_audio_backend::pause_device(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }
        it->second.paused->store(true, std::memory_order_release);
        return true;
    }

    bool null_audio_backend::resume_device(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }
        it->second.paused->store(false, std::memory_order_release);
        return true;
    }

    bool null_audio_backend::is_device_paused(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            throw device_error("Invalid device handle");
        }
        return it->second.paused->load(std::memory_order_acquire);
    }

    std::unique_ptr <audio_stream_interface> null_audio_backend::create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) {
        std::shared_ptr <std::atomic <bool>> paused;
        {
            std::lock_guard <std::mutex> lock(m_devices_mutex);
            auto it = m_devices.find(device_handle);
            if (it == m_devices.end()) {
                throw device_error("Invalid device handle");
            }
            paused = it->second.paused;
        }
        return std::make_unique <null_audio_stream>(spec, callback, userdata, std::move(paused));
    }

    std::unique_ptr <audio_backend> create_null_backend() {
        return std::make_unique <null_audio_backend>();
    }

} // namespace ringplay
