/**
 * @file audio_backend.hh
 * @brief Platform audio backend interface
 * @ingroup backends
 */

#ifndef RINGPLAY_SDK_AUDIO_BACKEND_HH
#define RINGPLAY_SDK_AUDIO_BACKEND_HH

#include <string>
#include <memory>
#include <vector>
#include <ostream>
#include <ringplay/sdk/audio_format.hh>
#include <ringplay/sdk/types.hh>
#include <ringplay/sdk/audio_stream_interface.hh>

namespace ringplay {

/**
 * @struct device_info
 * @brief Audio device information
 * @ingroup backends
 */
struct device_info {
    std::string name;           ///< Human-readable device name
    std::string id;             ///< Unique device identifier
    bool is_default;            ///< True if this is the default device
    channels_t channels;        ///< Number of audio channels supported
    sample_rate_t sample_rate;  ///< Native sample rate in Hz
};

inline std::ostream& operator<<(std::ostream& os, const device_info& info) {
    os << "device_info{"
       << "name=\"" << info.name << "\", "
       << "id=\"" << info.id << "\", "
       << "default=" << (info.is_default ? "true" : "false") << ", "
       << "channels=" << static_cast<int>(info.channels) << ", "
       << "sample_rate=" << info.sample_rate
       << "}";
    return os;
}

/**
 * Signature of the real-time callback. @p len is the size of @p stream in
 * bytes; the backend always passes whole periods of 32-bit float frames.
 */
using audio_callback_t = void (*)(void* userdata, uint8_t* stream, int len);

/**
 * @class audio_backend
 * @brief Abstract interface for the playback host
 * @ingroup backends
 *
 * A backend owns the platform audio subsystem. It opens devices and
 * creates streams whose callback it invokes on a real-time thread with a
 * fixed number of frames per call.
 *
 * ## Implementing a Backend
 *
 * @code
 * class my_backend : public audio_backend {
 * public:
 *     void init() override {
 *         // Initialize platform API
 *     }
 *
 *     uint32_t open_device(const std::string& id,
 *                          const audio_spec& spec,
 *                          audio_spec& obtained) override {
 *         // Open platform device, return unique handle
 *     }
 *
 *     // ... implement other methods
 * };
 * @endcode
 *
 * ## Thread Safety
 *
 * - init()/shutdown() must be called from the owning thread
 * - Device operations are thread-safe after init()
 * - Callbacks run on platform-specific threads
 *
 * @see create_sdl3_backend(), create_null_backend()
 */
class audio_backend {
public:
    virtual ~audio_backend() = default;

    // ========================================================================
    // Initialization and lifecycle management
    // ========================================================================

    /**
     * Initialize the audio subsystem.
     * @throws device_error if initialization fails
     */
    virtual void init() = 0;

    /**
     * Shutdown the audio subsystem and close all open devices.
     */
    virtual void shutdown() = 0;

    /**
     * @return Backend name (e.g. "SDL3", "Null")
     */
    virtual std::string get_name() const = 0;

    virtual bool is_initialized() const = 0;

    // ========================================================================
    // Device enumeration and discovery
    // ========================================================================

    /**
     * Enumerate available playback devices.
     */
    virtual std::vector<device_info> enumerate_devices() = 0;

    /**
     * Get the default playback device.
     */
    virtual device_info get_default_device() = 0;

    // ========================================================================
    // Device management
    // ========================================================================

    /**
     * Open a playback device.
     * @param device_id Device identifier (empty string for default)
     * @param spec Desired audio specification
     * @param obtained_spec Actual specification obtained (output parameter)
     * @return Device handle for use in subsequent operations
     * @throws device_error if the device cannot be opened
     */
    virtual uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) = 0;

    /**
     * Close an audio device. Unknown handles are ignored.
     */
    virtual void close_device(uint32_t device_handle) = 0;

    // ========================================================================
    // Device control
    // ========================================================================

    virtual bool pause_device(uint32_t device_handle) = 0;
    virtual bool resume_device(uint32_t device_handle) = 0;

    /**
     * @throws device_error on an unknown handle
     */
    virtual bool is_device_paused(uint32_t device_handle) = 0;

    // ========================================================================
    // Stream creation
    // ========================================================================

    /**
     * Create a callback stream on an open device.
     *
     * The stream is bound on creation. The backend calls @p callback once
     * per period of spec.period_frames frames on its real-time thread.
     *
     * @throws device_error if the stream cannot be created
     */
    virtual std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata
    ) = 0;
};

} // namespace ringplay

#endif // RINGPLAY_SDK_AUDIO_BACKEND_HH
