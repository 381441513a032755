#ifndef RINGPLAY_AUDIO_STREAM_INTERFACE_HH
#define RINGPLAY_AUDIO_STREAM_INTERFACE_HH

#include <cstddef>
#include <cstdint>

namespace ringplay {

/**
 * Abstract interface for a callback-driven playback stream.
 *
 * A stream is the attachment point of the real-time context: while it is
 * bound and resumed, the backend calls the stream's callback on its audio
 * thread once per period. Destroying the stream detaches the callback; after
 * the destructor returns the callback is never called again.
 */
class audio_stream_interface {
public:
    virtual ~audio_stream_interface() = default;

    /**
     * Stop invoking the callback until resume().
     * @return true on success, false on failure
     */
    virtual bool pause() = 0;

    /**
     * Start or continue invoking the callback.
     * @return true on success, false on failure
     */
    virtual bool resume() = 0;

    /**
     * Check if the stream is paused.
     */
    virtual bool is_paused() const = 0;

    /**
     * Bind this stream to its device for playback.
     * @return true on success, false if already bound or on failure
     */
    virtual bool bind_to_device() = 0;

    /**
     * Unbind this stream from its device. The callback is not running and
     * will not run again once this returns.
     */
    virtual void unbind_from_device() = 0;
};

} // namespace ringplay

#endif // RINGPLAY_AUDIO_STREAM_INTERFACE_HH
