#include <ringplay/session_config.hh>
#include <ringplay/error.hh>
#include <limits>
#include <ostream>

namespace ringplay {

    void session_config::validate() const {
        if (blocks_per_queue == 0) {
            throw config_error("blocks_per_queue must be positive");
        }
        if (frames_per_block == 0) {
            throw config_error("frames_per_block must be positive");
        }
        if (channels == 0) {
            throw config_error("channels must be positive");
        }
        if (sample_rate == 0) {
            throw config_error("sample_rate must be positive");
        }
        const auto queue = static_cast<uint64_t>(blocks_per_queue) * frames_per_block * channels;
        if (queue > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            throw config_error("queue of " + std::to_string(queue) + " samples is too large");
        }
        const auto period = static_cast<uint64_t>(effective_period_frames()) * channels;
        if (period > queue) {
            throw config_error("period of " + std::to_string(period) +
                               " samples exceeds the queue of " + std::to_string(queue));
        }
    }

    samples_t session_config::block_samples() const noexcept {
        return frames_per_block * channels;
    }

    samples_t session_config::queue_samples() const noexcept {
        return static_cast<samples_t>(blocks_per_queue) * block_samples();
    }

    frames_t session_config::effective_period_frames() const noexcept {
        return period_frames == 0 ? frames_per_block : period_frames;
    }

    std::ostream& operator<<(std::ostream& os, const session_config& cfg) {
        os << "session_config{"
           << "blocks=" << cfg.blocks_per_queue << ", "
           << "frames_per_block=" << cfg.frames_per_block << ", "
           << "channels=" << static_cast<int>(cfg.channels) << ", "
           << "rate=" << cfg.sample_rate << ", "
           << "period=" << cfg.effective_period_frames() << ", "
           << "device=\"" << cfg.device_id << "\""
           << "}";
        return os;
    }

} // namespace ringplay
