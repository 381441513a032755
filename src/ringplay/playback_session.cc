#include <ringplay/playback_session.hh>
#include <ringplay/block_producer.hh>
#include <ringplay/demand_channel.hh>
#include <ringplay/sample_ring.hh>
#include <ringplay/sdk/audio_backend.hh>
#include <ringplay/sdk/compute_engine.hh>
#include <ringplay/error.hh>
#include <failsafe/failsafe.hh>
#include <mutex>
#include <sstream>
#include <string>

namespace ringplay {

struct playback_session::impl {
    // Order matters! Members are destroyed in reverse order of declaration,
    // so the stream (real-time side) goes before the producer, and both go
    // before the ring they share.
    std::shared_ptr<audio_backend> backend;
    std::shared_ptr<compute_engine> engine;
    session_config config;
    audio_spec device_spec;

    demand_channel demands;
    diagnostics diag;

    std::unique_ptr<sample_ring> ring;
    std::unique_ptr<block_consumer> consumer;
    std::unique_ptr<block_producer> producer;
    uint32_t device_handle = 0;
    std::unique_ptr<audio_stream_interface> stream;

    bool running = false;
    mutable std::mutex mutex;

    void teardown();
};

void playback_session::impl::teardown() {
    // 1. detach the real-time context
    if (stream) {
        stream->pause();
        stream->unbind_from_device();
        stream.reset();
    }
    if (device_handle) {
        backend->pause_device(device_handle);
        backend->close_device(device_handle);
        device_handle = 0;
    }

    // 2. stop the producer; report what the consumer saw last
    if (producer) {
        producer->stop();
        producer.reset();
    }
    if (consumer) {
        diag.collect_underruns(*consumer);
    }

    // 3. release the shared memory
    consumer.reset();
    ring.reset();
    running = false;
}

playback_session::playback_session(std::shared_ptr<audio_backend> backend,
                                   std::shared_ptr<compute_engine> engine,
                                   session_config config)
    : m_pimpl(std::make_unique<impl>()) {
    if (!backend) {
        THROW_RUNTIME("Backend is null");
    }
    if (!engine) {
        THROW_RUNTIME("Engine is null");
    }
    m_pimpl->backend = std::move(backend);
    m_pimpl->engine = std::move(engine);
    m_pimpl->config = std::move(config);
}

playback_session::~playback_session() {
    if (m_pimpl) {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        m_pimpl->teardown();
    }
}

void playback_session::start() {
    std::lock_guard<std::mutex> lock(m_pimpl->mutex);
    auto& p = *m_pimpl;

    if (p.running) {
        throw state_error("playback_session: already running");
    }
    if (!p.backend->is_initialized()) {
        THROW_RUNTIME("Backend is not initialized");
    }

    const auto& cfg = p.config;
    cfg.validate();
    if (p.engine->channels() != cfg.channels) {
        throw config_error("Engine '" + p.engine->get_name() + "' produces " +
                           std::to_string(p.engine->channels()) + " channels, session expects " +
                           std::to_string(cfg.channels));
    }

    try {
        p.engine->prepare(cfg.sample_rate, cfg.frames_per_block);

        p.ring = std::make_unique<sample_ring>(cfg.blocks_per_queue, cfg.frames_per_block, cfg.channels);
        p.consumer = std::make_unique<block_consumer>(*p.ring, p.demands, cfg.effective_period_frames());
        p.producer = std::make_unique<block_producer>(*p.ring, *p.engine, p.demands, p.diag, p.consumer.get());

        const auto primed = p.producer->prime();
        if (primed.failed) {
            LOG_WARN("playback_session", "Initial fill stopped after", primed.blocks_produced, "blocks");
        }
        p.producer->start();

        audio_spec wanted;
        wanted.format = audio_format::f32le;
        wanted.channels = cfg.channels;
        wanted.freq = cfg.sample_rate;
        wanted.period_frames = cfg.effective_period_frames();

        p.device_handle = p.backend->open_device(cfg.device_id, wanted, p.device_spec);
        if (p.device_spec.freq != wanted.freq || p.device_spec.channels != wanted.channels) {
            LOG_INFO("playback_session", "Device runs at", p.device_spec.freq, "Hz,",
                     static_cast<int>(p.device_spec.channels), "channels; the backend converts");
        }

        p.stream = p.backend->create_stream(p.device_handle, wanted,
                                            &block_consumer::audio_callback, p.consumer.get());
        p.backend->resume_device(p.device_handle);
        p.stream->resume();
        p.running = true;
    } catch (...) {
        p.teardown();
        throw;
    }

    std::ostringstream msg;
    msg << "Playback started on " << p.backend->get_name() << ": " << cfg;
    p.diag.record_info(msg.str());
}

void playback_session::stop() {
    std::lock_guard<std::mutex> lock(m_pimpl->mutex);
    if (!m_pimpl->running) {
        return;
    }
    m_pimpl->teardown();
    m_pimpl->diag.record_info("Playback stopped");
}

bool playback_session::is_running() const {
    std::lock_guard<std::mutex> lock(m_pimpl->mutex);
    return m_pimpl->running;
}

std::size_t playback_session::dispatch_diagnostics(const diagnostics::handler_t& handler) {
    return m_pimpl->diag.dispatch(handler);
}

diagnostics& playback_session::get_diagnostics() {
    return m_pimpl->diag;
}

const sample_ring* playback_session::ring() const {
    std::lock_guard<std::mutex> lock(m_pimpl->mutex);
    return m_pimpl->ring.get();
}

consumer_stats playback_session::get_consumer_stats() const {
    std::lock_guard<std::mutex> lock(m_pimpl->mutex);
    if (!m_pimpl->consumer) {
        return {};
    }
    return m_pimpl->consumer->stats();
}

uint64_t playback_session::engine_calls() const {
    std::lock_guard<std::mutex> lock(m_pimpl->mutex);
    if (!m_pimpl->producer) {
        return 0;
    }
    return m_pimpl->producer->engine_calls();
}

const session_config& playback_session::config() const {
    return m_pimpl->config;
}

audio_spec playback_session::device_spec() const {
    std::lock_guard<std::mutex> lock(m_pimpl->mutex);
    return m_pimpl->device_spec;
}

} // namespace ringplay
