#include <ringplay/diagnostics.hh>
#include <ringplay/block_consumer.hh>
#include <failsafe/failsafe.hh>
#include <iterator>
#include <utility>
#include <vector>

namespace ringplay {

    void diagnostics::record_underrun(samples_t needed, samples_t available, uint64_t count) {
        LOG_WARN("diagnostics", "Underrun: need", needed, "have", available, "(", count, "callbacks silenced)");
        diagnostic_event ev;
        ev.kind = diagnostic_kind::underrun;
        ev.needed = needed;
        ev.available = available;
        ev.count = count;
        push(std::move(ev));
    }

    void diagnostics::record_compute_error(const std::string& message) {
        LOG_ERROR("diagnostics", "Compute engine failed:", message);
        diagnostic_event ev;
        ev.kind = diagnostic_kind::compute_error;
        ev.message = message;
        push(std::move(ev));
    }

    void diagnostics::record_info(const std::string& message) {
        LOG_INFO("diagnostics", message);
        diagnostic_event ev;
        ev.kind = diagnostic_kind::info;
        ev.message = message;
        push(std::move(ev));
    }

    bool diagnostics::collect_underruns(const block_consumer& consumer) {
        const auto stats = consumer.stats();
        uint64_t fresh = 0;
        {
            std::lock_guard <std::mutex> lk(m_mutex);
            if (stats.underruns <= m_reported_underruns) {
                return false;
            }
            fresh = stats.underruns - m_reported_underruns;
            m_reported_underruns = stats.underruns;
        }
        record_underrun(stats.last_needed, stats.last_available, fresh);
        return true;
    }

    std::size_t diagnostics::dispatch(const handler_t& handler) {
        // 1) snapshot & clear under lock
        std::vector <diagnostic_event> to_dispatch; {
            std::lock_guard <std::mutex> lk(m_mutex);
            to_dispatch.assign(std::make_move_iterator(m_queue.begin()),
                               std::make_move_iterator(m_queue.end()));
            m_queue.clear();
        }

        // 2) invoke each outside the lock
        if (handler) {
            for (const auto& ev : to_dispatch) {
                handler(ev);
            }
        }
        return to_dispatch.size();
    }

    void diagnostics::clear() {
        std::lock_guard <std::mutex> lk(m_mutex);
        m_queue.clear();
    }

    std::size_t diagnostics::pending() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_queue.size();
    }

    uint64_t diagnostics::compute_errors() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_compute_errors;
    }

    uint64_t diagnostics::underrun_events() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_underrun_events;
    }

    void diagnostics::push(diagnostic_event ev) {
        std::lock_guard <std::mutex> lk(m_mutex);
        if (ev.kind == diagnostic_kind::compute_error) {
            ++m_compute_errors;
        } else if (ev.kind == diagnostic_kind::underrun) {
            ++m_underrun_events;
        }
        m_queue.emplace_back(std::move(ev));
    }

} // namespace ringplay
