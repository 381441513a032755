/**
 * @example 01_sine_playback.cc
 * @brief Play a sine tone through the block pipeline
 *
 * Usage: 01_sine_playback [--blocks N] [--frames N] [--channels N]
 *                         [--rate HZ] [--period N] [--freq HZ]
 *                         [--seconds N] [--device ID] [--null]
 *
 * Diagnostics (underruns, engine errors) are printed once per second from
 * the main thread.
 */

#include "example_common.hh"
#include <ringplay/playback_session.hh>
#include <ringplay/engines/sine_engine.hh>
#include <ringplay/error.hh>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

namespace {
    void print_usage(const char* prog) {
        std::cerr << "Usage: " << prog
                  << " [--blocks N] [--frames N] [--channels N] [--rate HZ] [--period N]"
                     " [--freq HZ] [--seconds N] [--device ID] [--null]\n";
    }

    void print_event(const ringplay::diagnostic_event& ev) {
        switch (ev.kind) {
            case ringplay::diagnostic_kind::underrun:
                std::cout << "  underrun x" << ev.count << " (needed " << ev.needed
                          << ", had " << ev.available << ")\n";
                break;
            case ringplay::diagnostic_kind::compute_error:
                std::cout << "  engine error: " << ev.message << "\n";
                break;
            case ringplay::diagnostic_kind::info:
                std::cout << "  " << ev.message << "\n";
                break;
        }
    }
}

int main(int argc, char* argv[]) {
    using ringplay::examples::parse_count;

    ringplay::session_config cfg;
    float frequency = 440.0f;
    unsigned long seconds = 3;
    bool headless = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--null") == 0) {
            headless = true;
        } else if (!has_value) {
            print_usage(argv[0]);
            return 1;
        } else if (std::strcmp(arg, "--blocks") == 0) {
            cfg.blocks_per_queue = parse_count(arg, argv[++i]);
        } else if (std::strcmp(arg, "--frames") == 0) {
            cfg.frames_per_block = static_cast<ringplay::frames_t>(parse_count(arg, argv[++i]));
        } else if (std::strcmp(arg, "--channels") == 0) {
            cfg.channels = static_cast<ringplay::channels_t>(parse_count(arg, argv[++i]));
        } else if (std::strcmp(arg, "--rate") == 0) {
            cfg.sample_rate = static_cast<ringplay::sample_rate_t>(parse_count(arg, argv[++i]));
        } else if (std::strcmp(arg, "--period") == 0) {
            cfg.period_frames = static_cast<ringplay::frames_t>(parse_count(arg, argv[++i]));
        } else if (std::strcmp(arg, "--freq") == 0) {
            frequency = static_cast<float>(std::atof(argv[++i]));
        } else if (std::strcmp(arg, "--seconds") == 0) {
            seconds = parse_count(arg, argv[++i]);
        } else if (std::strcmp(arg, "--device") == 0) {
            cfg.device_id = argv[++i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        auto backend = ringplay::examples::create_default_backend(headless);
        backend->init();

        auto engine = std::make_shared<ringplay::sine_engine>(cfg.channels, frequency);
        engine->set_frequency(frequency);
        ringplay::playback_session session(backend, engine, cfg);
        session.start();

        const auto spec = session.device_spec();
        std::cout << "Playing " << engine->get_name() << " on " << spec << "\n";

        for (unsigned long s = 0; s < seconds; ++s) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            session.dispatch_diagnostics(print_event);
            const auto stats = session.get_consumer_stats();
            std::cout << "[" << (s + 1) << "s] callbacks " << stats.callbacks
                      << ", underruns " << stats.underruns
                      << ", engine calls " << session.engine_calls() << "\n";
        }

        session.stop();
        session.dispatch_diagnostics(print_event);
        backend->shutdown();
    } catch (const ringplay::config_error& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
