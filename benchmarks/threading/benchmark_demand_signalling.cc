// Demand channel benchmarks: cost of the real-time side send and of a full
// wakeup round trip to a waiting producer thread
#include <nanobench.h>
#include <ringplay/demand_channel.hh>
#include <atomic>
#include <chrono>
#include <thread>

namespace ringplay::benchmark {

void register_demand_signalling_benchmarks(ankerl::nanobench::Bench& bench) {
    {
        demand_channel channel;
        bench.run("demand send (coalesced)", [&] {
            channel.send(256);
        });
    }

    {
        demand_channel channel;
        bench.run("demand send + try_receive", [&] {
            channel.send(256);
            ankerl::nanobench::doNotOptimizeAway(channel.try_receive());
        });
    }

    // Round trip: the waiter answers each demand through a second channel
    {
        demand_channel request;
        demand_channel reply;
        std::atomic<bool> done{false};
        std::thread waiter([&] {
            while (!done.load(std::memory_order_acquire)) {
                if (auto d = request.wait(std::chrono::milliseconds(10))) {
                    reply.send(*d);
                }
            }
        });

        bench.run("demand wakeup round trip", [&] {
            request.send(256);
            ankerl::nanobench::doNotOptimizeAway(reply.wait(std::chrono::milliseconds(100)));
        });

        done.store(true, std::memory_order_release);
        request.close();
        waiter.join();
    }
}

} // namespace ringplay::benchmark
