// Sample ring and consumer callback benchmarks
#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <ringplay/block_consumer.hh>
#include <ringplay/block_producer.hh>
#include <ringplay/demand_channel.hh>
#include <ringplay/diagnostics.hh>
#include <ringplay/sample_ring.hh>
#include <string>
#include <vector>

namespace ringplay::benchmark {

void register_ring_operation_benchmarks(ankerl::nanobench::Bench& bench) {
    // === produce_block + try_consume, one block at a time ===
    for (frames_t frames : {64u, 128u, 512u}) {
        sample_ring ring(8, frames, 2);
        std::vector<float> block(ring.block_samples(), 0.25f);
        std::vector<float> out(ring.block_samples());

        bench.run("ring produce+consume " + std::to_string(frames) + " frames", [&] {
            ring.produce_block(block.data());
            ankerl::nanobench::doNotOptimizeAway(ring.try_consume(out.data(), ring.block_samples()));
        });
    }

    // === try_consume that straddles the wrap point ===
    {
        sample_ring ring(4, 128, 2);
        std::vector<float> block(ring.block_samples(), 0.5f);
        std::vector<float> out(200);
        bench.run("ring consume 200 samples (wrapping)", [&] {
            while (ring.free_space() >= ring.block_samples()) {
                ring.produce_block(block.data());
            }
            ankerl::nanobench::doNotOptimizeAway(ring.try_consume(out.data(), 200));
        });
    }

    // === underrun path: silence + demand ===
    {
        sample_ring ring(8, 128, 2);
        demand_channel demands;
        block_consumer consumer(ring, demands, 128);
        std::vector<float> out(256);
        bench.run("consumer underrun (silence + demand)", [&] {
            consumer.process(out.data(), 128);
            ankerl::nanobench::doNotOptimizeAway(demands.try_receive());
        });
    }

    // === delivered path with refill through the producer's fill cycle ===
    {
        sample_ring ring(8, 128, 2);
        demand_channel demands;
        diagnostics diag;
        benchmark_engine engine(2);
        block_consumer consumer(ring, demands, 128);
        block_producer producer(ring, engine, demands, diag);
        producer.prime();
        std::vector<float> out(256);

        bench.run("consumer deliver + producer fill", [&] {
            consumer.process(out.data(), 128);
            if (auto demand = demands.try_receive()) {
                producer.fill(*demand);
            }
        });
    }
}

} // namespace ringplay::benchmark
