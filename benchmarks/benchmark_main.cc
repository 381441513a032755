#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <iostream>

// Declare benchmark suites
namespace ringplay::benchmark {
    void register_ring_operation_benchmarks(ankerl::nanobench::Bench& bench);
    void register_demand_signalling_benchmarks(ankerl::nanobench::Bench& bench);
}

int main() {
    std::cout << "Running ringplay benchmarks...\n\n";

    {
        ankerl::nanobench::Bench bench;
        bench.title("ringplay pipeline benchmarks");
        bench.relative(true);
        bench.performanceCounters(true);

        ringplay::benchmark::register_ring_operation_benchmarks(bench);
        ringplay::benchmark::register_demand_signalling_benchmarks(bench);
    }

    return 0;
}
