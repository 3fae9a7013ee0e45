// Entry point for the benchmark binary. Runs every registered BENCHMARK()
// with the logger quieted, then joins the logger's writer thread.

#include "difflane/logger.h"
#include <benchmark/benchmark.h>

int main(int argc, char** argv) {
    difflane::Logger::setMinLogLevel(difflane::LogLevel::WARNING);

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();

    difflane::Logger::shutdown();
    return 0;
}
