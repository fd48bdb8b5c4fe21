#pragma once

// Define different output modes for simulation results
enum class OutputMode {
    BENCHMARK,        // No output (for benchmarking)
    FILE_CSV          // CSV trajectory file
};
