#pragma once

#include <chrono>
#include <cstdint>
#include "streamgate.pb.h"

namespace streams::configurations {
    constexpr std::uint32_t default_readiness_check_interval = 1;
    constexpr std::uint64_t default_initial_stall_wait_ms = 1000;
    // a stalled writer re-samples readiness at least this often.
    constexpr std::chrono::milliseconds max_stall_wait_slice = std::chrono::minutes(1);

    streamgate::WriterConfigs create_writer_configs(
        std::uint32_t readiness_check_interval = default_readiness_check_interval,
        std::uint64_t initial_stall_wait_ms = default_initial_stall_wait_ms
    );

    // throws std::invalid_argument on configurations a writer can't run with.
    void inspect_configs(const streamgate::WriterConfigs &cnfgs);

    // the wait slice following an expired one: doubled, capped at max_stall_wait_slice.
    std::chrono::milliseconds next_stall_wait_slice(std::chrono::milliseconds current);
}
