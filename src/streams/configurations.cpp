#include "configurations.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

streamgate::WriterConfigs
streams::configurations::create_writer_configs(std::uint32_t readiness_check_interval,
                                               std::uint64_t initial_stall_wait_ms) {
    streamgate::WriterConfigs c;
    c.set_readiness_check_interval(readiness_check_interval);
    c.set_initial_stall_wait_ms(initial_stall_wait_ms);
    return c;
}

void streams::configurations::inspect_configs(const streamgate::WriterConfigs &cnfgs) {
    if (cnfgs.readiness_check_interval() == 0) {
        throw std::invalid_argument("readiness check interval must be positive");
    }
    if (cnfgs.initial_stall_wait_ms() == 0) {
        throw std::invalid_argument("initial stall wait must be positive");
    }
    if (cnfgs.initial_stall_wait_ms() > std::uint64_t(max_stall_wait_slice.count())) {
        throw std::invalid_argument(
            "initial stall wait must be at most " + std::to_string(max_stall_wait_slice.count()) + "ms");
    }
}

std::chrono::milliseconds streams::configurations::next_stall_wait_slice(std::chrono::milliseconds current) {
    return std::min(current * 2, max_stall_wait_slice);
}
