// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace netward {

struct ConnectionTuple {
    Direction direction = Direction::Outbound; // Inbound or Outbound
    Protocol protocol = Protocol::Tcp;         // Tcp or Udp
    uint32_t remote_ip = 0;                    // host byte order
    uint16_t remote_port = 0;
    bool has_local_ip = false;
    uint32_t local_ip = 0;
    bool has_local_port = false;
    uint16_t local_port = 0;
    std::string process;
};

struct SimulationStep {
    std::string rule_id;
    Action action = Action::Block;
    uint64_t weight = 0;
    bool matched = false;
    std::string reason;
};

struct SimulationResult {
    bool matched = false;
    Action action = Action::Allow; // platform permit when nothing matched
    std::string rule_id;
    uint64_t weight = 0;
    bool default_fallthrough = false; // decided by the default-action catch-all
    std::vector<SimulationStep> trace; // evaluation order
};

// Evaluate compiled filters against one connection: the highest-weight
// match in the connection's layer decides.
Result<SimulationResult> simulate(const std::vector<CompiledFilter>& filters, const ConnectionTuple& conn);

Result<SimulationResult> simulate_policy(const Policy& policy, const ConnectionTuple& conn);

bool process_matches(const std::string& filter_process, const std::string& connection_process);

} // namespace netward
