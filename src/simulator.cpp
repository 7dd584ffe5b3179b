// cppcheck-suppress-file missingIncludeSystem
#include "simulator.hpp"

#include <algorithm>
#include <utility>

#include "compiler.hpp"
#include "network_utils.hpp"

namespace netward {

namespace {

std::string basename_of(const std::string& path)
{
    const size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool filter_matches(const CompiledFilter& f, const ConnectionTuple& conn, std::string& reason)
{
    if (f.protocol != Protocol::Any && f.protocol != conn.protocol) {
        reason = std::string("protocol mismatch: filter=") + protocol_name(f.protocol);
        return false;
    }
    if (f.has_remote_address && (conn.remote_ip & f.remote_mask) != f.remote_address) {
        reason = "remote address outside " + format_ipv4(f.remote_address);
        return false;
    }
    if (f.has_remote_ports && !f.remote_ports.contains(conn.remote_port)) {
        reason = "remote port outside " + std::to_string(f.remote_ports.low) + "-" + std::to_string(f.remote_ports.high);
        return false;
    }
    if (f.has_local_address) {
        if (!conn.has_local_ip) {
            reason = "filter requires local address";
            return false;
        }
        if ((conn.local_ip & f.local_mask) != f.local_address) {
            reason = "local address outside " + format_ipv4(f.local_address);
            return false;
        }
    }
    if (f.has_local_ports) {
        if (!conn.has_local_port) {
            reason = "filter requires local port";
            return false;
        }
        if (!f.local_ports.contains(conn.local_port)) {
            reason = "local port outside " + std::to_string(f.local_ports.low) + "-" + std::to_string(f.local_ports.high);
            return false;
        }
    }
    if (!f.process.empty()) {
        if (conn.process.empty()) {
            reason = "filter requires process";
            return false;
        }
        if (!process_matches(f.process, conn.process)) {
            reason = "process mismatch: filter=" + basename_of(f.process) + ", connection=" + basename_of(conn.process);
            return false;
        }
    }
    reason = f.is_default ? "default action" : "all conditions matched";
    return true;
}

} // namespace

bool process_matches(const std::string& filter_process, const std::string& connection_process)
{
    if (is_image_name(filter_process)) {
        return basename_of(connection_process) == filter_process;
    }
    return filter_process == connection_process;
}

Result<SimulationResult> simulate(const std::vector<CompiledFilter>& filters, const ConnectionTuple& conn)
{
    if (conn.direction == Direction::Both) {
        return Error::invalid_argument("Connection direction must be inbound or outbound");
    }
    if (conn.protocol == Protocol::Any) {
        return Error::invalid_argument("Connection protocol must be tcp or udp");
    }

    const FilterLayer layer = layer_for_direction(conn.direction);
    std::vector<const CompiledFilter*> candidates;
    for (const auto& f : filters) {
        if (f.layer == layer) {
            candidates.push_back(&f);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const CompiledFilter* a, const CompiledFilter* b) { return a->weight > b->weight; });

    SimulationResult result;
    for (const CompiledFilter* f : candidates) {
        SimulationStep step;
        step.rule_id = f->rule_id;
        step.action = f->action;
        step.weight = f->weight;
        step.matched = filter_matches(*f, conn, step.reason);
        if (step.matched && !result.matched) {
            result.matched = true;
            result.action = f->action;
            result.rule_id = f->rule_id;
            result.weight = f->weight;
            result.default_fallthrough = f->is_default;
        }
        result.trace.push_back(std::move(step));
    }
    return result;
}

Result<SimulationResult> simulate_policy(const Policy& policy, const ConnectionTuple& conn)
{
    auto filters = compile_policy(policy);
    if (!filters) {
        return filters.error();
    }
    return simulate(*filters, conn);
}

} // namespace netward
