// cppcheck-suppress-file missingIncludeSystem
#include "compiler.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <unordered_set>
#include <utility>

#include "logging.hpp"
#include "network_utils.hpp"
#include "policy.hpp"
#include "sha256.hpp"

namespace netward {

namespace {

constexpr uint8_t kKeyEncodingVersion = 2;

void put_u8(std::string& out, uint8_t v)
{
    out.push_back(static_cast<char>(v));
}

void put_u16(std::string& out, uint16_t v)
{
    put_u8(out, static_cast<uint8_t>(v >> 8));
    put_u8(out, static_cast<uint8_t>(v));
}

void put_u32(std::string& out, uint32_t v)
{
    put_u16(out, static_cast<uint16_t>(v >> 16));
    put_u16(out, static_cast<uint16_t>(v));
}

// Length-prefixed so no two distinct strings encode alike.
void put_str(std::string& out, const std::string& s)
{
    put_u32(out, static_cast<uint32_t>(s.size()));
    out += s;
}

void apply_endpoint(const EndpointSpec& ep, bool& has_addr, uint32_t& addr, uint32_t& mask)
{
    has_addr = ep.has_address;
    if (ep.has_address) {
        mask = prefix_to_mask(ep.prefix_len);
        addr = ep.address & mask;
    }
}

Result<void> check_rule_invariants(const Rule& rule)
{
    if (!is_valid_rule_id(rule.id)) {
        return Error(ErrorCode::PolicyCompileFailed, "Rule has an invalid id", rule.id);
    }
    for (const EndpointSpec* ep : {&rule.local, &rule.remote}) {
        if (ep->has_address && ep->prefix_len > 32) {
            return Error(ErrorCode::PolicyCompileFailed, "Rule has an out-of-range prefix length", rule.id);
        }
        for (const auto& range : ep->ports) {
            if (range.low == 0 || range.low > range.high) {
                return Error(ErrorCode::PolicyCompileFailed, "Rule has an invalid port range", rule.id);
            }
        }
    }
    if (rule.process.size() >= kProcessPathMax) {
        return Error(ErrorCode::PolicyCompileFailed, "Rule process exceeds native limit", rule.id);
    }
    if (rule.protocol != Protocol::Any && rule.protocol != Protocol::Tcp && rule.protocol != Protocol::Udp) {
        return Error(ErrorCode::PolicyCompileFailed, "Rule has an unknown protocol", rule.id);
    }
    return {};
}

} // namespace

uint64_t compute_filter_weight(int32_t priority, uint32_t tie_rank)
{
    const uint64_t biased = static_cast<uint64_t>(static_cast<int64_t>(priority) + (int64_t{1} << 31));
    return (biased << 32) | static_cast<uint64_t>(0xFFFFFFFFu - tie_rank);
}

FilterKey compute_filter_key(const CompiledFilter& f)
{
    std::string enc;
    enc.reserve(96 + f.rule_id.size() + f.process.size());
    put_u8(enc, kKeyEncodingVersion);
    put_str(enc, f.rule_id);
    put_u8(enc, static_cast<uint8_t>(f.direction));
    put_u8(enc, static_cast<uint8_t>(f.layer));
    put_u8(enc, static_cast<uint8_t>(f.action));
    put_u8(enc, static_cast<uint8_t>(f.protocol));
    put_u8(enc, f.has_local_address ? 1 : 0);
    put_u32(enc, f.has_local_address ? f.local_address : 0);
    put_u32(enc, f.has_local_address ? f.local_mask : 0);
    put_u8(enc, f.has_remote_address ? 1 : 0);
    put_u32(enc, f.has_remote_address ? f.remote_address : 0);
    put_u32(enc, f.has_remote_address ? f.remote_mask : 0);
    put_u8(enc, f.has_local_ports ? 1 : 0);
    put_u16(enc, f.has_local_ports ? f.local_ports.low : 0);
    put_u16(enc, f.has_local_ports ? f.local_ports.high : 0);
    put_u8(enc, f.has_remote_ports ? 1 : 0);
    put_u16(enc, f.has_remote_ports ? f.remote_ports.low : 0);
    put_u16(enc, f.has_remote_ports ? f.remote_ports.high : 0);
    put_str(enc, f.process);
    put_u8(enc, f.is_default ? 1 : 0);

    const Sha256::Digest digest = Sha256::hash(enc);
    FilterKey key{};
    std::copy(digest.begin(), digest.begin() + static_cast<std::ptrdiff_t>(key.size()), key.begin());
    return key;
}

Result<std::vector<CompiledFilter>> compile_policy(const Policy& policy, CompileStats* stats)
{
    CompileStats local_stats{};
    CompileStats& st = stats ? *stats : local_stats;
    st = CompileStats{};
    st.rules_total = policy.rules.size();

    std::vector<CompiledFilter> out;
    std::unordered_set<FilterKey, FilterKeyHash> seen;
    std::map<int32_t, uint32_t> next_rank;
    bool layer_used[2] = {false, false};

    auto emit = [&](CompiledFilter&& filter) {
        filter.key = compute_filter_key(filter);
        if (!seen.insert(filter.key).second) {
            ++st.duplicates_dropped;
            logger().log(SLOG_DEBUG("Dropping duplicate compiled filter")
                             .field("rule_id", filter.rule_id)
                             .field("key", filter_key_hex(filter.key)));
            return;
        }
        out.push_back(std::move(filter));
    };

    for (const auto& rule : policy.rules) {
        // Disabled rules still hold their rank so toggling one never reorders its peers.
        uint32_t& rank = next_rank[rule.priority];
        if (rank == 0xFFFFFFFFu) {
            return Error(ErrorCode::PolicyCompileFailed, "Too many rules share one priority", rule.id);
        }
        const uint64_t weight = compute_filter_weight(rule.priority, rank++);

        if (!rule.enabled) {
            ++st.rules_disabled;
            continue;
        }
        TRY(check_rule_invariants(rule));

        std::vector<Direction> directions;
        if (rule.direction == Direction::Both) {
            directions = {Direction::Inbound, Direction::Outbound};
        } else {
            directions = {rule.direction};
        }

        std::vector<std::optional<PortRange>> local_ranges;
        std::vector<std::optional<PortRange>> remote_ranges;
        if (rule.local.ports.empty()) {
            local_ranges.emplace_back(std::nullopt);
        } else {
            local_ranges.assign(rule.local.ports.begin(), rule.local.ports.end());
        }
        if (rule.remote.ports.empty()) {
            remote_ranges.emplace_back(std::nullopt);
        } else {
            remote_ranges.assign(rule.remote.ports.begin(), rule.remote.ports.end());
        }

        for (Direction dir : directions) {
            for (const auto& lr : local_ranges) {
                for (const auto& rr : remote_ranges) {
                    CompiledFilter f;
                    f.rule_id = rule.id;
                    f.direction = dir;
                    f.layer = layer_for_direction(dir);
                    f.action = rule.action;
                    f.weight = weight;
                    f.protocol = rule.protocol;
                    apply_endpoint(rule.local, f.has_local_address, f.local_address, f.local_mask);
                    apply_endpoint(rule.remote, f.has_remote_address, f.remote_address, f.remote_mask);
                    if (lr) {
                        f.has_local_ports = true;
                        f.local_ports = *lr;
                    }
                    if (rr) {
                        f.has_remote_ports = true;
                        f.remote_ports = *rr;
                    }
                    f.process = rule.process;
                    layer_used[static_cast<size_t>(f.layer)] = true;
                    emit(std::move(f));
                }
            }
        }
    }

    for (FilterLayer layer : kAllLayers) {
        // An allow catch-all on an otherwise empty layer is the platform default already.
        if (!layer_used[static_cast<size_t>(layer)] && policy.default_action != Action::Block) {
            continue;
        }
        CompiledFilter f;
        f.rule_id = kDefaultRuleId;
        f.direction = layer == FilterLayer::Accept4 ? Direction::Inbound : Direction::Outbound;
        f.layer = layer;
        f.action = policy.default_action;
        f.weight = 0;
        f.is_default = true;
        emit(std::move(f));
        ++st.default_filters;
    }

    std::stable_sort(out.begin(), out.end(), [](const CompiledFilter& a, const CompiledFilter& b) {
        if (a.layer != b.layer) {
            return static_cast<uint8_t>(a.layer) < static_cast<uint8_t>(b.layer);
        }
        return a.weight > b.weight;
    });

    st.filters_emitted = out.size();
    return out;
}

} // namespace netward
