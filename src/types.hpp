#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netward {

inline constexpr const char *kPinRoot = "/sys/fs/bpf/netward";
inline constexpr const char *kFilterMapPinName0 = "nw_filters_0";
inline constexpr const char *kFilterMapPinName1 = "nw_filters_1";
inline constexpr const char *kFilterSlotPinName = "nw_filter_slot";
inline constexpr const char *kMetaPinName = "nw_meta";
inline constexpr const char *kStateDir = "/var/lib/netward";
inline constexpr const char *kLkgPolicyPath = "/var/lib/netward/lkg-policy.json";
inline constexpr const char *kLastApplyPath = "/var/lib/netward/last-apply.json";
inline constexpr const char *kHistoryDir = "/var/lib/netward/history";
inline constexpr const char *kAuditLogPath = "/var/lib/netward/audit.jsonl";
inline constexpr const char *kApplyLockPath = "/run/netward/apply.lock";
inline constexpr uint32_t kLayoutVersion = 2;
inline constexpr uint32_t kOwnerMagic = 0x4e575244; // "NWRD"
inline constexpr size_t kMaxPolicyBytes = 1024 * 1024;
inline constexpr size_t kMaxRuleCountDefault = 10000;
inline constexpr uint32_t kMaxFiltersDefault = 65536;
inline constexpr size_t kRuleIdMax = 128;
inline constexpr size_t kCommentMax = 1024;
inline constexpr size_t kProcessPathMax = 256;
inline constexpr const char *kDefaultRuleId = "@default";

enum class Action : uint8_t {
    Block = 0,
    Allow = 1
};

enum class Direction : uint8_t {
    Inbound = 0,
    Outbound = 1,
    Both = 2
};

// Values match IPPROTO_* so they can be written to the map unchanged.
enum class Protocol : uint8_t {
    Any = 0,
    Tcp = 6,
    Udp = 17
};

// connect4 carries outbound filters, accept4 inbound ones.
enum class FilterLayer : uint8_t {
    Connect4 = 0,
    Accept4 = 1
};

inline constexpr std::array<FilterLayer, 2> kAllLayers = {FilterLayer::Connect4, FilterLayer::Accept4};

const char *action_name(Action action);
const char *direction_name(Direction direction);
const char *protocol_name(Protocol protocol);
const char *layer_name(FilterLayer layer);

FilterLayer layer_for_direction(Direction direction);

struct PortRange {
    uint16_t low = 0;
    uint16_t high = 0;

    bool operator==(const PortRange &other) const noexcept { return low == other.low && high == other.high; }
    [[nodiscard]] bool contains(uint16_t port) const noexcept { return port >= low && port <= high; }
};

struct EndpointSpec {
    bool has_address = false;
    uint32_t address = 0; // host byte order, already masked
    uint8_t prefix_len = 0;
    std::string ip_text;
    std::string ports_text;
    std::vector<PortRange> ports; // normalized: sorted, merged
};

struct Rule {
    std::string id;
    Action action = Action::Block;
    Direction direction = Direction::Outbound;
    Protocol protocol = Protocol::Any;
    std::string process;
    EndpointSpec local;
    EndpointSpec remote;
    int32_t priority = 0;
    bool enabled = true;
    std::string comment;
};

struct Policy {
    std::string version;
    Action default_action = Action::Allow;
    std::string updated_at;
    int64_t updated_at_unix = 0;
    std::vector<Rule> rules;
};

struct PolicyIssue {
    std::string path;
    std::string message;

    [[nodiscard]] std::string to_string() const { return path.empty() ? message : path + ": " + message; }
};

struct PolicyIssues {
    std::vector<PolicyIssue> errors;
    std::vector<PolicyIssue> warnings;

    [[nodiscard]] bool has_errors() const { return !errors.empty(); }
    [[nodiscard]] bool has_warnings() const { return !warnings.empty(); }
};

using FilterKey = std::array<uint8_t, 16>;

struct FilterKeyHash {
    std::size_t operator()(const FilterKey &key) const noexcept
    {
        // Keys are already uniformly distributed digest bytes.
        std::size_t h = 0;
        for (size_t i = 0; i < sizeof(std::size_t) && i < key.size(); ++i) {
            h = (h << 8) | key[i];
        }
        return h;
    }
};

std::string filter_key_hex(const FilterKey &key);

struct CompiledFilter {
    FilterKey key{};
    std::string rule_id;
    Direction direction = Direction::Outbound;
    FilterLayer layer = FilterLayer::Connect4;
    Action action = Action::Block;
    uint64_t weight = 0;
    Protocol protocol = Protocol::Any;
    bool has_local_address = false;
    uint32_t local_address = 0;
    uint32_t local_mask = 0;
    bool has_remote_address = false;
    uint32_t remote_address = 0;
    uint32_t remote_mask = 0;
    bool has_local_ports = false;
    PortRange local_ports;
    bool has_remote_ports = false;
    PortRange remote_ports;
    std::string process;
    bool is_default = false;
};

// What enumeration of the native store returns for one owned filter.
struct InstalledFilter {
    FilterKey key{};
    std::string rule_id;
    FilterLayer layer = FilterLayer::Connect4;
    Action action = Action::Block;
    uint64_t weight = 0;
};

enum FilterRecordFlags : uint8_t {
    FILTER_HAS_LOCAL_ADDR = 1 << 0,
    FILTER_HAS_REMOTE_ADDR = 1 << 1,
    FILTER_HAS_LOCAL_PORTS = 1 << 2,
    FILTER_HAS_REMOTE_PORTS = 1 << 3,
    FILTER_HAS_PROCESS = 1 << 4,
    FILTER_IS_DEFAULT = 1 << 5
};

// Value layout of the pinned filter maps; shared with the enforcement program.
struct __attribute__((packed)) BpfFilterRecord {
    uint32_t owner_magic;
    uint32_t layout_version;
    uint64_t weight;
    uint8_t layer;
    uint8_t action;
    uint8_t protocol;
    uint8_t flags;
    uint32_t local_addr; // network byte order
    uint32_t local_mask;
    uint32_t remote_addr;
    uint32_t remote_mask;
    uint16_t local_port_lo;
    uint16_t local_port_hi;
    uint16_t remote_port_lo;
    uint16_t remote_port_hi;
    char rule_id[kRuleIdMax + 1];
    char process[kProcessPathMax];
};

struct FilterMeta {
    uint32_t layout_version;
    uint32_t owner_magic;
    uint64_t generation; // bumped by every writer that takes the shadow map
};

} // namespace netward
