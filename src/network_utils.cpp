// cppcheck-suppress-file missingIncludeSystem
#include "network_utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "utils.hpp"

namespace netward {

namespace {

bool parse_port_value(const std::string& text, uint16_t& out)
{
    uint64_t v = 0;
    if (text.size() > 5 || !parse_uint64(text, v) || v == 0 || v > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(v);
    return true;
}

} // namespace

bool parse_ipv4(const std::string& text, uint32_t& out)
{
    const auto parts = split(text, '.');
    if (parts.size() != 4) {
        return false;
    }
    uint32_t addr = 0;
    for (const auto& part : parts) {
        uint64_t octet = 0;
        if (part.empty() || part.size() > 3 || !parse_uint64(part, octet) || octet > 255) {
            return false;
        }
        // Leading zeros are ambiguous (octal in some parsers).
        if (part.size() > 1 && part[0] == '0') {
            return false;
        }
        addr = (addr << 8) | static_cast<uint32_t>(octet);
    }
    out = addr;
    return true;
}

std::string format_ipv4(uint32_t addr)
{
    return std::to_string((addr >> 24) & 0xff) + "." + std::to_string((addr >> 16) & 0xff) + "." +
           std::to_string((addr >> 8) & 0xff) + "." + std::to_string(addr & 0xff);
}

uint32_t prefix_to_mask(uint8_t prefix_len)
{
    if (prefix_len == 0) {
        return 0;
    }
    if (prefix_len >= 32) {
        return 0xffffffffu;
    }
    return 0xffffffffu << (32 - prefix_len);
}

bool parse_cidr_v4(const std::string& text, uint32_t& addr, uint8_t& prefix_len, std::string& error)
{
    const std::string t = trim(text);
    if (t.empty()) {
        error = "address is empty";
        return false;
    }
    if (t.find(':') != std::string::npos) {
        error = "IPv6 addresses are not supported";
        return false;
    }

    std::string ip_part = t;
    uint8_t prefix = 32;
    const size_t slash = t.find('/');
    if (slash != std::string::npos) {
        ip_part = t.substr(0, slash);
        const std::string prefix_part = t.substr(slash + 1);
        uint64_t v = 0;
        if (prefix_part.empty() || prefix_part.size() > 2 || !parse_uint64(prefix_part, v) || v > 32) {
            error = "invalid CIDR prefix length '" + prefix_part + "' (expected 0-32)";
            return false;
        }
        prefix = static_cast<uint8_t>(v);
    }

    uint32_t parsed = 0;
    if (!parse_ipv4(ip_part, parsed)) {
        error = "invalid IPv4 address '" + ip_part + "'";
        return false;
    }
    addr = parsed & prefix_to_mask(prefix);
    prefix_len = prefix;
    return true;
}

bool parse_port_spec(const std::string& text, std::vector<PortRange>& out, std::string& error)
{
    const std::string t = trim(text);
    if (t.empty()) {
        error = "port specification is empty";
        return false;
    }

    std::vector<PortRange> ranges;
    for (const auto& raw : split(t, ',')) {
        const std::string item = trim(raw);
        if (item.empty()) {
            error = "empty element in port list '" + t + "'";
            return false;
        }
        PortRange range;
        const size_t dash = item.find('-');
        if (dash == std::string::npos) {
            if (!parse_port_value(item, range.low)) {
                error = "invalid port '" + item + "' (expected 1-65535)";
                return false;
            }
            range.high = range.low;
        } else {
            const std::string lo = trim(item.substr(0, dash));
            const std::string hi = trim(item.substr(dash + 1));
            if (!parse_port_value(lo, range.low) || !parse_port_value(hi, range.high)) {
                error = "invalid port range '" + item + "' (expected 1-65535)";
                return false;
            }
            if (range.low > range.high) {
                error = "port range '" + item + "' has start greater than end";
                return false;
            }
        }
        ranges.push_back(range);
    }

    std::sort(ranges.begin(), ranges.end(),
              [](const PortRange& a, const PortRange& b) { return a.low < b.low || (a.low == b.low && a.high < b.high); });
    std::vector<PortRange> merged;
    for (const auto& r : ranges) {
        if (!merged.empty() && static_cast<uint32_t>(r.low) <= static_cast<uint32_t>(merged.back().high) + 1) {
            merged.back().high = std::max(merged.back().high, r.high);
        } else {
            merged.push_back(r);
        }
    }
    out = std::move(merged);
    return true;
}

bool is_image_name(const std::string& process)
{
    if (process.empty()) {
        return false;
    }
    for (char c : process) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

bool validate_process_path(const std::string& process, std::string& error)
{
    if (process.empty()) {
        error = "process must not be empty";
        return false;
    }
    if (process.size() >= kProcessPathMax) {
        error = "process exceeds " + std::to_string(kProcessPathMax - 1) + " bytes";
        return false;
    }
    for (char c : process) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            error = "process contains control characters";
            return false;
        }
    }
    if (process.find("..") != std::string::npos) {
        error = "process must not contain '..'";
        return false;
    }
    if (process[0] == '/') {
        if (process.back() == '/') {
            error = "process path must name a file, not a directory";
            return false;
        }
        return true;
    }
    if (!is_image_name(process)) {
        error = "process must be an absolute path or a bare image name";
        return false;
    }
    return true;
}

} // namespace netward
