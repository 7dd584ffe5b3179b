// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace netward {

// Dotted-quad IPv4 to host byte order.
bool parse_ipv4(const std::string& text, uint32_t& out);
std::string format_ipv4(uint32_t addr);

uint32_t prefix_to_mask(uint8_t prefix_len);

// Address or address/prefix. Host bits are cleared on success.
bool parse_cidr_v4(const std::string& text, uint32_t& addr, uint8_t& prefix_len, std::string& error);

// "80", "8000-9000", "80,443,8000-9000". Output is sorted with overlaps merged.
bool parse_port_spec(const std::string& text, std::vector<PortRange>& out, std::string& error);

// Absolute path without ".." segments, or a bare image name such as "curl.exe".
bool validate_process_path(const std::string& process, std::string& error);

bool is_image_name(const std::string& process);

} // namespace netward
