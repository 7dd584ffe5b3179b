// cppcheck-suppress-file missingIncludeSystem
#include "types.hpp"

namespace netward {

const char* action_name(Action action)
{
    switch (action) {
        case Action::Block:
            return "block";
        case Action::Allow:
            return "allow";
    }
    return "block";
}

const char* direction_name(Direction direction)
{
    switch (direction) {
        case Direction::Inbound:
            return "inbound";
        case Direction::Outbound:
            return "outbound";
        case Direction::Both:
            return "both";
    }
    return "outbound";
}

const char* protocol_name(Protocol protocol)
{
    switch (protocol) {
        case Protocol::Any:
            return "any";
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Udp:
            return "udp";
    }
    return "any";
}

const char* layer_name(FilterLayer layer)
{
    switch (layer) {
        case FilterLayer::Connect4:
            return "connect4";
        case FilterLayer::Accept4:
            return "accept4";
    }
    return "connect4";
}

FilterLayer layer_for_direction(Direction direction)
{
    return direction == Direction::Inbound ? FilterLayer::Accept4 : FilterLayer::Connect4;
}

std::string filter_key_hex(const FilterKey& key)
{
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(key.size() * 2);
    for (uint8_t b : key) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0f]);
    }
    return out;
}

} // namespace netward
