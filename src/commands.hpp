// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace netward {

int cmd_validate(const std::string& path, bool verbose);
int cmd_apply(const std::string& path);
int cmd_rollback();
int cmd_lkg_show(bool json_output = false);
int cmd_lkg_revert();
int cmd_status(bool json_output = false);

struct LogsOptions {
    size_t tail = 20;
    uint32_t since_minutes = 0; // non-zero takes precedence over tail
    bool json_output = false;
};

int cmd_logs(const LogsOptions& options);
int cmd_history_list(size_t limit, bool json_output = false);
int cmd_history_show(const std::string& id);

struct SimulateOptions {
    std::string policy_path;
    std::string direction = "outbound";
    std::string protocol = "tcp";
    std::string remote_ip;
    std::string remote_port;
    std::string local_ip;
    std::string local_port;
    std::string process;
    bool json_output = false;
};

int cmd_simulate(const SimulateOptions& options);

} // namespace netward
