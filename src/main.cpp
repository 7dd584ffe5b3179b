// cppcheck-suppress-file missingIncludeSystem
#include <getopt.h>

#include <cstdint>
#include <iostream>
#include <string>

#include "commands.hpp"
#include "config.hpp"
#include "daemon.hpp"
#include "logging.hpp"
#include "utils.hpp"

using namespace netward;

namespace {

int usage(const char* prog, int code)
{
    std::ostream& out = code == 0 ? std::cout : std::cerr;
    out << "Usage: " << prog << " <command> [options]\n\n"
        << "Commands:\n"
        << "  validate <file> [--verbose]          Validate and compile a policy without applying it\n"
        << "  apply <file>                         Apply a policy to the native filter store\n"
        << "  rollback                             Remove every filter owned by netward\n"
        << "  lkg show [--json]                    Show the last-known-good baseline\n"
        << "  lkg revert                           Re-apply the last-known-good baseline\n"
        << "  status [--json]                      Show filter count, baseline and last operation\n"
        << "  logs [--tail N] [--since MIN] [--json]\n"
        << "                                       Show recent audit entries, newest first\n"
        << "  history list [--limit N] [--json]    List committed policy versions, newest first\n"
        << "  history show <id>                    Print the policy document of one version\n"
        << "  simulate <file> --remote-ip IP --remote-port PORT\n"
        << "           [--direction inbound|outbound] [--protocol tcp|udp]\n"
        << "           [--local-ip IP] [--local-port PORT] [--process PATH] [--json]\n"
        << "  daemon --watch <file> [--debounce-ms MS] [--no-initial-apply]\n";
    return code;
}

// getopt_long over argv[1..]: argv[1] is the command name and plays argv[0].
int parse_json_flag(int argc, char** argv, bool& json_output)
{
    static const option lopts[] = {{"json", no_argument, nullptr, 'j'}, {"help", no_argument, nullptr, 'h'},
                                   {nullptr, 0, nullptr, 0}};
    optind = 1;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "jh", lopts, nullptr)) != -1) {
        switch (opt) {
            case 'j':
                json_output = true;
                break;
            case 'h':
                return 2;
            default:
                return 1;
        }
    }
    return optind == argc ? 0 : 1;
}

int run_validate(int argc, char** argv, const char* prog)
{
    static const option lopts[] = {{"verbose", no_argument, nullptr, 'v'}, {nullptr, 0, nullptr, 0}};
    bool verbose = false;
    optind = 1;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "v", lopts, nullptr)) != -1) {
        if (opt != 'v') {
            return usage(prog, 1);
        }
        verbose = true;
    }
    if (optind + 1 != argc) {
        return usage(prog, 1);
    }
    return cmd_validate(argv[optind], verbose);
}

int run_simulate(int argc, char** argv, const char* prog)
{
    static const option lopts[] = {{"direction", required_argument, nullptr, 'd'},
                                   {"protocol", required_argument, nullptr, 'P'},
                                   {"remote-ip", required_argument, nullptr, 'r'},
                                   {"remote-port", required_argument, nullptr, 'p'},
                                   {"local-ip", required_argument, nullptr, 'l'},
                                   {"local-port", required_argument, nullptr, 'L'},
                                   {"process", required_argument, nullptr, 'x'},
                                   {"json", no_argument, nullptr, 'j'},
                                   {nullptr, 0, nullptr, 0}};
    SimulateOptions options;
    optind = 1;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "d:P:r:p:l:L:x:j", lopts, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                options.direction = optarg;
                break;
            case 'P':
                options.protocol = optarg;
                break;
            case 'r':
                options.remote_ip = optarg;
                break;
            case 'p':
                options.remote_port = optarg;
                break;
            case 'l':
                options.local_ip = optarg;
                break;
            case 'L':
                options.local_port = optarg;
                break;
            case 'x':
                options.process = optarg;
                break;
            case 'j':
                options.json_output = true;
                break;
            default:
                return usage(prog, 1);
        }
    }
    if (optind + 1 != argc || options.remote_ip.empty() || options.remote_port.empty()) {
        return usage(prog, 1);
    }
    options.policy_path = argv[optind];
    return cmd_simulate(options);
}

int run_logs(int argc, char** argv, const char* prog)
{
    static const option lopts[] = {{"tail", required_argument, nullptr, 't'},
                                   {"since", required_argument, nullptr, 's'},
                                   {"json", no_argument, nullptr, 'j'},
                                   {nullptr, 0, nullptr, 0}};
    LogsOptions options;
    optind = 1;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "t:s:j", lopts, nullptr)) != -1) {
        uint64_t v = 0;
        switch (opt) {
            case 't':
                if (!parse_uint64(optarg, v) || v == 0 || v > 100000) {
                    std::cerr << "--tail must be between 1 and 100000\n";
                    return 1;
                }
                options.tail = static_cast<size_t>(v);
                break;
            case 's':
                if (!parse_uint64(optarg, v) || v == 0 || v > 525600) {
                    std::cerr << "--since must be between 1 and 525600 minutes\n";
                    return 1;
                }
                options.since_minutes = static_cast<uint32_t>(v);
                break;
            case 'j':
                options.json_output = true;
                break;
            default:
                return usage(prog, 1);
        }
    }
    if (optind != argc) {
        return usage(prog, 1);
    }
    return cmd_logs(options);
}

int run_history(int argc, char** argv, const char* prog)
{
    // argv[0] is "history", argv[1] the action.
    if (argc < 2) {
        return usage(prog, 1);
    }
    const std::string action = argv[1];
    if (action == "show") {
        return argc == 3 ? cmd_history_show(argv[2]) : usage(prog, 1);
    }
    if (action != "list") {
        return usage(prog, 1);
    }

    static const option lopts[] = {{"limit", required_argument, nullptr, 'n'},
                                   {"json", no_argument, nullptr, 'j'},
                                   {nullptr, 0, nullptr, 0}};
    size_t limit = 0;
    bool json_output = false;
    optind = 1;
    int opt = 0;
    while ((opt = getopt_long(argc - 1, argv + 1, "n:j", lopts, nullptr)) != -1) {
        uint64_t v = 0;
        switch (opt) {
            case 'n':
                if (!parse_uint64(optarg, v) || v == 0) {
                    std::cerr << "--limit must be a positive number\n";
                    return 1;
                }
                limit = static_cast<size_t>(v);
                break;
            case 'j':
                json_output = true;
                break;
            default:
                return usage(prog, 1);
        }
    }
    if (optind != argc - 1) {
        return usage(prog, 1);
    }
    return cmd_history_list(limit, json_output);
}

int run_daemon(int argc, char** argv, const char* prog)
{
    static const option lopts[] = {{"watch", required_argument, nullptr, 'w'},
                                   {"debounce-ms", required_argument, nullptr, 'D'},
                                   {"no-initial-apply", no_argument, nullptr, 'N'},
                                   {nullptr, 0, nullptr, 0}};
    DaemonOptions options;
    optind = 1;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "w:D:N", lopts, nullptr)) != -1) {
        switch (opt) {
            case 'w':
                options.watch_path = optarg;
                break;
            case 'D': {
                uint64_t v = 0;
                if (!parse_uint64(optarg, v) || v < kDebounceMinMs || v > kDebounceMaxMs) {
                    std::cerr << "--debounce-ms must be between " << kDebounceMinMs << " and " << kDebounceMaxMs
                              << "\n";
                    return 1;
                }
                options.debounce_ms = static_cast<uint32_t>(v);
                break;
            }
            case 'N':
                options.initial_apply = false;
                break;
            default:
                return usage(prog, 1);
        }
    }
    if (optind != argc || options.watch_path.empty()) {
        return usage(prog, 1);
    }
    return daemon_run(options);
}

} // namespace

int main(int argc, char** argv)
{
    configure_logger_from_env();

    const char* prog = argv[0];
    if (argc < 2) {
        return usage(prog, 1);
    }
    const std::string command = argv[1];
    int sub_argc = argc - 1;
    char** sub_argv = argv + 1;

    if (command == "-h" || command == "--help" || command == "help") {
        return usage(prog, 0);
    }
    if (command == "validate") {
        return run_validate(sub_argc, sub_argv, prog);
    }
    if (command == "apply") {
        if (argc != 3) {
            return usage(prog, 1);
        }
        return cmd_apply(argv[2]);
    }
    if (command == "rollback") {
        return argc == 2 ? cmd_rollback() : usage(prog, 1);
    }
    if (command == "lkg") {
        if (argc < 3) {
            return usage(prog, 1);
        }
        const std::string action = argv[2];
        if (action == "revert") {
            return argc == 3 ? cmd_lkg_revert() : usage(prog, 1);
        }
        if (action == "show") {
            bool json_output = false;
            int rc = parse_json_flag(argc - 2, argv + 2, json_output);
            return rc == 0 ? cmd_lkg_show(json_output) : usage(prog, rc == 2 ? 0 : 1);
        }
        return usage(prog, 1);
    }
    if (command == "status") {
        bool json_output = false;
        int rc = parse_json_flag(sub_argc, sub_argv, json_output);
        return rc == 0 ? cmd_status(json_output) : usage(prog, rc == 2 ? 0 : 1);
    }
    if (command == "logs") {
        return run_logs(sub_argc, sub_argv, prog);
    }
    if (command == "history") {
        return run_history(sub_argc, sub_argv, prog);
    }
    if (command == "simulate") {
        return run_simulate(sub_argc, sub_argv, prog);
    }
    if (command == "daemon") {
        return run_daemon(sub_argc, sub_argv, prog);
    }

    std::cerr << "Unknown command: " << command << "\n";
    return usage(prog, 1);
}
