#pragma once

#include <atomic>
#include <string>

class CLI {
public:
    /// Parse argv and dispatch to a subcommand.
    /// Returns the exit code: 0 success, 1 failure, 2 usage error
    /// (`diagnose` returns its report code).
    static int run(int argc, char* argv[], const std::atomic<bool>* cancel = nullptr);

    /// Whole-string decimal parse.
    static bool parse_int(const char* text, int& out);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_diagnose(const std::atomic<bool>* cancel);
    static int cmd_start(int argc, char* argv[], const std::atomic<bool>* cancel);
    static int cmd_stop(int argc, char* argv[], bool force, const std::atomic<bool>* cancel);
    static int cmd_stop_all(const std::atomic<bool>* cancel);
    static int cmd_create(int argc, char* argv[], const std::atomic<bool>* cancel);
    static int cmd_delete(int argc, char* argv[]);
    static int cmd_proxy_create(int argc, char* argv[]);

    static int usage(const std::string& message);
};
