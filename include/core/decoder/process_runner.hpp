#pragma once

#include <string>
#include <vector>

/**
 * @brief Outcome of one external command
 */
struct ProcessResult
{
    int exit_code = -1;
    bool timed_out = false;
    std::string output; // Combined stdout and stderr

    bool succeeded() const { return exit_code == 0 && !timed_out; }
};

/**
 * @brief Runs external tools (ffmpeg, ffprobe) through the shell with a wall-clock limit
 */
class ProcessRunner
{
public:
    /**
     * @brief Run a command under coreutils timeout(1)
     * @param args Program followed by its arguments; each is shell-quoted
     * @param timeout_seconds Kill the command after this many seconds, 0 disables the limit
     * @return Exit status and captured output
     * @throws ExternalProcessError if the shell cannot be started
     */
    static ProcessResult run(const std::vector<std::string> &args, int timeout_seconds);

    /**
     * @brief Quote one argument for /bin/sh
     */
    static std::string shellQuote(const std::string &arg);

    // Exit status timeout(1) reports when it killed the command
    static constexpr int TIMEOUT_EXIT_CODE = 124;
};
