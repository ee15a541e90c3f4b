#include "core/decoder/process_runner.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <cstdio>
#include <sys/wait.h>

std::string ProcessRunner::shellQuote(const std::string &arg)
{
    std::string quoted = "'";
    for (char c : arg)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

ProcessResult ProcessRunner::run(const std::vector<std::string> &args, int timeout_seconds)
{
    if (args.empty())
    {
        throw ExternalProcessError("No command given", -1, false);
    }

    std::string command;
    if (timeout_seconds > 0)
    {
        command = "timeout " + std::to_string(timeout_seconds) + " ";
    }
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
        {
            command += " ";
        }
        command += shellQuote(args[i]);
    }
    command += " 2>&1";

    Logger::debug("Running: " + command);

    FILE *pipe = popen(command.c_str(), "r");
    if (!pipe)
    {
        throw ExternalProcessError("Failed to execute command: " + args[0], -1, false);
    }

    ProcessResult result;
    char buffer[1024];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
    {
        result.output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1)
    {
        throw ExternalProcessError("Failed to collect exit status of " + args[0], -1, false);
    }

    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
        result.timed_out = timeout_seconds > 0 && result.exit_code == TIMEOUT_EXIT_CODE;
    }
    else if (WIFSIGNALED(status))
    {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (!result.succeeded())
    {
        Logger::debug(args[0] + " exited with code " + std::to_string(result.exit_code) +
                      (result.timed_out ? " (timed out)" : ""));
    }
    return result;
}
