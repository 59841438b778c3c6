#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace whos_home::discovery
{
    enum class CommandStatus
    {
        Exited,
        NotFound,
        TimedOut,
        SpawnFailed
    };

    struct CommandResult
    {
        CommandStatus status = CommandStatus::SpawnFailed;
        int exit_code = -1;
        std::string output;

        bool Succeeded() const { return status == CommandStatus::Exited && exit_code == 0; }
        bool Launched() const { return status != CommandStatus::NotFound && status != CommandStatus::SpawnFailed; }

        static CommandResult Exit(int code, std::string output = "")
        {
            return {CommandStatus::Exited, code, std::move(output)};
        }
        static CommandResult Missing() { return {CommandStatus::NotFound, -1, ""}; }
        static CommandResult Timeout() { return {CommandStatus::TimedOut, -1, ""}; }
    };

    // Runs an external tool by name and captures its stdout. Implementations must
    // return within the supplied timeout and must be safe to call from many threads.
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;
        virtual CommandResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) = 0;
    };

    std::string DescribeCommand(const std::vector<std::string> &argv);
}
