#pragma once

#include "CommandRunner.hpp"

namespace whos_home::discovery
{
    class PosixCommandRunner : public CommandRunner
    {
    public:
        CommandResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override;

    private:
        static void Reap(int pid, int &status_out);
    };
}
