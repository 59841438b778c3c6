#include "PosixCommandRunner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace whos_home::discovery
{
    std::string DescribeCommand(const std::vector<std::string> &argv)
    {
        std::string text;
        for (const auto &arg : argv)
        {
            if (!text.empty())
                text += " ";
            text += arg;
        }
        return text;
    }

    void PosixCommandRunner::Reap(int pid, int &status_out)
    {
        while (waitpid(pid, &status_out, 0) == -1 && errno == EINTR)
        {
        }
    }

    CommandResult PosixCommandRunner::Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
    {
        if (argv.empty())
            return {};

        const auto deadline = std::chrono::steady_clock::now() + timeout;

        // Everything is O_CLOEXEC so children spawned concurrently by other
        // threads never inherit our pipe ends and hold them open.
        int out_pipe[2];
        if (pipe2(out_pipe, O_CLOEXEC) == -1)
        {
            std::cerr << "[Command] pipe failed: " << std::strerror(errno) << "\n";
            return {};
        }

        int exec_pipe[2];
        if (pipe2(exec_pipe, O_CLOEXEC) == -1)
        {
            std::cerr << "[Command] pipe failed: " << std::strerror(errno) << "\n";
            close(out_pipe[0]);
            close(out_pipe[1]);
            return {};
        }

        int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        pid_t pid = fork();
        if (pid == -1)
        {
            std::cerr << "[Command] fork failed for '" << argv[0] << "': " << std::strerror(errno) << "\n";
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(exec_pipe[0]);
            close(exec_pipe[1]);
            if (devnull != -1)
                close(devnull);
            return {};
        }

        if (pid == 0)
        {
            dup2(out_pipe[1], STDOUT_FILENO);
            if (devnull != -1)
            {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
            execvp(args[0], args.data());

            int err = errno;
            ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        close(out_pipe[1]);
        close(exec_pipe[1]);
        if (devnull != -1)
            close(devnull);

        // EOF here means execvp succeeded; an errno payload means it did not.
        int exec_errno = 0;
        ssize_t n;
        do
        {
            n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        } while (n == -1 && errno == EINTR);
        close(exec_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(exec_errno)))
        {
            close(out_pipe[0]);
            int status = 0;
            Reap(pid, status);
            if (exec_errno == ENOENT)
                return CommandResult::Missing();
            return {};
        }

        std::string output;
        bool timed_out = false;
        char buffer[4096];

        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                timed_out = true;
                break;
            }

            struct pollfd pfd;
            pfd.fd = out_pipe[0];
            pfd.events = POLLIN;
            pfd.revents = 0;

            int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (rc == 0)
            {
                timed_out = true;
                break;
            }

            ssize_t got = read(out_pipe[0], buffer, sizeof(buffer));
            if (got > 0)
                output.append(buffer, static_cast<size_t>(got));
            else if (got == 0)
                break;
            else if (errno != EINTR)
                break;
        }
        close(out_pipe[0]);

        int status = 0;
        while (!timed_out)
        {
            pid_t reaped = waitpid(pid, &status, WNOHANG);
            if (reaped == pid)
                break;
            if (reaped == -1 && errno != EINTR)
            {
                std::cerr << "[Command] waitpid failed for '" << argv[0] << "': " << std::strerror(errno) << "\n";
                return {};
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        if (timed_out)
        {
            kill(pid, SIGKILL);
            Reap(pid, status);
            return CommandResult::Timeout();
        }

        if (WIFEXITED(status))
            return CommandResult::Exit(WEXITSTATUS(status), std::move(output));
        return CommandResult::Exit(128 + WTERMSIG(status), std::move(output));
    }
}
