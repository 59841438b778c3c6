#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../discovery/CommandRunner.hpp"

namespace whos_home::fakes
{
    // Scripted stand-in for the OS. Every call is recorded as a joined command
    // line; the handler decides what the "tool" prints and how it exits.
    class FakeCommandRunner : public discovery::CommandRunner
    {
    public:
        using Handler = std::function<discovery::CommandResult(const std::string &command,
                                                               std::chrono::milliseconds timeout)>;

        struct Call
        {
            std::string command;
            std::chrono::milliseconds timeout;
        };

        explicit FakeCommandRunner(Handler handler = nullptr) : m_handler(std::move(handler)) {}

        void SetHandler(Handler handler)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_handler = std::move(handler);
        }

        discovery::CommandResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override
        {
            const std::string command = discovery::DescribeCommand(argv);
            Handler handler;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_calls.push_back({command, timeout});
                ++m_in_flight;
                m_max_in_flight = std::max(m_max_in_flight, m_in_flight);
                handler = m_handler;
            }

            discovery::CommandResult result = handler ? handler(command, timeout) : discovery::CommandResult::Missing();

            std::lock_guard<std::mutex> lock(m_mutex);
            --m_in_flight;
            return result;
        }

        std::vector<Call> Calls() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_calls;
        }

        std::vector<std::string> Commands() const
        {
            std::vector<std::string> out;
            for (const auto &call : Calls())
                out.push_back(call.command);
            return out;
        }

        std::size_t CountStartingWith(const std::string &prefix) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return static_cast<std::size_t>(std::count_if(m_calls.begin(), m_calls.end(),
                                                          [&](const Call &c)
                                                          { return StartsWith(c.command, prefix); }));
        }

        std::size_t MaxInFlight() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_max_in_flight;
        }

        static bool StartsWith(const std::string &text, const std::string &prefix)
        {
            return text.compare(0, prefix.size(), prefix) == 0;
        }

        static bool EndsWith(const std::string &text, const std::string &suffix)
        {
            return text.size() >= suffix.size() &&
                   text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        // A tool that never answers: burns the whole timeout, then reports it.
        static discovery::CommandResult Hang(std::chrono::milliseconds timeout)
        {
            std::this_thread::sleep_for(timeout);
            return discovery::CommandResult::Timeout();
        }

    private:
        mutable std::mutex m_mutex;
        Handler m_handler;
        std::vector<Call> m_calls;
        std::size_t m_in_flight = 0;
        std::size_t m_max_in_flight = 0;
    };
}
