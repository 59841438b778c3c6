#include "BatchRunner.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>
#include <vector>

namespace whos_home::discovery
{
    BatchRunner::BatchRunner(std::size_t batch_size)
        : m_batch_size(std::max<std::size_t>(batch_size, 1)), m_generation(0), m_observer(nullptr)
    {
    }

    void BatchRunner::RunUnit(const Unit &unit, std::size_t index)
    {
        if (m_observer)
            m_observer->OnUnitStarted(index);

        try
        {
            unit(index);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[BatchRunner] Unit " << index << " failed: " << e.what() << "\n";
        }

        if (m_observer)
            m_observer->OnUnitFinished(index);
    }

    std::size_t BatchRunner::Run(std::size_t count, const Unit &unit, const std::atomic<bool> *cancel)
    {
        std::size_t completed = 0;

        for (std::size_t start = 0; start < count; start += m_batch_size)
        {
            if (cancel && cancel->load())
            {
                std::cout << "[BatchRunner] Cancelled after " << completed << " of " << count << " units\n";
                break;
            }

            const std::size_t end = std::min(count, start + m_batch_size);
            std::vector<std::thread> threads;
            threads.reserve(end - start);

            for (std::size_t index = start; index < end; ++index)
            {
                try
                {
                    threads.emplace_back(&BatchRunner::RunUnit, this, std::cref(unit), index);
                }
                catch (const std::system_error &e)
                {
                    std::cerr << "[BatchRunner] Thread launch failed, running unit " << index << " inline: " << e.what() << "\n";
                    RunUnit(unit, index);
                }
            }

            for (auto &t : threads)
            {
                if (t.joinable())
                    t.join();
            }

            completed += end - start;
            ++m_generation;

            if (m_observer)
                m_observer->OnBatchJoined(m_generation, end - start);
        }

        return completed;
    }
}
