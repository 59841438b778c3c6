#pragma once

#include <atomic>
#include <cstddef>
#include <functional>

namespace whos_home::discovery
{
    inline constexpr std::size_t MAX_CONCURRENT_PROBES = 50;

    // Instrumentation hook; callbacks arrive from the unit threads.
    class BatchObserver
    {
    public:
        virtual ~BatchObserver() = default;
        virtual void OnUnitStarted(std::size_t /*index*/) {}
        virtual void OnUnitFinished(std::size_t /*index*/) {}
        virtual void OnBatchJoined(std::size_t /*generation*/, std::size_t /*units*/) {}
    };

    // Runs count units on one thread each, at most batch_size at a time. Every
    // generation is joined in full before the next one is launched.
    class BatchRunner
    {
    public:
        using Unit = std::function<void(std::size_t index)>;

        explicit BatchRunner(std::size_t batch_size = MAX_CONCURRENT_PROBES);

        void SetObserver(BatchObserver *observer) { m_observer = observer; }

        // Returns the number of units that ran. cancel, when set, is checked
        // between generations only.
        std::size_t Run(std::size_t count, const Unit &unit, const std::atomic<bool> *cancel = nullptr);

        std::size_t BatchSize() const { return m_batch_size; }
        std::size_t Generation() const { return m_generation; }

    private:
        void RunUnit(const Unit &unit, std::size_t index);

        std::size_t m_batch_size;
        std::size_t m_generation;
        BatchObserver *m_observer;
    };
}
