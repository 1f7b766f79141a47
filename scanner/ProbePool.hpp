#pragma once

#include <mutex>
#include <vector>
#include "../common/CancelToken.hpp"
#include "../common/ThreadSafeQueue.hpp"
#include "Probes.hpp"
#include "Types.hpp"

namespace net_map::scanner
{
    // Fixed-width worker pool running one HostProber job per host.
    class ProbePool
    {
    private:
        struct Batch
        {
            common::ThreadSafeQueue<DiscoveredHost> jobs;
            std::mutex results_mutex;
            std::vector<ProbedHost> results;
        };

        HostProber &m_prober;
        int m_workers;

        void ProcessLoop(Batch &batch, const common::CancelToken &cancel);

    public:
        // Throws common::ConfigurationError when workers < 1.
        ProbePool(HostProber &prober, int workers);

        // Results come back in completion order. Throws common::ScanCancelled
        // if the token fires; partial results are dropped.
        std::vector<ProbedHost> Run(const std::vector<DiscoveredHost> &hosts, const common::CancelToken &cancel);
    };
}
