#include "ProbePool.hpp"
#include "../common/Errors.hpp"
#include "../common/ThreadGroup.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <system_error>

namespace net_map::scanner
{
    ProbePool::ProbePool(HostProber &prober, int workers) : m_prober(prober), m_workers(workers)
    {
        if (workers < 1)
            throw common::ConfigurationError("Worker count must be >= 1, got " + std::to_string(workers));
    }

    void ProbePool::ProcessLoop(Batch &batch, const common::CancelToken &cancel)
    {
        while (!cancel.IsCancelled())
        {
            auto job = batch.jobs.Pop();
            if (!job)
                break;

            ProbedHost probed;
            probed.host = *job;

            try
            {
                probed.result = m_prober.Probe(*job);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Probe] Error probing " << job->ip << ": " << e.what() << "\n";
                probed.result = ProbeResult();
            }

            std::lock_guard<std::mutex> lock(batch.results_mutex);
            batch.results.push_back(std::move(probed));
        }
    }

    std::vector<ProbedHost> ProbePool::Run(const std::vector<DiscoveredHost> &hosts, const common::CancelToken &cancel)
    {
        if (cancel.IsCancelled())
            throw common::ScanCancelled();
        if (hosts.empty())
            return {};

        Batch batch;
        for (const auto &host : hosts)
        {
            batch.jobs.Push(host);
        }
        batch.jobs.Shutdown();

        const int width = std::min<int>(m_workers, static_cast<int>(hosts.size()));
        std::cout << "[Probe] Probing " << hosts.size() << " host(s) with " << width << " worker(s)\n";

        common::ThreadGroup workers;
        workers.Reserve(width);
        try
        {
            for (int i = 0; i < width; ++i)
            {
                workers.Spawn(&ProbePool::ProcessLoop, this, std::ref(batch), std::cref(cancel));
            }
        }
        catch (const std::system_error &e)
        {
            // Started workers exit once the queue is empty; the group joins them.
            std::size_t dropped = batch.jobs.Drain();
            std::cerr << "[Probe] Could not start worker " << workers.Size() + 1 << ": " << e.what()
                      << ", " << dropped << " host(s) left unprobed\n";
            throw;
        }
        workers.JoinAll();

        if (cancel.IsCancelled())
        {
            std::size_t dropped = batch.jobs.Drain();
            std::cout << "[Probe] Cancelled, " << dropped << " host(s) left unprobed\n";
            throw common::ScanCancelled();
        }

        return std::move(batch.results);
    }
}
