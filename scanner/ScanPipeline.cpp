#include "ScanPipeline.hpp"
#include "../common/Errors.hpp"
#include "ProbePool.hpp"
#include "ResultAggregator.hpp"
#include "TopologyResolver.hpp"
#include "VendorAnnotator.hpp"
#include <iostream>

namespace net_map::scanner
{
    void ScanConfig::Validate() const
    {
        if (deep && workers < 1)
            throw common::ConfigurationError("--workers must be an integer >= 1 when --deep is used");
        if (interface && interface->empty())
            throw common::ConfigurationError("--iface needs an interface name");
        if (discovery_timeout.count() <= 0)
            throw common::ConfigurationError("Discovery timeout must be positive");
        if (discovery_retries < 0)
            throw common::ConfigurationError("Discovery retries must be >= 0");
        if (output_path.empty())
            throw common::ConfigurationError("Output path must not be empty");
    }

    ScanPipeline::ScanPipeline(TopologyProvider &topology,
                               HostDiscovery &discovery,
                               const VendorLookup &vendors,
                               HostProber &prober,
                               Classifier classifier)
        : m_topology(topology), m_discovery(discovery), m_vendors(vendors),
          m_prober(prober), m_classifier(std::move(classifier))
    {
    }

    ScanSnapshot ScanPipeline::Run(const ScanConfig &config, const common::CancelToken &cancel) const
    {
        config.Validate();
        if (cancel.IsCancelled())
            throw common::ScanCancelled();

        InterfaceContext ctx = TopologyResolver(m_topology).Resolve(config.interface);

        std::cout << "[Scan] Sweeping " << ctx.subnet.ToString() << " on " << ctx.name << "\n";
        std::vector<DiscoveredHost> hosts = m_discovery.Discover(ctx, config.discovery_timeout, config.discovery_retries);
        if (hosts.empty())
            std::cerr << "[Scan] Warning: no devices found\n";

        VendorAnnotator(m_vendors).Annotate(hosts);

        if (cancel.IsCancelled())
            throw common::ScanCancelled();

        std::vector<DeviceRecord> records;
        if (config.deep)
        {
            std::vector<ProbedHost> probed = ProbePool(m_prober, config.workers).Run(hosts, cancel);
            records = ResultAggregator::DeepRecords(probed, m_classifier, ctx.gateway);
        }
        else
        {
            records = ResultAggregator::ShallowRecords(hosts);
        }

        if (cancel.IsCancelled())
            throw common::ScanCancelled();

        return ResultAggregator::Aggregate(std::move(records), ctx.gateway, config.deep);
    }
}
