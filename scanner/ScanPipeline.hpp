#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "../common/CancelToken.hpp"
#include "../common/Defaults.hpp"
#include "ArpDiscovery.hpp"
#include "Classifier.hpp"
#include "OuiDatabase.hpp"
#include "Probes.hpp"
#include "TopologyProvider.hpp"
#include "Types.hpp"

namespace net_map::scanner
{
    struct ScanConfig
    {
        bool deep = false;
        int workers = defaults::WORKER_COUNT;
        std::optional<std::string> interface;
        std::chrono::milliseconds discovery_timeout = defaults::DISCOVERY_TIMEOUT;
        int discovery_retries = defaults::DISCOVERY_RETRIES;
        std::string output_path = defaults::SNAPSHOT_PATH;
        std::optional<std::string> oui_db_path;
        std::optional<std::string> heuristics_path;

        // Throws common::ConfigurationError.
        void Validate() const;
    };

    // Topology -> discovery -> vendor -> (deep) probes + classifier ->
    // aggregation. Holds no per-scan state, so one instance may serve
    // several scans at once.
    class ScanPipeline
    {
    public:
        ScanPipeline(TopologyProvider &topology,
                     HostDiscovery &discovery,
                     const VendorLookup &vendors,
                     HostProber &prober,
                     Classifier classifier = Classifier());

        ScanSnapshot Run(const ScanConfig &config, const common::CancelToken &cancel) const;

    private:
        TopologyProvider &m_topology;
        HostDiscovery &m_discovery;
        const VendorLookup &m_vendors;
        HostProber &m_prober;
        Classifier m_classifier;
    };
}
