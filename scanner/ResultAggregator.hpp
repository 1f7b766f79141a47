#pragma once

#include <optional>
#include <string>
#include <vector>
#include "Classifier.hpp"
#include "Types.hpp"

namespace net_map::scanner
{
    class ResultAggregator
    {
    public:
        // Collapses duplicate IPs (last wins), forces the gateway category,
        // sorts by numeric address and stamps the metadata.
        static ScanSnapshot Aggregate(std::vector<DeviceRecord> records,
                                      const std::optional<std::string> &gateway,
                                      bool deep);
        static ScanSnapshot Aggregate(std::vector<DeviceRecord> records,
                                      const std::optional<std::string> &gateway,
                                      bool deep,
                                      double timestamp);

        // Shallow scans skip the classifier: the category is the vendor label.
        static std::vector<DeviceRecord> ShallowRecords(const std::vector<DiscoveredHost> &hosts);
        static std::vector<DeviceRecord> DeepRecords(const std::vector<ProbedHost> &probed,
                                                     const Classifier &classifier,
                                                     const std::optional<std::string> &gateway);

        static double NowEpochSeconds();
    };
}
