#include "ResultAggregator.hpp"
#include "../common/Ipv4.hpp"
#include <algorithm>
#include <chrono>
#include <unordered_map>

namespace net_map::scanner
{
    double ResultAggregator::NowEpochSeconds()
    {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
    }

    ScanSnapshot ResultAggregator::Aggregate(std::vector<DeviceRecord> records,
                                             const std::optional<std::string> &gateway,
                                             bool deep)
    {
        return Aggregate(std::move(records), gateway, deep, NowEpochSeconds());
    }

    ScanSnapshot ResultAggregator::Aggregate(std::vector<DeviceRecord> records,
                                             const std::optional<std::string> &gateway,
                                             bool deep,
                                             double timestamp)
    {
        ScanSnapshot snapshot;
        snapshot.meta.deep = deep;
        snapshot.meta.ts = timestamp;

        std::unordered_map<std::string, std::size_t> index;
        for (auto &record : records)
        {
            auto it = index.find(record.ip);
            if (it != index.end())
            {
                snapshot.devices[it->second] = std::move(record);
                continue;
            }
            index.emplace(record.ip, snapshot.devices.size());
            snapshot.devices.push_back(std::move(record));
        }

        if (gateway)
        {
            for (auto &device : snapshot.devices)
            {
                if (device.ip == *gateway)
                    device.category = category::ROUTER;
            }
        }

        std::sort(snapshot.devices.begin(), snapshot.devices.end(),
                  [](const DeviceRecord &a, const DeviceRecord &b)
                  { return common::AddressLess(a.ip, b.ip); });
        return snapshot;
    }

    std::vector<DeviceRecord> ResultAggregator::ShallowRecords(const std::vector<DiscoveredHost> &hosts)
    {
        std::vector<DeviceRecord> records;
        records.reserve(hosts.size());
        for (const auto &host : hosts)
        {
            records.push_back({host.ip, host.mac, host.vendor, std::nullopt, host.vendor});
        }
        return records;
    }

    std::vector<DeviceRecord> ResultAggregator::DeepRecords(const std::vector<ProbedHost> &probed,
                                                            const Classifier &classifier,
                                                            const std::optional<std::string> &gateway)
    {
        std::vector<DeviceRecord> records;
        records.reserve(probed.size());
        for (const auto &p : probed)
        {
            records.push_back({p.host.ip, p.host.mac, p.host.vendor, p.result, classifier.Classify(p, gateway)});
        }
        return records;
    }
}
