#include "SnapshotWriter.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace net_map::scanner
{
    nlohmann::json SnapshotWriter::ToJson(const ScanSnapshot &snapshot)
    {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &d : snapshot.devices)
        {
            nlohmann::json device;
            device["ip"] = d.ip;
            device["mac"] = d.mac;
            device["vendor"] = d.vendor;

            if (d.probe && d.probe->ttl)
                device["ttl"] = *d.probe->ttl;
            else
                device["ttl"] = nullptr;

            device["open_ports"] = d.probe ? nlohmann::json(d.probe->open_ports) : nlohmann::json::array();
            device["ssdp"] = d.probe ? nlohmann::json(d.probe->ssdp) : nlohmann::json::array();
            device["class"] = d.category;
            devices.push_back(device);
        }

        nlohmann::json doc;
        doc["_meta"] = {{"deep", snapshot.meta.deep}, {"ts", snapshot.meta.ts}};
        doc["devices"] = devices;
        return doc;
    }

    ScanSnapshot SnapshotWriter::FromJson(const nlohmann::json &doc)
    {
        ScanSnapshot snapshot;
        const auto &meta = doc.at("_meta");
        snapshot.meta.deep = meta.at("deep").get<bool>();
        snapshot.meta.ts = meta.at("ts").get<double>();

        for (const auto &item : doc.at("devices"))
        {
            DeviceRecord d;
            d.ip = item.at("ip").get<std::string>();
            d.mac = item.at("mac").get<std::string>();
            d.vendor = item.at("vendor").get<std::string>();
            d.category = item.at("class").get<std::string>();

            if (snapshot.meta.deep)
            {
                ProbeResult probe;
                if (!item.at("ttl").is_null())
                    probe.ttl = item.at("ttl").get<int>();
                probe.open_ports = item.at("open_ports").get<std::vector<std::uint16_t>>();
                probe.ssdp = item.at("ssdp").get<std::vector<std::string>>();
                d.probe = probe;
            }
            snapshot.devices.push_back(d);
        }
        return snapshot;
    }

    void SnapshotWriter::Write(const ScanSnapshot &snapshot, const std::string &path)
    {
        const std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open())
                throw std::runtime_error("Cannot open " + tmp + " for writing");

            // Bytes that are not valid UTF-8 (OUI vendor names, SSDP replies) are dropped.
            out << ToJson(snapshot).dump(2, ' ', false, nlohmann::json::error_handler_t::ignore) << "\n";
            if (!out.good())
                throw std::runtime_error("Failed writing " + tmp);
        }

        if (std::rename(tmp.c_str(), path.c_str()) != 0)
        {
            std::string reason = std::strerror(errno);
            std::remove(tmp.c_str());
            throw std::runtime_error("Cannot replace " + path + ": " + reason);
        }

        std::cout << "[Scan] Results saved to " << path << "\n";
    }

    ScanSnapshot SnapshotWriter::Read(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
            throw std::runtime_error("Cannot open " + path);

        try
        {
            return FromJson(nlohmann::json::parse(in));
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Malformed snapshot " + path + ": " + e.what());
        }
    }
}
