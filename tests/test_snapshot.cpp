#include <gtest/gtest.h>
#include "scanner/SnapshotWriter.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace net_map::scanner;

namespace
{
    std::string TempPath(const std::string &name)
    {
        return ::testing::TempDir() + name + "_" + std::to_string(getpid()) + ".json";
    }

    bool FileExists(const std::string &path)
    {
        std::ifstream in(path);
        return in.is_open();
    }
}

TEST(SnapshotWriterTest, ShallowDeviceHasNullTtlAndEmptyArrays)
{
    ScanSnapshot snapshot;
    snapshot.meta = {false, 10.5};
    snapshot.devices.push_back({"10.0.0.2", "aa:bb:cc:dd:ee:ff", "Unknown", std::nullopt, "Unknown"});

    nlohmann::json doc = SnapshotWriter::ToJson(snapshot);

    EXPECT_EQ(doc["_meta"]["deep"], false);
    EXPECT_DOUBLE_EQ(doc["_meta"]["ts"].get<double>(), 10.5);
    const auto &device = doc["devices"][0];
    EXPECT_TRUE(device["ttl"].is_null());
    EXPECT_TRUE(device["open_ports"].is_array());
    EXPECT_TRUE(device["open_ports"].empty());
    EXPECT_TRUE(device["ssdp"].is_array());
    EXPECT_TRUE(device["ssdp"].empty());
    EXPECT_EQ(device["class"], "Unknown");
}

TEST(SnapshotWriterTest, DeepDeviceWithoutReplyHasNullTtl)
{
    ScanSnapshot snapshot;
    snapshot.meta = {true, 1.0};
    ProbeResult probe;
    probe.open_ports = {22, 80};
    snapshot.devices.push_back({"10.0.0.3", "00:11:22:33:44:55", "Intel", probe, "Desconocido"});

    nlohmann::json doc = SnapshotWriter::ToJson(snapshot);

    const auto &device = doc["devices"][0];
    EXPECT_TRUE(device["ttl"].is_null());
    EXPECT_EQ(device["open_ports"], nlohmann::json({22, 80}));
    EXPECT_EQ(device["class"], "Desconocido");
}

TEST(SnapshotWriterTest, EmptyScanKeepsMetadata)
{
    ScanSnapshot snapshot;
    snapshot.meta = {true, 99.0};

    nlohmann::json doc = SnapshotWriter::ToJson(snapshot);

    EXPECT_TRUE(doc["devices"].is_array());
    EXPECT_TRUE(doc["devices"].empty());
    EXPECT_EQ(doc["_meta"]["deep"], true);
}

TEST(SnapshotWriterTest, WriteThenReadFile)
{
    ScanSnapshot snapshot;
    snapshot.meta = {true, 1700000000.25};
    ProbeResult probe;
    probe.ttl = 64;
    probe.open_ports = {80, 443};
    probe.ssdp = {"HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n"};
    snapshot.devices.push_back({"192.168.1.1", "00:00:0c:01:02:03", "Cisco Systems, Inc", probe, "Router (gateway)"});
    snapshot.devices.push_back({"192.168.1.7", "02:aa:bb:cc:dd:ee", "MAC Aleatoria (posible móvil)", ProbeResult{}, "Móvil"});

    const std::string path = TempPath("netmap_snapshot");
    SnapshotWriter::Write(snapshot, path);

    EXPECT_FALSE(FileExists(path + ".tmp"));
    ScanSnapshot loaded = SnapshotWriter::Read(path);
    std::remove(path.c_str());

    EXPECT_TRUE(loaded.meta.deep);
    EXPECT_DOUBLE_EQ(loaded.meta.ts, 1700000000.25);
    ASSERT_EQ(loaded.devices.size(), 2u);
    EXPECT_EQ(loaded.devices[0].vendor, "Cisco Systems, Inc");
    ASSERT_TRUE(loaded.devices[0].probe.has_value());
    EXPECT_EQ(loaded.devices[0].probe->ttl, 64);
    EXPECT_EQ(loaded.devices[0].probe->ssdp.size(), 1u);
    EXPECT_EQ(loaded.devices[1].category, "Móvil");
    ASSERT_TRUE(loaded.devices[1].probe.has_value());
    EXPECT_FALSE(loaded.devices[1].probe->ttl.has_value());
}

TEST(SnapshotWriterTest, InvalidUtf8BytesAreDropped)
{
    ScanSnapshot snapshot;
    snapshot.meta = {true, 5.0};
    ProbeResult probe;
    probe.ssdp = {"HTTP/1.1 200 OK\r\nSERVER: Caf\xe9 TV\r\n"};
    snapshot.devices.push_back({"10.0.0.4", "00:11:22:33:44:56", "Sony\xff", probe, "Smart TV"});

    const std::string path = TempPath("netmap_utf8");
    SnapshotWriter::Write(snapshot, path);
    ScanSnapshot loaded = SnapshotWriter::Read(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.devices.size(), 1u);
    EXPECT_EQ(loaded.devices[0].vendor, "Sony");
    ASSERT_TRUE(loaded.devices[0].probe.has_value());
    ASSERT_EQ(loaded.devices[0].probe->ssdp.size(), 1u);
    EXPECT_EQ(loaded.devices[0].probe->ssdp[0], "HTTP/1.1 200 OK\r\nSERVER: Caf TV\r\n");
}

TEST(SnapshotWriterTest, ShallowReadHasNoProbe)
{
    nlohmann::json doc = {{"_meta", {{"deep", false}, {"ts", 3.0}}},
                          {"devices", nlohmann::json::array({{{"ip", "10.0.0.4"}, {"mac", "aa:bb:cc:dd:ee:01"},
                                                              {"vendor", "Acme"}, {"ttl", nullptr},
                                                              {"open_ports", nlohmann::json::array()},
                                                              {"ssdp", nlohmann::json::array()},
                                                              {"class", "Acme"}}})}};

    ScanSnapshot snapshot = SnapshotWriter::FromJson(doc);

    ASSERT_EQ(snapshot.devices.size(), 1u);
    EXPECT_FALSE(snapshot.devices[0].probe.has_value());
}

TEST(SnapshotWriterTest, WriteToMissingDirectoryThrows)
{
    ScanSnapshot snapshot;
    EXPECT_THROW(SnapshotWriter::Write(snapshot, "/nonexistent-dir/for/netmap/out.json"), std::runtime_error);
}

TEST(SnapshotWriterTest, ReadMalformedFileThrows)
{
    const std::string path = TempPath("netmap_malformed");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(SnapshotWriter::Read(path), std::runtime_error);
    std::remove(path.c_str());
}
