#include "CommandLine.hpp"
#include "SummaryTable.hpp"
#include "../common/Errors.hpp"
#include "../scanner/ArpDiscovery.hpp"
#include "../scanner/HeuristicTables.hpp"
#include "../scanner/OuiDatabase.hpp"
#include "../scanner/Probes.hpp"
#include "../scanner/ScanPipeline.hpp"
#include "../scanner/SnapshotWriter.hpp"
#include "../scanner/TopologyProvider.hpp"
#include "../service/ScanTaskRegistry.hpp"
#include <atomic>
#include <csignal>
#include <iostream>

namespace
{
    std::atomic<bool> g_interrupted{false};

    void OnInterrupt(int)
    {
        g_interrupted = true;
    }
}

int main(int argc, char *argv[])
{
    using namespace net_map;

    cli::CliOptions options;
    try
    {
        options = cli::ParseArguments(argc, argv);
    }
    catch (const common::ConfigurationError &e)
    {
        std::cerr << "[NetMap] " << e.what() << "\n\n"
                  << cli::Usage();
        return 1;
    }

    if (options.show_help)
    {
        std::cout << cli::Usage();
        return 0;
    }

    scanner::ScanConfig &config = options.config;
    if (options.workers_given && !config.deep)
        std::cerr << "[NetMap] Warning: --workers only applies to --deep scans, ignoring it\n";

    try
    {
        config.Validate();
    }
    catch (const common::ConfigurationError &e)
    {
        std::cerr << "[NetMap] " << e.what() << "\n";
        return 1;
    }

    scanner::OuiDatabase vendors;
    if (config.oui_db_path && !vendors.LoadFile(*config.oui_db_path))
        std::cerr << "[NetMap] Warning: continuing without vendor names\n";

    scanner::HeuristicTables tables = scanner::HeuristicTables::Defaults();
    try
    {
        if (config.heuristics_path)
            tables = scanner::HeuristicTables::LoadFile(*config.heuristics_path);
    }
    catch (const common::ConfigurationError &e)
    {
        std::cerr << "[NetMap] " << e.what() << "\n";
        return 1;
    }

    scanner::TinsTopologyProvider topology;
    scanner::ArpDiscovery discovery;
    scanner::NetworkProber prober(tables.CandidatePorts());
    scanner::ScanPipeline pipeline(topology, discovery, vendors, prober, scanner::Classifier(tables));

    service::ScanTaskRegistry registry(
        [&pipeline](const scanner::ScanConfig &cfg, const common::CancelToken &cancel)
        {
            scanner::ScanSnapshot snapshot = pipeline.Run(cfg, cancel);
            scanner::SnapshotWriter::Write(snapshot, cfg.output_path);
            return snapshot;
        });

    std::signal(SIGINT, OnInterrupt);

    std::string id;
    try
    {
        id = registry.Submit(config);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[NetMap] " << e.what() << "\n";
        return 1;
    }

    bool cancelRequested = false;
    while (!registry.Wait(id, std::chrono::milliseconds(200)))
    {
        if (g_interrupted && !cancelRequested)
        {
            std::cerr << "[NetMap] Interrupted, stopping scan...\n";
            registry.Cancel(id);
            cancelRequested = true;
        }
    }

    std::optional<service::TaskStatus> status = registry.Status(id);
    if (!status)
        return 1;

    switch (status->state)
    {
    case service::TaskState::Done:
        break;
    case service::TaskState::Cancelled:
        std::cerr << "[NetMap] " << status->message << "\n";
        return 130;
    default:
        std::cerr << "[NetMap] Scan failed: " << status->message << "\n";
        return 1;
    }

    std::cout << "[NetMap] " << status->message << ", saved to " << config.output_path << "\n";

    // The pipeline has already warned about an empty scan.
    std::optional<scanner::ScanSnapshot> snapshot = registry.Result(id);
    if (snapshot && !snapshot->devices.empty())
        std::cout << "\n" << cli::RenderSummaryTable(*snapshot);

    return 0;
}
