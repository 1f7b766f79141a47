#pragma once

#include <string>
#include <vector>
#include "../scanner/ScanPipeline.hpp"

namespace net_map::cli
{
    struct CliOptions
    {
        scanner::ScanConfig config;
        bool workers_given = false;
        bool show_help = false;
    };

    // Throws common::ConfigurationError on unknown flags, missing values or
    // non-numeric numbers. Range checks are left to ScanConfig::Validate.
    CliOptions ParseArguments(const std::vector<std::string> &args);
    CliOptions ParseArguments(int argc, char *argv[]);

    std::string Usage();
}
