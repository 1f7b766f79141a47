#include "CommandLine.hpp"
#include "../common/Errors.hpp"
#include <cmath>
#include <sstream>

namespace net_map::cli
{
    namespace
    {
        const std::string &RequireValue(const std::vector<std::string> &args, std::size_t &i)
        {
            if (i + 1 >= args.size())
                throw common::ConfigurationError(args[i] + " needs a value");
            return args[++i];
        }

        int ParseInt(const std::string &flag, const std::string &value)
        {
            std::size_t used = 0;
            int parsed = 0;
            try
            {
                parsed = std::stoi(value, &used);
            }
            catch (const std::exception &)
            {
                throw common::ConfigurationError(flag + " expects an integer, got '" + value + "'");
            }
            if (used != value.size())
                throw common::ConfigurationError(flag + " expects an integer, got '" + value + "'");
            return parsed;
        }

        double ParseSeconds(const std::string &flag, const std::string &value)
        {
            std::size_t used = 0;
            double parsed = 0.0;
            try
            {
                parsed = std::stod(value, &used);
            }
            catch (const std::exception &)
            {
                throw common::ConfigurationError(flag + " expects a number of seconds, got '" + value + "'");
            }
            if (used != value.size() || !std::isfinite(parsed))
                throw common::ConfigurationError(flag + " expects a number of seconds, got '" + value + "'");
            return parsed;
        }
    }

    CliOptions ParseArguments(const std::vector<std::string> &args)
    {
        CliOptions options;
        scanner::ScanConfig &config = options.config;

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];

            if (arg == "-h" || arg == "--help")
            {
                options.show_help = true;
            }
            else if (arg == "--deep")
            {
                config.deep = true;
            }
            else if (arg == "--workers")
            {
                config.workers = ParseInt(arg, RequireValue(args, i));
                options.workers_given = true;
            }
            else if (arg == "--iface")
            {
                config.interface = RequireValue(args, i);
            }
            else if (arg == "--output")
            {
                config.output_path = RequireValue(args, i);
            }
            else if (arg == "--oui-db")
            {
                config.oui_db_path = RequireValue(args, i);
            }
            else if (arg == "--heuristics")
            {
                config.heuristics_path = RequireValue(args, i);
            }
            else if (arg == "--timeout")
            {
                double seconds = ParseSeconds(arg, RequireValue(args, i));
                config.discovery_timeout = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
            }
            else if (arg == "--retries")
            {
                config.discovery_retries = ParseInt(arg, RequireValue(args, i));
            }
            else
            {
                throw common::ConfigurationError("Unknown argument: " + arg);
            }
        }
        return options;
    }

    CliOptions ParseArguments(int argc, char *argv[])
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
            args.emplace_back(argv[i]);
        return ParseArguments(args);
    }

    std::string Usage()
    {
        std::stringstream ss;
        ss << "Usage: netmap [--deep] [--workers N] [--iface NAME] [--output FILE]\n"
           << "              [--oui-db FILE] [--heuristics FILE] [--timeout SEC] [--retries N]\n\n"
           << "  --deep             Probe every host (ICMP TTL, TCP ports, SSDP) and classify it\n"
           << "  --workers N        Concurrent probe workers for --deep (default " << defaults::WORKER_COUNT << ")\n"
           << "  --iface NAME       Scan through this interface instead of the default route's\n"
           << "  --output FILE      Snapshot path (default " << defaults::SNAPSHOT_PATH << ")\n"
           << "  --oui-db FILE      Wireshark manuf or IEEE oui.txt vendor database\n"
           << "  --heuristics FILE  JSON overrides for the classifier tables\n"
           << "  --timeout SEC      ARP reply window per sweep (default "
           << defaults::DISCOVERY_TIMEOUT.count() / 1000.0 << ")\n"
           << "  --retries N        Extra ARP sweeps when nothing answers (default "
           << defaults::DISCOVERY_RETRIES << ")\n";
        return ss.str();
    }
}
