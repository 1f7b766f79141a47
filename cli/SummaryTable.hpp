#pragma once

#include <string>
#include "../scanner/Types.hpp"

namespace net_map::cli
{
    // GitHub-flavoured markdown table of the snapshot devices. Deep snapshots
    // add TTL, open ports and class columns.
    std::string RenderSummaryTable(const scanner::ScanSnapshot &snapshot);
}
