#pragma once
#include <string>
#include "disk_triage/types.hpp"

namespace disk_triage {
    bool is_within_root(const std::string& path, const std::string& root);
    void aggregate(ItemTable& table, const std::string& root);
    SummaryReport build_report(const ItemTable& table, const Options& options, std::size_t skipped = 0);
}
