#pragma once
#include <ostream>
#include <filesystem>
#include "disk_triage/types.hpp"

namespace disk_triage {
    std::string normalize_root(const std::filesystem::path& root);
    ScanResult scan_tree(const std::filesystem::path& root, std::ostream& diagnostics);
}
