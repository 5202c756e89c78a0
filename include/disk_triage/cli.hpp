#pragma once
#include <string>
#include <optional>
#include <filesystem>
#include "disk_triage/types.hpp"

namespace disk_triage {
    constexpr int kExitUsage = 1;
    constexpr int kExitBadDirectory = 2;
    constexpr int kExitEmptyResult = 3;

    void print_help(const std::string& program_name);
    CliParseResult parse_cli(int argc, const char* const argv[]);

    // Error message when the scan target is missing or not a directory.
    std::optional<std::string> validate_root(const std::filesystem::path& root);
}
