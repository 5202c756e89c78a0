#include <sstream>
#include <iostream>
#include "disk_triage/cli.hpp"
#include "disk_triage/render.hpp"
#include "disk_triage/scanner.hpp"
#include "disk_triage/aggregator.hpp"

namespace {
    constexpr const char* kColorReset = "\033[0m";
    constexpr const char* kColorError = "\033[1;31m";
}

int main(int argc, char* argv[]) {
    const auto cli = disk_triage::parse_cli(argc, argv);

    if (!cli.valid) {
        std::cerr << kColorError << cli.error_message << kColorReset << "\n";
        std::cerr << kColorError << "Usage: " << argv[0] << " [options] [directory]" << kColorReset << "\n";
        return disk_triage::kExitUsage;
    }

    if (cli.show_help) {
        disk_triage::print_help(argv[0]);
        return 0;
    }

    const disk_triage::Options& options = cli.options;

    if (auto root_error = disk_triage::validate_root(options.root)) {
        std::cerr << kColorError << *root_error << kColorReset << "\n";
        return disk_triage::kExitBadDirectory;
    }

    const std::string root = disk_triage::normalize_root(options.root);
    disk_triage::ScanResult scan = disk_triage::scan_tree(options.root, std::cerr);
    disk_triage::aggregate(scan.table, root);

    if (options.dump_items) {
        disk_triage::render_items_json(scan.table, std::cout);
        return 0;
    }

    std::ostringstream rendered;
    try {
        const auto report = disk_triage::build_report(scan.table, options, scan.skipped);
        disk_triage::render_report(report, options.format, rendered);
    } catch (const disk_triage::EmptyResultError& error) {
        std::cerr << kColorError << "Error: " << error.what() << kColorReset << "\n";
        return disk_triage::kExitEmptyResult;
    }

    std::cout << rendered.str();
    return 0;
}
