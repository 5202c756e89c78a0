#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <filesystem>
#include <unordered_map>

namespace disk_triage {
    enum class OutputFormat {
        Text,
        Json
    };

    struct Options {
        std::filesystem::path root = ".";
        std::size_t top = 20;
        OutputFormat format = OutputFormat::Text;
        bool dump_items = false;
    };

    struct CliParseResult {
        bool valid = true;
        bool show_help = false;
        Options options;
        std::string error_message;
    };

    struct Item {
        std::string path;
        std::int64_t size = 0;
        bool is_directory = false;
        std::size_t file_count = 0;
    };

    // Items in scan order, indexed by path.
    struct ItemTable {
        std::vector<Item> items;
        std::unordered_map<std::string, std::size_t> index;

        bool add(Item item);
        Item* find(const std::string& path);
        const Item* find(const std::string& path) const;
        bool empty() const { return items.empty(); }
        std::size_t size() const { return items.size(); }
    };

    struct ScanResult {
        ItemTable table;
        std::size_t skipped = 0;
    };

    struct SummaryReport {
        std::string root;
        std::size_t top = 0;
        std::size_t total_items = 0;
        std::size_t total_files = 0;
        std::size_t total_dirs = 0;
        std::int64_t total_size = 0;
        std::size_t skipped_paths = 0;
        std::vector<Item> top_files_by_size;
        std::vector<Item> top_dirs_by_size;
        std::vector<Item> top_dirs_by_file_count;
    };

    class EmptyResultError : public std::runtime_error {
    public:
        explicit EmptyResultError(const std::string& root)
            : std::runtime_error("empty result set: no items were scanned under " + root) {}
    };
}
