#include <vector>
#include <algorithm>
#include <filesystem>
#include "disk_triage/aggregator.hpp"

namespace disk_triage {

    namespace {
        template <typename Key>
        std::vector<Item> select_top(const std::vector<Item>& candidates, std::size_t limit, Key key) {
            std::vector<Item> ranked = candidates;
            std::stable_sort(ranked.begin(), ranked.end(), [&](const Item& lhs, const Item& rhs) {
                return key(lhs) > key(rhs);
            });
            if (ranked.size() > limit) {
                ranked.resize(limit);
            }
            return ranked;
        }
    }

    bool is_within_root(const std::string& path, const std::string& root) {
        if (path == root) {
            return true;
        }
        if (!root.empty() && root.back() == '/') {
            return path.compare(0, root.size(), root) == 0;
        }
        return path.size() > root.size()
            && path.compare(0, root.size(), root) == 0
            && path[root.size()] == '/';
    }

    void aggregate(ItemTable& table, const std::string& root) {
        // Ancestors receive each entry's scanned size, never a partially aggregated one.
        std::vector<std::int64_t> raw_sizes;
        raw_sizes.reserve(table.items.size());
        for (const auto& item : table.items) {
            raw_sizes.push_back(item.size);
        }

        for (std::size_t i = 0; i < table.items.size(); ++i) {
            const std::string path = table.items[i].path;
            if (path == root) {
                continue;
            }

            std::string ancestor = std::filesystem::path(path).parent_path().string();
            while (!ancestor.empty() && is_within_root(ancestor, root)) {
                if (Item* parent = table.find(ancestor)) {
                    ++parent->file_count;
                    parent->size += raw_sizes[i];
                }
                if (ancestor == root) {
                    break;
                }
                std::string next = std::filesystem::path(ancestor).parent_path().string();
                if (next == ancestor) {
                    break;
                }
                ancestor = std::move(next);
            }
        }
    }

    SummaryReport build_report(const ItemTable& table, const Options& options, std::size_t skipped) {
        const std::string root = options.root.string();
        if (table.empty()) {
            throw EmptyResultError(root);
        }

        std::vector<Item> files;
        std::vector<Item> directories;
        for (const auto& item : table.items) {
            if (item.is_directory) {
                directories.push_back(item);
            } else {
                files.push_back(item);
            }
        }

        SummaryReport report;
        report.root = root;
        report.top = options.top;
        report.total_items = table.size();
        report.total_files = files.size();
        report.total_dirs = directories.size();
        report.skipped_paths = skipped;

        // Largest single entry, not a sum. Kept for compatibility with existing reports.
        auto largest = std::max_element(table.items.begin(), table.items.end(), [](const Item& lhs, const Item& rhs) {
            return lhs.size < rhs.size;
        });
        report.total_size = largest->size;

        auto by_size = [](const Item& item) { return item.size; };
        auto by_file_count = [](const Item& item) { return item.file_count; };
        report.top_files_by_size = select_top(files, options.top, by_size);
        report.top_dirs_by_size = select_top(directories, options.top, by_size);
        report.top_dirs_by_file_count = select_top(directories, options.top, by_file_count);

        return report;
    }
}
