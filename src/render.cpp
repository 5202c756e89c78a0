#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <utility>
#include <algorithm>
#include "disk_triage/utils.hpp"
#include "disk_triage/render.hpp"

namespace disk_triage {

    namespace {
        constexpr const char* kColorReset = "\033[0m";
        constexpr const char* kColorKey = "\033[1;34m";
        constexpr const char* kColorValue = "\033[1;32m";

        class JsonBuilder {
        public:
            void add_string(const std::string& key, const std::string& value) {
                add_separator();
                stream_ << "\"" << key << "\":\"" << json_escape(value) << "\"";
            }

            void add_number(const std::string& key, std::int64_t value) {
                add_separator();
                stream_ << "\"" << key << "\":" << value;
            }

            void add_count(const std::string& key, std::size_t value) {
                add_separator();
                stream_ << "\"" << key << "\":" << value;
            }

            void add_bool(const std::string& key, bool value) {
                add_separator();
                stream_ << "\"" << key << "\":" << (value ? "true" : "false");
            }

            // Appends an array of already serialized objects.
            void add_objects(const std::string& key, const std::vector<std::string>& objects) {
                add_separator();
                stream_ << "\"" << key << "\":" << join_objects(objects);
            }

            std::string str() const {
                return '{' + stream_.str() + '}';
            }

            static std::string join_objects(const std::vector<std::string>& objects) {
                std::string joined = "[";
                for (std::size_t i = 0; i < objects.size(); ++i) {
                    if (i > 0) {
                        joined += ",";
                    }
                    joined += objects[i];
                }
                joined += "]";
                return joined;
            }

        private:
            void add_separator() {
                if (first_) {
                    first_ = false;
                } else {
                    stream_ << ",";
                }
            }

            bool first_ = true;
            std::ostringstream stream_;
        };

        std::vector<std::string> ranked_entries_json(const std::vector<Item>& items) {
            std::vector<std::string> entries;
            entries.reserve(items.size());
            for (const auto& item : items) {
                JsonBuilder json;
                json.add_string("path", item.path);
                json.add_number("size", item.size);
                json.add_string("sizeHuman", format_human_size(item.size));
                json.add_count("fileCount", item.file_count);
                entries.push_back(json.str());
            }
            return entries;
        }

        // Rows of (value, path); values are right-aligned to the widest one in the list.
        void render_ranked_text(std::ostream& out, const std::string& title,
                                const std::vector<std::pair<std::string, std::string>>& rows) {
            out << "\n" << kColorKey << title << ":" << kColorReset << "\n";
            if (rows.empty()) {
                out << "  (none)\n";
                return;
            }

            std::size_t width = 0;
            for (const auto& row : rows) {
                width = std::max(width, row.first.size());
            }
            for (const auto& row : rows) {
                out << "  " << std::setw(static_cast<int>(width)) << std::right << row.first
                    << "  " << row.second << "\n";
            }
        }

        std::vector<std::pair<std::string, std::string>> size_rows(const std::vector<Item>& items) {
            std::vector<std::pair<std::string, std::string>> rows;
            for (const auto& item : items) {
                rows.emplace_back(format_human_size(item.size), item.path);
            }
            return rows;
        }

        std::vector<std::pair<std::string, std::string>> count_rows(const std::vector<Item>& items) {
            std::vector<std::pair<std::string, std::string>> rows;
            for (const auto& item : items) {
                rows.emplace_back(std::to_string(item.file_count), item.path);
            }
            return rows;
        }
    }

    void render_text(const SummaryReport& report, std::ostream& out) {
        const std::string top = std::to_string(report.top);

        out << kColorKey << "Directory: " << kColorValue << report.root << kColorReset << "\n";
        out << kColorKey << "Total Items: " << kColorValue << report.total_items
            << " (" << report.total_files << " files, " << report.total_dirs << " directories)"
            << kColorReset << "\n";
        out << kColorKey << "Total Size: " << kColorValue << format_human_size(report.total_size) << kColorReset << "\n";
        if (report.skipped_paths > 0) {
            out << kColorKey << "Skipped Paths: " << kColorValue << report.skipped_paths << kColorReset << "\n";
        }

        render_ranked_text(out, "Top " + top + " files by size", size_rows(report.top_files_by_size));
        render_ranked_text(out, "Top " + top + " directories by size", size_rows(report.top_dirs_by_size));
        render_ranked_text(out, "Top " + top + " directories by file count", count_rows(report.top_dirs_by_file_count));
    }

    void render_json(const SummaryReport& report, std::ostream& out) {
        JsonBuilder json;
        json.add_string("root", report.root);
        json.add_count("totalItems", report.total_items);
        json.add_count("totalFiles", report.total_files);
        json.add_count("totalDirs", report.total_dirs);
        json.add_number("totalSize", report.total_size);
        json.add_string("totalSizeHuman", format_human_size(report.total_size));
        json.add_count("skippedPaths", report.skipped_paths);
        json.add_count("top", report.top);
        json.add_objects("topFilesBySize", ranked_entries_json(report.top_files_by_size));
        json.add_objects("topDirsBySize", ranked_entries_json(report.top_dirs_by_size));
        json.add_objects("topDirsByFileCount", ranked_entries_json(report.top_dirs_by_file_count));

        out << json.str() << "\n";
    }

    void render_report(const SummaryReport& report, OutputFormat format, std::ostream& out) {
        switch (format) {
            case OutputFormat::Text:
                render_text(report, out);
                break;
            case OutputFormat::Json:
                render_json(report, out);
                break;
        }
    }

    void render_items_json(const ItemTable& table, std::ostream& out) {
        std::vector<std::string> entries;
        entries.reserve(table.size());
        for (const auto& item : table.items) {
            JsonBuilder json;
            json.add_string("path", item.path);
            json.add_number("size", item.size);
            json.add_bool("isDirectory", item.is_directory);
            json.add_count("fileCount", item.file_count);
            entries.push_back(json.str());
        }

        out << JsonBuilder::join_objects(entries) << "\n";
    }
}
