#include <cerrno>
#include <string>
#include <vector>
#include <cstring>
#include <utility>
#include <algorithm>
#include <sys/stat.h>
#include <system_error>
#include "disk_triage/scanner.hpp"

namespace disk_triage {

    namespace {
        using Path = std::filesystem::path;

        constexpr const char* kColorReset = "\033[0m";
        constexpr const char* kColorError = "\033[1;31m";

        void warn(std::ostream& diagnostics, const std::string& message) {
            diagnostics << kColorError << "Warning: " << message << kColorReset << "\n";
        }

        // Lists the names directly under a directory, sorted. Returns false when the listing is incomplete.
        bool list_children(const std::string& directory, std::vector<std::string>& names, std::error_code& error) {
            std::filesystem::directory_iterator it(directory, error);
            std::filesystem::directory_iterator end;
            if (error) {
                return false;
            }

            while (it != end) {
                names.push_back(it->path().filename().string());
                it.increment(error);
                if (error) {
                    return false;
                }
            }

            std::sort(names.begin(), names.end());
            return true;
        }
    }

    std::string normalize_root(const Path& root) {
        std::string normalized = root.lexically_normal().string();
        while (normalized.size() > 1 && normalized.back() == '/') {
            normalized.pop_back();
        }
        if (normalized.empty()) {
            normalized = ".";
        }
        return normalized;
    }

    ScanResult scan_tree(const Path& root, std::ostream& diagnostics) {
        ScanResult result;
        std::vector<std::string> pending;
        pending.push_back(normalize_root(root));

        while (!pending.empty()) {
            std::string current = std::move(pending.back());
            pending.pop_back();

            struct stat info {};
            if (lstat(current.c_str(), &info) != 0) {
                warn(diagnostics, "Unable to stat " + current + ": " + std::string(std::strerror(errno)));
                ++result.skipped;
                continue;
            }

            Item item;
            item.path = current;
            item.size = static_cast<std::int64_t>(info.st_size);
            item.is_directory = S_ISDIR(info.st_mode);
            result.table.add(item);

            if (!item.is_directory) {
                continue;
            }

            std::vector<std::string> names;
            std::error_code list_error;
            if (!list_children(current, names, list_error)) {
                warn(diagnostics, "Unable to read directory " + current + ": " + list_error.message());
                ++result.skipped;
                continue;
            }

            for (auto it = names.rbegin(); it != names.rend(); ++it) {
                pending.push_back((Path(current) / *it).string());
            }
        }

        return result;
    }
}
