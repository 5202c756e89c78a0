#include <cctype>
#include <vector>
#include <iostream>
#include <system_error>
#include "disk_triage/cli.hpp"

namespace disk_triage {

    namespace {
        constexpr const char* kTopOption = "--top";
        constexpr const char* kFormatOption = "--output-format";

        void append_usage(std::ostream& out, const std::string& program_name) {
            out << "Usage: " << program_name << " [options] [directory]\n"
                << "\n"
                << "Scan a directory tree and summarize where the disk space goes:\n"
                << "  - Largest files by size\n"
                << "  - Largest directories by accumulated size\n"
                << "  - Directories holding the most entries\n"
                << "\n"
                << "The directory defaults to the current working directory.\n"
                << "\n"
                << "Options:\n"
                << "  --top N                       Number of entries per ranked list (default: 20)\n"
                << "  --output-format {text|json}   Report format (default: text)\n"
                << "  --dump-items                  Print every scanned item as JSON instead of a report\n"
                << "  -h, --help                    Show this help message and exit\n";
        }

        bool parse_count(const std::string& text, std::size_t& value) {
            if (text.empty() || text.size() > 18) {
                return false;
            }
            std::size_t parsed = 0;
            for (unsigned char c : text) {
                if (!std::isdigit(c)) {
                    return false;
                }
                parsed = parsed * 10 + static_cast<std::size_t>(c - '0');
            }
            value = parsed;
            return true;
        }

        bool parse_format(const std::string& text, OutputFormat& format) {
            if (text == "text") {
                format = OutputFormat::Text;
                return true;
            }
            if (text == "json") {
                format = OutputFormat::Json;
                return true;
            }
            return false;
        }

        // Splits "--name=value" into its parts; plain "--name" leaves value empty.
        bool split_option(const std::string& argument, const std::string& name, std::string& value, bool& inline_value) {
            if (argument == name) {
                inline_value = false;
                return true;
            }
            if (argument.compare(0, name.size() + 1, name + "=") == 0) {
                value = argument.substr(name.size() + 1);
                inline_value = true;
                return true;
            }
            return false;
        }
    }

    void print_help(const std::string& program_name) {
        append_usage(std::cout, program_name);
    }

    CliParseResult parse_cli(int argc, const char* const argv[]) {
        CliParseResult result;
        bool literal_mode = false;
        std::vector<std::string> positional;

        for (int index = 1; index < argc; ++index) {
            std::string argument = argv[index];
            if (!literal_mode) {
                if (argument == "--") {
                    literal_mode = true;
                    continue;
                }
                if (argument == "-h" || argument == "--help") {
                    result.show_help = true;
                    continue;
                }
                if (argument == "--dump-items") {
                    result.options.dump_items = true;
                    continue;
                }

                std::string value;
                bool inline_value = false;
                if (split_option(argument, kTopOption, value, inline_value)) {
                    if (!inline_value) {
                        if (index + 1 >= argc) {
                            result.valid = false;
                            result.error_message = "Missing value for --top.";
                            return result;
                        }
                        value = argv[++index];
                    }
                    if (!parse_count(value, result.options.top)) {
                        result.valid = false;
                        result.error_message = "Invalid value for --top: " + value + " (expected a non-negative integer)";
                        return result;
                    }
                    continue;
                }
                if (split_option(argument, kFormatOption, value, inline_value)) {
                    if (!inline_value) {
                        if (index + 1 >= argc) {
                            result.valid = false;
                            result.error_message = "Missing value for --output-format.";
                            return result;
                        }
                        value = argv[++index];
                    }
                    if (!parse_format(value, result.options.format)) {
                        result.valid = false;
                        result.error_message = "Invalid output format: " + value + " (valid choices: text, json)";
                        return result;
                    }
                    continue;
                }
                if (!argument.empty() && argument.front() == '-') {
                    result.valid = false;
                    result.error_message = "Unknown option: " + argument;
                    return result;
                }
            }
            positional.push_back(argument);
        }

        if (positional.size() > 1) {
            result.valid = false;
            result.error_message = "Unexpected extra argument: " + positional[1];
        } else if (!positional.empty()) {
            result.options.root = positional.front();
        }

        return result;
    }

    std::optional<std::string> validate_root(const std::filesystem::path& root) {
        std::error_code status_error;
        const auto status = std::filesystem::status(root, status_error);
        if (status_error || !std::filesystem::exists(status)) {
            return "Error: " + root.string() + " does not exist";
        }
        if (!std::filesystem::is_directory(status)) {
            return "Error: " + root.string() + " is not a directory";
        }
        return std::nullopt;
    }
}
