#include <iomanip>
#include <sstream>
#include "disk_triage/utils.hpp"

namespace disk_triage {

    namespace {
        constexpr std::size_t kUnitCount = 4;
        constexpr double kUnitStep = 1024.0;

        void append_unicode_escape(std::ostringstream& oss, unsigned char c) {
            oss << "\\u"
                << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                << static_cast<int>(c)
                << std::dec << std::nouppercase;
        }

        // Length of the well-formed UTF-8 sequence starting at input[pos], or 0 if it is malformed.
        std::size_t utf8_sequence_length(const std::string& input, std::size_t pos) {
            const unsigned char lead = static_cast<unsigned char>(input[pos]);
            std::size_t length = 0;
            unsigned char min_second = 0x80;
            unsigned char max_second = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                length = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                length = 3;
                if (lead == 0xE0) min_second = 0xA0;
                if (lead == 0xED) max_second = 0x9F;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                length = 4;
                if (lead == 0xF0) min_second = 0x90;
                if (lead == 0xF4) max_second = 0x8F;
            } else {
                return 0;
            }

            if (pos + length > input.size()) {
                return 0;
            }
            for (std::size_t i = 1; i < length; ++i) {
                const unsigned char next = static_cast<unsigned char>(input[pos + i]);
                const unsigned char low = i == 1 ? min_second : 0x80;
                const unsigned char high = i == 1 ? max_second : 0xBF;
                if (next < low || next > high) {
                    return 0;
                }
            }
            return length;
        }
    }

    std::string format_human_size(std::int64_t bytes) {
        if (bytes < 0) {
            return "0 B";
        }
        if (bytes < 1024) {
            return std::to_string(bytes) + " B";
        }

        static const char* kUnits[kUnitCount] = {"B", "KB", "MB", "GB"};
        std::size_t unit_index = 0;
        double value = static_cast<double>(bytes);
        while (value >= kUnitStep && unit_index < kUnitCount - 1) {
            value /= kUnitStep;
            ++unit_index;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << value << ' ' << kUnits[unit_index];
        return oss.str();
    }

    std::string json_escape(const std::string& input) {
        std::ostringstream oss;
        std::size_t pos = 0;
        while (pos < input.size()) {
            const unsigned char c = static_cast<unsigned char>(input[pos]);
            if (c >= 0x80) {
                // Bytes that are not valid UTF-8 are escaped one by one.
                if (std::size_t length = utf8_sequence_length(input, pos); length > 0) {
                    oss.write(input.data() + pos, static_cast<std::streamsize>(length));
                    pos += length;
                } else {
                    append_unicode_escape(oss, c);
                    ++pos;
                }
                continue;
            }

            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\b': oss << "\\b"; break;
                case '\f': oss << "\\f"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (c < 0x20 || c == 0x7F) {
                        append_unicode_escape(oss, c);
                    } else {
                        oss << static_cast<char>(c);
                    }
            }
            ++pos;
        }
        return oss.str();
    }
}
