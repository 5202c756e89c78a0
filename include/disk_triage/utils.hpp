#pragma once
#include <string>
#include <cstdint>

namespace disk_triage {
    std::string format_human_size(std::int64_t bytes);
    std::string json_escape(const std::string& input);
}
