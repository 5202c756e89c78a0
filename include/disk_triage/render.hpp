#pragma once
#include <ostream>
#include "disk_triage/types.hpp"

namespace disk_triage {
    void render_text(const SummaryReport& report, std::ostream& out);
    void render_json(const SummaryReport& report, std::ostream& out);
    void render_report(const SummaryReport& report, OutputFormat format, std::ostream& out);
    void render_items_json(const ItemTable& table, std::ostream& out);
}
