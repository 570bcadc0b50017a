#pragma once

#include <string>

namespace util {
    std::string current_iso8601();
    std::string redact_dsn(const std::string& dsn);
    bool is_valid_date(const std::string& ymd);
}
