#pragma once

#include "log.hpp"

#include <string>

namespace levtools {

/* Process-wide settings, read once from the environment:
 *
 *   LEVTOOLS_LOG_LEVEL  debug|notice|warning|error (default warning)
 *
 * Per-call tuning (substitution weight, prefix weight, string weights) is
 * passed as arguments instead. */
class config {
public:
    log::level_e log_level;

    config();
    explicit config(const char* log_level_name);

    static const config& get();
};

log::level_e parse_log_level(const std::string& name, log::level_e fallback);

} // namespace levtools
