#pragma once

#include <sstream>
#include <string>

namespace levtools {

/* One message per instance, flushed to stderr on destruction when the
 * level passes the configured threshold:
 *
 *   log("median", log::DEBUG)() << "length " << len;
 */
class log {
public:
    enum level_e {
        DEBUG,
        NOTICE,
        WARNING,
        ERROR
    };

    log(const std::string& facility, const level_e l);
    ~log();

    std::ostream& operator()();

    static bool enabled(const level_e l);

private:
    std::string facility;
    level_e l;

    std::ostringstream os;
};

std::string to_string(const log::level_e l);

} // namespace levtools
