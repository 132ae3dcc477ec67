/*
 * log.cpp
 * levtools: Levenshtein distances, string similarities, edit operation
 * algebra, median strings and other goodies.
 *
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for
 * more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA.
 **/

#include "log.hpp"
#include "config.hpp"

#include <ctime>
#include <iostream>
#include <stdexcept>

namespace levtools {

log::log(const std::string& _facility, const level_e _l) : facility(_facility), l(_l), os()
{}

log::~log()
{
    if (enabled(l)) std::cerr << os.str() << std::endl;
}

std::ostream& log::operator()()
{
    if (!enabled(l)) return os;

    char time_str[80];
    std::time_t t = std::time(NULL);
    std::strftime(time_str, sizeof(time_str), "%F %T", std::localtime(&t));

    os << time_str << " [" << facility << "] " << to_string(l) << ": ";
    return os;
}

bool log::enabled(const level_e l)
{
    return l >= config::get().log_level;
}

std::string to_string(const log::level_e l)
{
    switch (l) {
    case log::DEBUG: return "debug";
    case log::NOTICE: return "notice";
    case log::WARNING: return "warning";
    case log::ERROR: return "error";
    default: throw std::logic_error("invalid log level");
    }
}

} // namespace levtools
