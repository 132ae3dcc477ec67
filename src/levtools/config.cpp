/*
 * config.cpp
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

#include "config.hpp"

#include <cstdlib>

namespace levtools {

config::config() : config(std::getenv("LEVTOOLS_LOG_LEVEL"))
{}

config::config(const char* log_level_name) : log_level(log::WARNING)
{
    if (log_level_name) log_level = parse_log_level(log_level_name, log::WARNING);
}

const config& config::get()
{
    /* initialized once, read-only afterwards */
    static const config instance;
    return instance;
}

log::level_e parse_log_level(const std::string& name, log::level_e fallback)
{
    if (name == "debug") return log::DEBUG;
    if (name == "notice") return log::NOTICE;
    if (name == "warning") return log::WARNING;
    if (name == "error") return log::ERROR;
    return fallback;
}

} // namespace levtools
