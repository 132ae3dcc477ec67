/*
 * errors.cpp
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

#include "errors.hpp"

namespace levtools {

const char* error_message(EditOpError err)
{
    switch (err) {
    case EDIT_ERR_OK: return "no error";
    case EDIT_ERR_TYPE: return "illegal edit operation type";
    case EDIT_ERR_OUT: return "edit operation position out of string bounds";
    case EDIT_ERR_ORDER: return "edit operations are not ordered";
    case EDIT_ERR_BLOCK: return "inconsistent block boundaries";
    case EDIT_ERR_SPAN: return "block operations do not span the complete strings";
    default: return "unknown edit operation error";
    }
}

invalid_edit_ops::invalid_edit_ops(EditOpError code) : error(error_message(code)), m_code(code)
{}

invalid_edit_ops::invalid_edit_ops(EditOpError code, const std::string& what_arg)
    : error(what_arg), m_code(code)
{}

} // namespace levtools
