#pragma once

#include <stdexcept>
#include <string>

namespace levtools {

/* Error codes returned by editop check functions */
enum EditOpError {
    EDIT_ERR_OK = 0,
    EDIT_ERR_TYPE,  /* nonexistent edit type */
    EDIT_ERR_OUT,   /* edit out of string bounds */
    EDIT_ERR_ORDER, /* ops are not ordered */
    EDIT_ERR_BLOCK, /* inconsistent block boundaries (block ops) */
    EDIT_ERR_SPAN,  /* sequence is not a full transformation (block ops) */
    EDIT_ERR_LAST
};

const char* error_message(EditOpError err);

class error : public std::runtime_error {
public:
    explicit error(const std::string& what_arg) : std::runtime_error(what_arg)
    {}
};

/* hamming distance of strings with different lengths */
class length_mismatch : public error {
public:
    explicit length_mismatch(const std::string& what_arg) : error(what_arg)
    {}
};

class invalid_argument : public error {
public:
    explicit invalid_argument(const std::string& what_arg) : error(what_arg)
    {}
};

/* edit operations failing the structural checks */
class invalid_edit_ops : public error {
public:
    explicit invalid_edit_ops(EditOpError code);
    invalid_edit_ops(EditOpError code, const std::string& what_arg);

    EditOpError code() const noexcept
    {
        return m_code;
    }

private:
    EditOpError m_code;
};

} // namespace levtools
