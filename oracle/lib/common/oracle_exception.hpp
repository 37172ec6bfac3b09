#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

#include "include/fhecredit_status_codes.h"
#include "include/fhecredit_status_message.h"

namespace fhecredit
{
namespace oracle
{

class OracleException : public std::runtime_error
{
    std::string message_;
    OracleStatusCode code_;

    static const char *base_name(const char *file)
    {
        const char *file_name = strrchr(file, '/');
        if (file_name == nullptr)
            return file;
        return file_name + 1;
    }

public:
    OracleException(
        OracleStatusCode code, const std::string &info, const char *file, const char *func, int line)
        : std::runtime_error(info), code_(code)
    {
        message_ = std::string(base_name(file)) + ":" + std::string(func) + ":" +
                   std::to_string(line) + ": " + "(" + oracle_status_name(code) + "-" +
                   std::to_string(static_cast<int>(code)) + ") " + info;
    }

    OracleException(OracleStatusCode code, const char *file, const char *func, int line)
        : std::runtime_error(oracle_status_message(code)), code_(code)
    {
        message_ = std::string(base_name(file)) + ":" + std::string(func) + ":" +
                   std::to_string(line) + ": " + oracle_status_message(code);
    }

    const char *what() const noexcept override { return message_.c_str(); }

    OracleStatusCode get_code() const { return code_; }
};

#define THROW_EXCEPTION(code, arg) throw OracleException(code, arg, __FILE__, __func__, __LINE__);
#define THROW_ERROR_CODE(code) throw OracleException(code, __FILE__, __func__, __LINE__);

} // namespace oracle
} // namespace fhecredit
