/*
 * Printf-style logging to stderr
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

enum LogLevel
{
    kLogDebug = 0,
    kLogInfo = 1,
    kLogWarning = 2,
    kLogError = 3,
    kLogNone = 4
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Accepts "debug", "info", "warning", "error" or "none"
LogLevel parse_log_level(const std::string &name);

void log_message(LogLevel level, const char *file, int line, const char *fmt, ...)
    __attribute__((format(printf, 4, 5)));

void log_hex(const char *label, const uint8_t *data, size_t size, const char *file, int line);

void log_exception(const OracleException &e);

} // namespace oracle
} // namespace fhecredit

#define DEBUG_LOG(...)                                                                             \
    ::fhecredit::oracle::log_message(::fhecredit::oracle::kLogDebug, __FILE__, __LINE__, __VA_ARGS__)
#define INFO_LOG(...)                                                                              \
    ::fhecredit::oracle::log_message(::fhecredit::oracle::kLogInfo, __FILE__, __LINE__, __VA_ARGS__)
#define WARNING_LOG(...)                                                                           \
    ::fhecredit::oracle::log_message(                                                              \
        ::fhecredit::oracle::kLogWarning, __FILE__, __LINE__, __VA_ARGS__)
#define ERROR_LOG(...)                                                                             \
    ::fhecredit::oracle::log_message(::fhecredit::oracle::kLogError, __FILE__, __LINE__, __VA_ARGS__)
#define EXCEPTION_LOG(e) ::fhecredit::oracle::log_exception(e)
#define DEBUG_HEX_LOG(label, data, size)                                                           \
    ::fhecredit::oracle::log_hex(label, data, size, __FILE__, __LINE__)
