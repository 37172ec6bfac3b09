#include "lib/common/oracle_logger.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

#include "lib/common/encoders.hpp"

namespace
{

std::atomic<int> log_level(fhecredit::oracle::kLogInfo);
std::mutex log_mutex;

const char *level_tag(fhecredit::oracle::LogLevel level)
{
    switch (level)
    {
    case fhecredit::oracle::kLogDebug:
        return "DEBUG";
    case fhecredit::oracle::kLogInfo:
        return "INFO";
    case fhecredit::oracle::kLogWarning:
        return "WARNING";
    case fhecredit::oracle::kLogError:
        return "ERROR";
    default:
        return "";
    }
}

const char *base_name(const char *file)
{
    const char *file_name = strrchr(file, '/');
    return file_name == nullptr ? file : file_name + 1;
}

} // namespace

namespace fhecredit
{
namespace oracle
{

void set_log_level(LogLevel level) { log_level.store(level); }

LogLevel get_log_level() { return static_cast<LogLevel>(log_level.load()); }

LogLevel parse_log_level(const std::string &name)
{
    if (name == "debug")
        return kLogDebug;
    if (name == "info" || name.empty())
        return kLogInfo;
    if (name == "warning")
        return kLogWarning;
    if (name == "error")
        return kLogError;
    if (name == "none")
        return kLogNone;

    THROW_EXCEPTION(kConfigurationError, "Log level \"" + name + "\" not known");
}

void log_message(LogLevel level, const char *file, int line, const char *fmt, ...)
{
    if (level < get_log_level() || level == kLogNone)
        return;

    char buf[BUFSIZ] = {'\0'};
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, BUFSIZ, fmt, ap);
    va_end(ap);

    std::lock_guard<std::mutex> lock(log_mutex);
    fprintf(stderr, "[%s] %s:%i: %s\n", level_tag(level), base_name(file), line, buf);
}

void log_hex(const char *label, const uint8_t *data, size_t size, const char *file, int line)
{
    if (get_log_level() > kLogDebug)
        return;

    const std::string hex = hex_encode(std::vector<uint8_t>(data, data + size));
    log_message(kLogDebug, file, line, "%s (%zu bytes): %s", label, size, hex.c_str());
}

void log_exception(const OracleException &e)
{
    if (kLogError < get_log_level())
        return;

    std::lock_guard<std::mutex> lock(log_mutex);
    fprintf(stderr, "[%s] %s\n", level_tag(kLogError), e.what());
}

} // namespace oracle
} // namespace fhecredit
