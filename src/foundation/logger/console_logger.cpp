/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "crs/foundation/console_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>

#include <iostream>
#include <memory>

namespace crs::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

std::string_view levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO";
        case kci::log_level::warning:  return "WARNING";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRITICAL";
        default:                       return "OFF";
    }
}

} // namespace

ConsoleLogger::ConsoleLogger() : out_(std::cerr) {}

ConsoleLogger::ConsoleLogger(std::ostream& out) : out_(out) {}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level,
                                              const std::string& message) {
    if (is_enabled(level)) {
        std::lock_guard lock(mutex_);
        out_ << levelTag(level) << ' ' << message << '\n';
    }
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(
    kci::log_level level, std::string_view message,
    const kci::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(const kci::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(kci::log_level level) const {
    return level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(kci::log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kci::log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    out_.flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

void ConsoleLogger::installAsDefault() {
    kci::GlobalLoggerRegistry::instance().set_default_logger(
        std::make_shared<ConsoleLogger>());
}

} // namespace crs::foundation
