#pragma once

/// @file console_logger.hpp
/// @brief Stream-backed kcenon ILogger used as the default sink by the CLI.

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace crs::foundation {

/// Writes "LEVEL message" lines to a std::ostream (std::cerr unless
/// another stream is supplied). The stream must outlive the logger.
class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    ConsoleLogger();
    explicit ConsoleLogger(std::ostream& out);

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;

    kcenon::common::VoidResult set_level(
        kcenon::common::interfaces::log_level level) override;

    kcenon::common::interfaces::log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

    /// Install a ConsoleLogger on std::cerr as the registry's default logger.
    static void installAsDefault();

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    std::atomic<kcenon::common::interfaces::log_level> minLevel_{
        kcenon::common::interfaces::log_level::trace};
};

} // namespace crs::foundation
