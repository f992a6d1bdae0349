// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_UTIL_COMMON_LOGGING_H_
#define EVOUCHER_SRC_UTIL_COMMON_LOGGING_H_

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace evoucher::logging {
    /// No-op stream destination for log output.
    class null_stream : public std::ostream {
      public:
        /// Constructor. Sets the instance's stream buffer to nullptr.
        null_stream();

        template<typename T>
        auto operator<<(const T& /* unused */) -> null_stream& {
            return *this;
        }
    };

    /// Set of possible log levels. Used to configure \ref log. Each level
    /// implies that the logger should output messages at that level or
    /// greater.
    enum class log_level : uint8_t {
        /// Fine-grained, fully verbose operating information.
        trace,
        /// Diagnostic information.
        debug,
        /// General information about the state of the system.
        info,
        /// Potentially unintended, unexpected, or undesirable behavior.
        warn,
        /// Serious, critical errors.
        error,
        /// Only fatal errors.
        fatal
    };

    /// Generalized logging class. Supports logging to stdout or an output file
    /// at a specified log level.
    class log {
      public:
        /// \brief Creates a new log instance.
        ///
        /// By default, logs to stdout and a \ref null_stream.
        /// \param level the log level (and above) to print to the logger(s).
        /// \param use_stdout indicates if the logger should print to stdout.
        /// \param logfile a pointer to a logfile stream.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile
                     = std::make_unique<null_stream>());

        /// Enables or disables printing the log output to stdout.
        /// \param stdout_enabled true if the log should print to stdout.
        void set_stdout_enabled(bool stdout_enabled);

        /// Changes the logfile output to another destination.
        /// \param logfile the stream to which to write log output.
        void set_logfile(std::unique_ptr<std::ostream> logfile);

        /// Changes the log level threshold.
        /// \param level anything for this log level and more severe will
        ///              be logged to the configured outputs.
        void set_loglevel(log_level level);

        /// Indicates whether a statement at the given level would be written.
        /// Lets callers skip building expensive diagnostic strings.
        /// \param level level to check.
        /// \return true if the level is at or above the current threshold.
        [[nodiscard]] auto is_enabled(log_level level) const -> bool;

        /// Flushes the log buffer.
        static void flush();

        /// Writes the argument list to the trace log level.
        template<typename... Targs>
        void trace(Targs&&... args) {
            write_log_statement(log_level::trace,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the debug log level.
        template<typename... Targs>
        void debug(Targs&&... args) {
            write_log_statement(log_level::debug,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the info log level.
        template<typename... Targs>
        void info(Targs&&... args) {
            write_log_statement(log_level::info, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the warn log level.
        template<typename... Targs>
        void warn(Targs&&... args) {
            write_log_statement(log_level::warn, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the error log level.
        template<typename... Targs>
        void error(Targs&&... args) {
            write_log_statement(log_level::error,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the fatal log level. Calls exit to
        /// terminate the program.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            write_log_statement(log_level::fatal,
                                std::forward<Targs>(args)...);
            exit(EXIT_FAILURE);
        }

        /// Returns the current log level of the logger.
        /// \returns the current log level.
        [[nodiscard]] auto get_log_level() const -> log_level;

      private:
        bool m_stdout{true};
        log_level m_loglevel{};
        std::mutex m_stream_mut{};
        std::unique_ptr<std::ostream> m_logfile;

        static void write_log_prefix(std::stringstream& ss, log_level level);

        template<typename... Targs>
        void write_log_statement(log_level level, Targs&&... args) {
            if(is_enabled(level)) {
                std::stringstream ss;
                write_log_prefix(ss, level);
                ((ss << " " << args), ...);
                ss << "\n";
                auto formatted_statement = ss.str();
                const std::lock_guard<std::mutex> lock(m_stream_mut);
                if(m_stdout) {
                    std::cout << formatted_statement;
                }
                *m_logfile << formatted_statement;
            }
        }
    };

    /// Returns the fixed-width upper-case name of a log level, as written in
    /// the log prefix.
    /// \param level log level to name.
    /// \return level name padded to five characters.
    auto to_string(log_level level) -> std::string;

    /// Returns the given logger, or a logger that writes nowhere if it is
    /// nullptr.
    /// \param logger log instance, may be nullptr.
    /// \return a non-null log instance.
    auto or_silent(std::shared_ptr<log> logger) -> std::shared_ptr<log>;

    /// \brief Parses a capitalized string into a log level.
    ///
    /// Possible input values: TRACE, DEBUG, INFO, WARN, ERROR, and FATAL.
    /// \param level string corresponding to a log level.
    /// \return the log level, or std::nullopt if the input does not correspond
    ///         to a known log level.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;
}

#endif // EVOUCHER_SRC_UTIL_COMMON_LOGGING_H_
