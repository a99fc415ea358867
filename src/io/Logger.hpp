#pragma once
#include <unordered_map>
#include <mutex>
#include <memory>
#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

// hash function for fmt::string_view<char> to use in unordered_map
namespace std {
template <>
    struct hash<fmt::basic_string_view<char>> {
        size_t operator()(const fmt::basic_string_view<char>& s) const noexcept {
            return std::hash<std::string_view>{}(std::string_view(s.data(), s.size()));
        }
    };
}

// Diagnostics go to stderr, stdout belongs to the progress display.
class Logger {
public:
    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    // stderr color logger named after the app
    static std::shared_ptr<Logger> create_console(const std::string& name);

    void set_verbosity(int verbosity);
    void set_banner(const std::string banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_arguments(const std::vector<std::string>&);
    void set_dedup_limit(int limit){ m_dedup_limit = limit; }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        if (m_dedup_limit > 0) {
            std::lock_guard<std::mutex> lock(m_mtx);

            int n = m_logged_messages[format]++; // do not count the arguments, just the format string
            if (n >= m_dedup_limit) {
                if (n == m_dedup_limit) {
                    std::string message = fmt::format(format, std::forward<Args>(args)...);
                    m_logger->warn("{} [repeated {} times. suppressing]", message, m_dedup_limit);
                }
                return;
            }
        }
        m_logger->warn(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        if (m_dedup_limit > 0) {
            std::lock_guard<std::mutex> lock(m_mtx);

            int n = m_logged_messages[format]++; // do not count the arguments, just the format string
            if (n >= m_dedup_limit) {
                if (n == m_dedup_limit) {
                    std::string message = fmt::format(format, std::forward<Args>(args)...);
                    m_logger->error("{} [repeated {} times. suppressing]", message, m_dedup_limit);
                }
                return;
            }
        }
        m_logger->error(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // logs only the first occurrence of a format string, regardless of arguments
    template <typename... Args>
    void warn_once(fmt::format_string<Args...> format, Args&&... args) {
        std::lock_guard<std::mutex> lock(m_mtx);

        if (m_warned_once.find(format) == m_warned_once.end()) {
            m_logger->warn(format, std::forward<Args>(args)...);
            m_warned_once[format]++;
        }
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();

    // level of the console sink only, the file sink keeps its own
    void set_console_level(spdlog::level::level_enum level);

    void flush() { m_logger->flush(); }

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::unordered_map<fmt::string_view, int> m_logged_messages;
    std::unordered_map<fmt::string_view, int> m_warned_once;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

// spdlog has no formatter for std::filesystem::path
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
