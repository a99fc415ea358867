/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * Console output goes to stderr so that it never lands in the middle of a
 * progress line drawn on stdout. An optional file sink can be attached later,
 * at which point the file receives DEBUG and above while the console keeps the
 * level selected by -v/-q.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <fstream>

/**
 * @brief Creates a Logger writing to a colored stderr sink.
 *
 * Reuses an already registered spdlog logger with the same name, so tests can
 * create several Logger wrappers without tripping spdlog's duplicate check.
 *
 * @param name spdlog registry name.
 * @return Shared Logger wrapper.
 */
std::shared_ptr<Logger> Logger::create_console(const std::string& name){
    auto existing = spdlog::get(name);
    if( existing ){
        return std::make_shared<Logger>(existing);
    }
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto spd = std::make_shared<spdlog::logger>(name, sink);
    spd->set_pattern("[%^%l%$] %v");
    spdlog::register_logger(spd);
    return std::make_shared<Logger>(spd);
}

/**
 * @brief Sets the logging verbosity level.
 *
 * Maps integer verbosity to spdlog levels:
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    if( verbosity <= -4 ){
        m_logger->set_level(spdlog::level::off);
        return;
    }
    switch( verbosity ){
        case -3:
            m_logger->set_level(spdlog::level::critical);
            break;
        case -2:
            m_logger->set_level(spdlog::level::err);
            break;
        case -1:
            m_logger->set_level(spdlog::level::warn);
            break;
        case 0: // default level
            m_logger->set_level(spdlog::level::info);
            break;
        case 1:
            m_logger->set_level(spdlog::level::debug);
            break;
        default:
            m_logger->set_level(spdlog::level::trace);
            break;
    }
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.clear();
    for( int i = 0; i < argc; ++i ){
        m_arguments.push_back(argv[i]);
    }
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

// not a comprehensive shell-escape
static std::string quote_if_needed(const std::string& arg) {
    if (arg.find(' ') != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

static std::vector<std::string> quote_if_needed(const std::vector<std::string>& args) {
    std::vector<std::string> quoted_args;
    quoted_args.reserve(args.size());
    for (const auto& arg : args) {
        quoted_args.push_back(quote_if_needed(arg));
    }
    return quoted_args;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file is opened in append mode and gets DEBUG or higher. Only one file
 * can be attached, later calls are ignored.
 *
 * @param fname Path to the log file.
 * @return True if file sink was added, false if already logging to a file or on error.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    try {
        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());
    } catch( const spdlog::spdlog_ex& e ){
        m_logger->error("Failed to open log file {}: {}", fname, e.what());
        return false;
    }

    // if current logger level is DEBUG or TRACE => file level just inherits it
    // otherwise, file level is DEBUG
    if( m_logger->level() != spdlog::level::debug && m_logger->level() != spdlog::level::trace ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level()); // move current level to console sink
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Logs session start information including banner and arguments.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->debug("==============================================================");
        m_logger->debug("{}", m_banner);
        m_logger->debug("==============================================================");
    }

    m_logger->debug("started as {}", fmt::join(quote_if_needed(m_arguments), " "));
    m_logger->debug("logging to {}", m_fname.empty() ? std::string("console only") : m_fname.string());
}

void Logger::set_console_level(spdlog::level::level_enum level) {
    m_logger->sinks().front()->set_level(level); // XXX assuming that first sink is console
}
