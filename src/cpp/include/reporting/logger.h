#ifndef KGSCORE_LOGGER_H
#define KGSCORE_LOGGER_H
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

using std::shared_ptr;
using std::string;

/**
 * Sink setup for the SPDLOG_* calls made by the score functions.
 *
 * The library never installs a logger itself. A program embedding kgscore constructs one KGScoreLogger at startup
 * and keeps it alive for as long as it scores triples:
 *
 *     KGScoreLogger logger = KGScoreLogger("/tmp/run", getLogLevel("warn"));
 *
 * The constructor replaces the spdlog default logger. Construction messages and numeric warnings then reach the
 * console at console_level and above. If log_dir is non empty, every message at debug and above is also written to
 * <log_dir>/logs/debug.log, info and above to info.log, and warnings to warn.log. Without a log_dir only the console
 * sink is attached.
 */
class KGScoreLogger {
   private:
    shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    std::vector<spdlog::sink_ptr> file_sinks_;

    void addFileSink(const string &log_dir, const string &name, spdlog::level::level_enum level) {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fmt::format("{}/logs/{}.log", log_dir, name), true);
        sink->set_level(level);
        sink->set_pattern("[%l] [%x %T.%e] [TID:%t] [%s:%#] %v");
        file_sinks_.emplace_back(sink);
    }

   public:
    shared_ptr<spdlog::logger> main_logger_;

    KGScoreLogger(string log_dir = "", spdlog::level::level_enum console_level = spdlog::level::info) {
        console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink_->set_level(console_level);
        console_sink_->set_pattern("[%x %T.%e] [kgscore] %v");

        if (!log_dir.empty()) {
            addFileSink(log_dir, "debug", spdlog::level::debug);
            addFileSink(log_dir, "info", spdlog::level::info);
            addFileSink(log_dir, "warn", spdlog::level::warn);
        }

        std::vector<spdlog::sink_ptr> sinks = file_sinks_;
        sinks.emplace_back(console_sink_);

        spdlog::drop("kgscore");
        main_logger_ = std::make_shared<spdlog::logger>("kgscore", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::trace);
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);
        spdlog::set_default_logger(main_logger_);
    }

    void setConsoleLogLevel(spdlog::level::level_enum level) { console_sink_->set_level(level); }

    // number of per-level file sinks, zero when logging to the console only
    size_t numFileSinks() { return file_sinks_.size(); }

    void flush() { main_logger_->flush(); }
};
#endif  // KGSCORE_LOGGER_H
