#include "hwenc/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace HWENC {

std::shared_ptr<spdlog::logger> spdlogger(const std::string& name, const char* log_level) {
    if (!log_level) {
#ifdef NDEBUG
        log_level = "warn";
#else
        log_level = "debug";
#endif
    }
    std::filesystem::create_directories("logs");
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>("logs/" + name + ".log"));
    auto logger = std::make_shared<spdlog::logger>(name, begin(sinks), end(sinks));
    logger->set_level(spdlog::level::from_str(log_level));
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> init_logging() {
    static std::mutex           init_mutex;
    std::lock_guard<std::mutex> lock{init_mutex};
    if (auto existing = spdlog::get("hwenc")) {
        return existing;
    }
    return spdlogger("hwenc", std::getenv("HWENC_LOG_LEVEL"));
}

} // namespace HWENC
