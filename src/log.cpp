#include "log.hpp"

#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pf {

    namespace log {

        namespace {

            std::shared_ptr<spdlog::logger> make_logger() {
                auto logger = spdlog::get("pipeflow");
                if(!logger) logger = spdlog::stderr_color_mt("pipeflow");

                spdlog::level::level_enum level = spdlog::level::warn;
                const char* name = std::getenv("PIPEFLOW_LOG_LEVEL");
                if(name != nullptr && *name != '\0') level = spdlog::level::from_str(name);
                logger->set_level(level);
                logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] [pid %P] %v");
                return logger;
            }
        }

        std::shared_ptr<spdlog::logger> get() {
            static std::shared_ptr<spdlog::logger> logger = make_logger();
            return logger;
        }
    }
}
