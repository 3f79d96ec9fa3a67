#ifndef LOG_HPP
#define LOG_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace pf {

    namespace log {

        /**
         * Library logger "pipeflow" on stderr. The level comes from
         * PIPEFLOW_LOG_LEVEL (spdlog level names), warn by default.
         */
        std::shared_ptr<spdlog::logger> get();
    }
}

#endif
