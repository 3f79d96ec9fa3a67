#include "config.hpp"

#include <atomic>
#include <cstdlib>
#include <stdexcept>

namespace pf {

    namespace {

        std::atomic<ebackend>& registry() {
            static std::atomic<ebackend> backend(backend_from_environment());
            return backend;
        }

        std::size_t size_from_env(const char* variable, std::size_t fallback) {
            const char* value = std::getenv(variable);
            if(value == nullptr || *value == '\0') return fallback;

            std::size_t parsed;
            try {
                std::size_t pos = 0;
                parsed = std::stoul(value, &pos);
                if(pos != std::string(value).size()) throw std::invalid_argument(value);
            } catch(const std::exception&) {
                throw config_exception(std::string(variable) + " is not a number: " + value);
            }
            if(parsed == 0) throw config_exception(std::string(variable) + " must be positive");
            return parsed;
        }
    }

    // --- config_exception -----------------

    config_exception::config_exception(std::string message) : message(std::move(message)) { }

    const char* config_exception::what() const throw() {
        return message.c_str();
    }

    // --- registry -----------------

    std::string to_string(ebackend backend) {
        switch(backend) {
            case ebackend::ISOLATED_WORKER:
                return "isolated";
            case ebackend::SHARED_MEMORY_WORKER:
                return "shared";
            case ebackend::SYNCHRONOUS:
                return "synchronous";
        }
        return "unknown";
    }

    ebackend backend_from_string(const std::string& name) {
        if(name == "isolated" || name == "multiprocessing") return ebackend::ISOLATED_WORKER;
        if(name == "shared" || name == "threading") return ebackend::SHARED_MEMORY_WORKER;
        if(name == "synchronous" || name == "dummy") return ebackend::SYNCHRONOUS;
        throw config_exception("Pipeline backend is not valid: " + name);
    }

    ebackend backend_from_environment() {
        const char* name = std::getenv("PIPEFLOW_BACKEND");
        if(name == nullptr || *name == '\0') return ebackend::ISOLATED_WORKER;
        return backend_from_string(name);
    }

    void set_backend(ebackend backend) {
        registry().store(backend);
    }

    ebackend get_backend() {
        return registry().load();
    }

    bool is_backend(ebackend backend) {
        return get_backend() == backend;
    }

    // --- config -----------------

    config config::current() {
        config cfg;
        cfg.backend = get_backend();
        cfg.channel_capacity = size_from_env("PIPEFLOW_CHANNEL_CAPACITY", cfg.channel_capacity);
        cfg.max_message_size = size_from_env("PIPEFLOW_MAX_MESSAGE_SIZE", cfg.max_message_size);
        return cfg;
    }

    config config::with_backend(ebackend backend) {
        config cfg = current();
        cfg.backend = backend;
        return cfg;
    }
}
