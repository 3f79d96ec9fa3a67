#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <exception>
#include <string>

namespace pf {

    enum class ebackend {
        ISOLATED_WORKER,        // forked worker processes, serialized transport
        SHARED_MEMORY_WORKER,   // worker threads sharing one address space
        SYNCHRONOUS             // one stage at a time in the calling thread
    };

    enum class efault_policy {
        THROW,  // execute/wait/results throw pipeline_failure when any fault was recorded
        RECORD  // faults are only kept in the pipeline's fault list
    };

    class config_exception : public std::exception {
        public:

            config_exception(std::string message);
            virtual ~config_exception() = default;
            virtual const char* what() const throw();

        private:
            std::string message;
    };

    std::string to_string(ebackend backend);

    /**
     * Accepts isolated/multiprocessing, shared/threading and synchronous/dummy
     * @throws config_exception for any other name
     */
    ebackend backend_from_string(const std::string& name);

    /**
     * Backend named by PIPEFLOW_BACKEND, isolated workers when it is unset.
     * The registry starts with this value.
     * @throws config_exception for an unknown name
     */
    ebackend backend_from_environment();

    /**
     * Process-wide default backend. It is read once when a pipeline starts,
     * so it must not be changed while a pipeline started under the previous
     * value is still running.
     */
    void set_backend(ebackend backend);
    ebackend get_backend();
    bool is_backend(ebackend backend);

    struct config {

        ebackend backend = ebackend::ISOLATED_WORKER;
        std::size_t channel_capacity = 256;
        std::size_t max_message_size = 64 * 1024;
        efault_policy fault_policy = efault_policy::THROW;

        /**
         * Registry backend with channel limits taken from
         * PIPEFLOW_CHANNEL_CAPACITY and PIPEFLOW_MAX_MESSAGE_SIZE
         */
        static config current();

        static config with_backend(ebackend backend);
    };
}

#endif
