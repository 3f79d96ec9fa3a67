#ifndef BACKEND_HPP
#define BACKEND_HPP

#include <future>
#include <memory>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "config.hpp"
#include "channel.hpp"
#include "message.hpp"

namespace pf {

    class stage_node;

    namespace exec {

        class worker_handle {

            public:
                virtual ~worker_handle() = default;

                /**
                 * Waits for the worker to terminate
                 * @return the worker's report, its end sentinel
                 */
                virtual end_message join() = 0;
        };

        typedef std::vector<std::unique_ptr<worker_handle>> worker_handles;

        /**
         * Concurrency substrate of a pipeline: creates the channels
         * and the workers of every stage
         */
        class backend {

            public:
                virtual ~backend() = default;

                virtual ebackend variant() const = 0;

                /**
                 * false if spawn runs the workers to completion before returning
                 */
                virtual bool concurrent() const = 0;

                /**
                 * How many workers are spawned for a stage requesting the given concurrency
                 */
                virtual uint worker_count(uint requested) const;

                virtual std::unique_ptr<channel> make_channel(std::size_t capacity) = 0;

                virtual worker_handles spawn(stage_node& stage, uint stage_index, uint count,
                        channel& input, channel* output) = 0;

                std::vector<end_message> join(worker_handles& handles);
        };

        /**
         * Each worker is a forked process, messages are serialized
         */
        class process_backend : public backend {

            public:
                process_backend(std::size_t max_message_size);

                virtual ebackend variant() const override;
                virtual bool concurrent() const override;
                virtual std::unique_ptr<channel> make_channel(std::size_t capacity) override;
                virtual worker_handles spawn(stage_node& stage, uint stage_index, uint count,
                        channel& input, channel* output) override;

            private:
                const std::size_t max_message_size;
        };

        /**
         * Each worker is a thread, messages stay in memory
         */
        class thread_backend : public backend {

            public:
                virtual ebackend variant() const override;
                virtual bool concurrent() const override;
                virtual std::unique_ptr<channel> make_channel(std::size_t capacity) override;
                virtual worker_handles spawn(stage_node& stage, uint stage_index, uint count,
                        channel& input, channel* output) override;
        };

        /**
         * One worker per stage, run to completion inside spawn
         */
        class synchronous_backend : public backend {

            public:
                virtual ebackend variant() const override;
                virtual bool concurrent() const override;
                virtual uint worker_count(uint requested) const override;
                virtual std::unique_ptr<channel> make_channel(std::size_t capacity) override;
                virtual worker_handles spawn(stage_node& stage, uint stage_index, uint count,
                        channel& input, channel* output) override;
        };

        std::unique_ptr<backend> make_backend(const config& cfg);

        class process_handle : public worker_handle {

            public:
                process_handle(pid_t pid, std::string stage_name, uint stage_index, uint worker_index,
                        std::unique_ptr<interprocess_channel> report_channel);
                virtual ~process_handle();

                virtual end_message join() override;

            private:
                end_message lost(const std::string& reason) const;

                pid_t pid;
                std::string stage_name;
                uint stage_index;
                uint worker_index;
                std::unique_ptr<interprocess_channel> report_channel;
                bool joined = false;
        };

        class thread_handle : public worker_handle {

            public:
                thread_handle(std::thread worker, std::future<end_message> report);
                virtual ~thread_handle();

                virtual end_message join() override;

            private:
                std::thread worker;
                std::future<end_message> report;
        };

        class finished_handle : public worker_handle {

            public:
                finished_handle(end_message report);

                virtual end_message join() override;

            private:
                end_message report;
        };
    }
}

#endif
