#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <boost/interprocess/ipc/message_queue.hpp>

#include "message.hpp"

namespace pf {

    namespace exec {

        /**
         * Queue of messages between adjacent stages. Every worker of the
         * producing stage sends into it and every worker of the consuming
         * stage receives from it.
         */
        class channel {

            public:
                virtual ~channel() = default;

                /**
                 * Blocks while the channel is full
                 */
                virtual void send(message mes) = 0;

                /**
                 * Blocks while the channel is empty
                 */
                virtual message receive() = 0;
                virtual bool try_receive(message& mes) = 0;

                /**
                 * true when payloads must travel as serialized data
                 */
                virtual bool serializing() const = 0;
                virtual std::size_t capacity() const = 0;
        };

        /**
         * Bounded queue for workers sharing one address space
         */
        class memory_channel : public channel {

            public:
                memory_channel(std::size_t capacity);

                virtual void send(message mes) override;
                virtual message receive() override;
                virtual bool try_receive(message& mes) override;
                virtual bool serializing() const override;
                virtual std::size_t capacity() const override;

            private:
                const std::size_t _capacity;
                std::deque<message> queue;
                std::mutex queue_mutex;
                std::condition_variable not_empty;
                std::condition_variable not_full;
        };

        /**
         * Unbounded queue without any locking, used when stages run one
         * after another in the same thread. Receiving from an empty channel
         * would never return, so it throws instead.
         */
        class synchronous_channel : public channel {

            public:
                virtual void send(message mes) override;
                virtual message receive() override;
                virtual bool try_receive(message& mes) override;
                virtual bool serializing() const override;
                virtual std::size_t capacity() const override;

            private:
                std::deque<message> queue;
        };

        /**
         * Bounded queue in shared memory, shared with forked worker processes.
         * Only the creating process removes the queue.
         */
        class interprocess_channel : public channel {

            public:
                interprocess_channel(std::size_t capacity, std::size_t max_message_size);
                virtual ~interprocess_channel();

                interprocess_channel(const interprocess_channel&) = delete;
                interprocess_channel& operator=(const interprocess_channel&) = delete;

                virtual void send(message mes) override;
                virtual message receive() override;
                virtual bool try_receive(message& mes) override;
                virtual bool serializing() const override;
                virtual std::size_t capacity() const override;

            private:
                static std::string unique_name();

                const std::size_t _capacity;
                const std::size_t max_message_size;
                const std::string _name;
                const pid_t owner;
                std::unique_ptr<boost::interprocess::message_queue> queue;
        };
    }
}

#endif
