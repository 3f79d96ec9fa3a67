#include "channel.hpp"

#include <atomic>
#include <stdexcept>
#include <unistd.h>

namespace ipc = boost::interprocess;

namespace pf {

    namespace exec {

        // --- memory_channel -----------------

        memory_channel::memory_channel(std::size_t capacity) : _capacity(capacity) {
            if(_capacity == 0) throw std::invalid_argument("channel capacity must be positive");
        }

        void memory_channel::send(message mes) {
            std::unique_lock<std::mutex> lock(queue_mutex);
            not_full.wait(lock, [this]() { return queue.size() < _capacity; });
            queue.push_back(std::move(mes));
            lock.unlock();
            not_empty.notify_one();
        }

        message memory_channel::receive() {
            std::unique_lock<std::mutex> lock(queue_mutex);
            not_empty.wait(lock, [this]() { return !queue.empty(); });
            message mes = std::move(queue.front());
            queue.pop_front();
            lock.unlock();
            not_full.notify_one();
            return mes;
        }

        bool memory_channel::try_receive(message& mes) {
            std::unique_lock<std::mutex> lock(queue_mutex);
            if(queue.empty()) return false;
            mes = std::move(queue.front());
            queue.pop_front();
            lock.unlock();
            not_full.notify_one();
            return true;
        }

        bool memory_channel::serializing() const {
            return false;
        }

        std::size_t memory_channel::capacity() const {
            return _capacity;
        }

        // --- synchronous_channel -----------------

        void synchronous_channel::send(message mes) {
            queue.push_back(std::move(mes));
        }

        message synchronous_channel::receive() {
            if(queue.empty())
                throw std::runtime_error("synchronous channel is empty and no end was sent");
            message mes = std::move(queue.front());
            queue.pop_front();
            return mes;
        }

        bool synchronous_channel::try_receive(message& mes) {
            if(queue.empty()) return false;
            mes = std::move(queue.front());
            queue.pop_front();
            return true;
        }

        bool synchronous_channel::serializing() const {
            return false;
        }

        std::size_t synchronous_channel::capacity() const {
            return 0; // unbounded
        }

        // --- interprocess_channel -----------------

        interprocess_channel::interprocess_channel(std::size_t capacity, std::size_t max_message_size)
            : _capacity(capacity),
            max_message_size(max_message_size),
            _name(unique_name()),
            owner(::getpid())
        {
            if(_capacity == 0) throw std::invalid_argument("channel capacity must be positive");

            ipc::message_queue::remove(_name.c_str());
            queue.reset(new ipc::message_queue(ipc::create_only, _name.c_str(), _capacity, max_message_size));
        }

        interprocess_channel::~interprocess_channel() {
            queue.reset();
            if(::getpid() == owner) ipc::message_queue::remove(_name.c_str());
        }

        void interprocess_channel::send(message mes) {
            std::string bytes = mes.encode();
            if(bytes.size() > max_message_size)
                throw serialization::serialization_exception(
                        "message of " + std::to_string(bytes.size()) + " bytes exceeds the limit of "
                        + std::to_string(max_message_size) + " bytes");

            queue->send(bytes.data(), bytes.size(), 0);
        }

        message interprocess_channel::receive() {
            std::string buffer(max_message_size, '\0');
            ipc::message_queue::size_type received = 0;
            unsigned int priority = 0;

            queue->receive(&buffer[0], buffer.size(), received, priority);
            buffer.resize(received);
            return message::decode(buffer);
        }

        bool interprocess_channel::try_receive(message& mes) {
            std::string buffer(max_message_size, '\0');
            ipc::message_queue::size_type received = 0;
            unsigned int priority = 0;

            if(!queue->try_receive(&buffer[0], buffer.size(), received, priority)) return false;
            buffer.resize(received);
            mes = message::decode(buffer);
            return true;
        }

        bool interprocess_channel::serializing() const {
            return true;
        }

        std::size_t interprocess_channel::capacity() const {
            return _capacity;
        }

        std::string interprocess_channel::unique_name() {
            static std::atomic<unsigned long> counter(0);
            return "pipeflow." + std::to_string(::getpid()) + "." + std::to_string(counter++);
        }
    }
}
