#define BOOST_TEST_MODULE channel_test

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/test/unit_test.hpp>
#include "../channel.hpp"
#include "../task.hpp"

using namespace pf;

BOOST_AUTO_TEST_SUITE(channel_test)

    BOOST_AUTO_TEST_CASE(memory_channel_fifo) {

        exec::memory_channel channel(8);
        BOOST_CHECK(!channel.serializing());
        BOOST_CHECK_EQUAL(channel.capacity(), 8u);

        for(int i = 0; i < 5; i++) channel.send(pack(i, false));
        channel.send(message::end());

        for(int i = 0; i < 5; i++) BOOST_CHECK_EQUAL(unpack<int>(channel.receive()), i);
        BOOST_CHECK(channel.receive().is_end());

        message mes;
        BOOST_CHECK(!channel.try_receive(mes));
        BOOST_CHECK_THROW(exec::memory_channel(0), std::invalid_argument);
    }

    BOOST_AUTO_TEST_CASE(memory_channel_backpressure) {

        exec::memory_channel channel(2);
        std::atomic<int> sent(0);

        std::thread producer([&]() {
            for(int i = 0; i < 5; i++) {
                channel.send(pack(i, false));
                sent++;
            }
        });

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while(sent < 2 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        // the third send blocks until somebody receives
        BOOST_CHECK_EQUAL(sent.load(), 2);

        for(int i = 0; i < 5; i++) BOOST_CHECK_EQUAL(unpack<int>(channel.receive()), i);
        producer.join();
        BOOST_CHECK_EQUAL(sent.load(), 5);
    }

    BOOST_AUTO_TEST_CASE(synchronous_channel_unbounded) {

        exec::synchronous_channel channel;
        BOOST_CHECK_EQUAL(channel.capacity(), 0u);

        for(int i = 0; i < 1000; i++) channel.send(pack(i, false));
        for(int i = 0; i < 1000; i++) BOOST_CHECK_EQUAL(unpack<int>(channel.receive()), i);

        BOOST_CHECK_THROW(channel.receive(), std::runtime_error);
    }

    BOOST_AUTO_TEST_CASE(interprocess_channel_in_process) {

        exec::interprocess_channel channel(4, 1024);
        BOOST_CHECK(channel.serializing());
        BOOST_CHECK_EQUAL(channel.capacity(), 4u);

        channel.send(pack(std::string("hello"), true));
        channel.send(message::end());

        BOOST_CHECK_EQUAL(unpack<std::string>(channel.receive()), "hello");
        BOOST_CHECK(channel.receive().is_end());

        message mes;
        BOOST_CHECK(!channel.try_receive(mes));
    }

    BOOST_AUTO_TEST_CASE(interprocess_channel_limits) {

        exec::interprocess_channel channel(4, 256);

        BOOST_CHECK_THROW(channel.send(pack(std::string(1024, 'x'), true)),
                serialization::serialization_exception);
        BOOST_CHECK_THROW(channel.send(pack(1, false)), serialization::serialization_exception);
    }

    BOOST_AUTO_TEST_CASE(interprocess_channel_across_fork) {

        exec::interprocess_channel channel(2, 1024);

        pid_t pid = ::fork();
        BOOST_REQUIRE(pid >= 0);
        if(pid == 0) {
            int status = 0;
            try {
                for(int i = 0; i < 10; i++) channel.send(pack(i, true));
                channel.send(message::end());
            } catch(const std::exception&) {
                status = 1;
            }
            ::_exit(status);
        }

        std::vector<int> received;
        message mes;
        while(!(mes = channel.receive()).is_end()) received.push_back(unpack<int>(mes));

        int status = 0;
        ::waitpid(pid, &status, 0);
        BOOST_CHECK(WIFEXITED(status) && WEXITSTATUS(status) == 0);
        BOOST_CHECK(received == std::vector<int>({ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 }));
    }

BOOST_AUTO_TEST_SUITE_END ( )
