#define BOOST_TEST_MODULE config_test

#include <cstdlib>
#include <string>
#include <boost/test/unit_test.hpp>
#include "../config.hpp"
#include "../backend.hpp"

using namespace pf;

struct restore_backend {
    restore_backend() : original(get_backend()) { }
    ~restore_backend() {
        set_backend(original);
        ::unsetenv("PIPEFLOW_CHANNEL_CAPACITY");
        ::unsetenv("PIPEFLOW_MAX_MESSAGE_SIZE");
        ::unsetenv("PIPEFLOW_BACKEND");
    }

    ebackend original;
};

BOOST_FIXTURE_TEST_SUITE(config_test, restore_backend)

    BOOST_AUTO_TEST_CASE(registry) {

        set_backend(ebackend::SHARED_MEMORY_WORKER);
        BOOST_CHECK(get_backend() == ebackend::SHARED_MEMORY_WORKER);
        BOOST_CHECK(is_backend(ebackend::SHARED_MEMORY_WORKER));
        BOOST_CHECK(!is_backend(ebackend::SYNCHRONOUS));

        set_backend(ebackend::SYNCHRONOUS);
        BOOST_CHECK(is_backend(ebackend::SYNCHRONOUS));
        BOOST_CHECK(config::current().backend == ebackend::SYNCHRONOUS);
    }

    BOOST_AUTO_TEST_CASE(backend_names) {

        BOOST_CHECK(backend_from_string("isolated") == ebackend::ISOLATED_WORKER);
        BOOST_CHECK(backend_from_string("multiprocessing") == ebackend::ISOLATED_WORKER);
        BOOST_CHECK(backend_from_string("shared") == ebackend::SHARED_MEMORY_WORKER);
        BOOST_CHECK(backend_from_string("threading") == ebackend::SHARED_MEMORY_WORKER);
        BOOST_CHECK(backend_from_string("synchronous") == ebackend::SYNCHRONOUS);
        BOOST_CHECK(backend_from_string("dummy") == ebackend::SYNCHRONOUS);
        BOOST_CHECK_THROW(backend_from_string("fibers"), config_exception);

        for(ebackend backend: { ebackend::ISOLATED_WORKER, ebackend::SHARED_MEMORY_WORKER, ebackend::SYNCHRONOUS })
            BOOST_CHECK(backend_from_string(to_string(backend)) == backend);
    }

    BOOST_AUTO_TEST_CASE(environment_backend) {

        ::unsetenv("PIPEFLOW_BACKEND");
        BOOST_CHECK(backend_from_environment() == ebackend::ISOLATED_WORKER);

        ::setenv("PIPEFLOW_BACKEND", "threading", 1);
        BOOST_CHECK(backend_from_environment() == ebackend::SHARED_MEMORY_WORKER);
        ::setenv("PIPEFLOW_BACKEND", "dummy", 1);
        BOOST_CHECK(backend_from_environment() == ebackend::SYNCHRONOUS);

        ::setenv("PIPEFLOW_BACKEND", "fibers", 1);
        BOOST_CHECK_THROW(backend_from_environment(), config_exception);
        try {
            backend_from_environment();
        } catch(const config_exception& e) {
            BOOST_CHECK_EQUAL(std::string(e.what()), "Pipeline backend is not valid: fibers");
        }
    }

    BOOST_AUTO_TEST_CASE(environment_limits) {

        config defaults = config::current();
        BOOST_CHECK_EQUAL(defaults.channel_capacity, 256u);
        BOOST_CHECK_EQUAL(defaults.max_message_size, 64u * 1024u);
        BOOST_CHECK(defaults.fault_policy == efault_policy::THROW);

        ::setenv("PIPEFLOW_CHANNEL_CAPACITY", "16", 1);
        ::setenv("PIPEFLOW_MAX_MESSAGE_SIZE", "4096", 1);
        config cfg = config::with_backend(ebackend::SYNCHRONOUS);
        BOOST_CHECK(cfg.backend == ebackend::SYNCHRONOUS);
        BOOST_CHECK_EQUAL(cfg.channel_capacity, 16u);
        BOOST_CHECK_EQUAL(cfg.max_message_size, 4096u);

        ::setenv("PIPEFLOW_CHANNEL_CAPACITY", "many", 1);
        BOOST_CHECK_THROW(config::current(), config_exception);
        ::setenv("PIPEFLOW_CHANNEL_CAPACITY", "0", 1);
        BOOST_CHECK_THROW(config::current(), config_exception);
    }

    BOOST_AUTO_TEST_CASE(backend_factory) {

        for(ebackend backend: { ebackend::ISOLATED_WORKER, ebackend::SHARED_MEMORY_WORKER, ebackend::SYNCHRONOUS }) {
            auto created = exec::make_backend(config::with_backend(backend));
            BOOST_CHECK(created->variant() == backend);
        }

        auto synchronous = exec::make_backend(config::with_backend(ebackend::SYNCHRONOUS));
        BOOST_CHECK(!synchronous->concurrent());
        BOOST_CHECK_EQUAL(synchronous->worker_count(8), 1u);

        auto threads = exec::make_backend(config::with_backend(ebackend::SHARED_MEMORY_WORKER));
        BOOST_CHECK(threads->concurrent());
        BOOST_CHECK_EQUAL(threads->worker_count(8), 8u);
    }

BOOST_AUTO_TEST_SUITE_END ( )
