#define BOOST_TEST_MODULE serialization_test

#include <string>
#include <tuple>
#include <boost/test/unit_test.hpp>
#include "../message.hpp"
#include "../task.hpp"

using namespace pf;

struct tuple_wrapper {

    std::tuple<int, int, char> tp;

    private:
        friend class boost::serialization::access;
        template<class Archive> void serialize(Archive& ar, const unsigned int /* version */) {
            ar & std::get<0>(tp);
            ar & std::get<1>(tp);
            ar & std::get<2>(tp);
        }
};

BOOST_AUTO_TEST_SUITE(serialization_test)

    BOOST_AUTO_TEST_CASE(end_message_test) {

        uint stage_index = 1;
        uint worker_index = 2;
        end_message end_mes(stage_index, worker_index);
        end_mes.faults.emplace_back("parser", stage_index, worker_index,
                fault::efault_type::TEARDOWN_FAILURE, "disk full");

        message mes;
        mes << end_mes;
        BOOST_CHECK(mes.is_end());

        end_message end_mes_d;
        end_mes_d << message::decode(mes.encode());

        BOOST_CHECK_EQUAL(end_mes_d.stage_index, stage_index);
        BOOST_CHECK_EQUAL(end_mes_d.worker_index, worker_index);
        BOOST_REQUIRE_EQUAL(end_mes_d.faults.size(), 1u);
        BOOST_CHECK_EQUAL(end_mes_d.faults[0].stage_name, "parser");
        BOOST_CHECK(end_mes_d.faults[0].type == fault::efault_type::TEARDOWN_FAILURE);
        BOOST_CHECK_EQUAL(end_mes_d.faults[0].what, "disk full");
        BOOST_CHECK(end_mes_d.failed());
    }

    BOOST_AUTO_TEST_CASE(value_message_test) {

        message mes = pack(std::string("Ala ma kota"), true);
        BOOST_CHECK(mes.value.empty());

        message mes_d = message::decode(mes.encode());
        BOOST_CHECK(mes_d.tag == message::emessage_tag::VALUE);
        BOOST_CHECK_EQUAL(unpack<std::string>(mes_d), "Ala ma kota");

        message end_d = message::decode(message::end().encode());
        BOOST_CHECK(end_d.is_end());
        BOOST_CHECK(end_d.data.empty());
    }

    BOOST_AUTO_TEST_CASE(custom_type_serialization) {

        tuple_wrapper tw;
        auto t = std::make_tuple(1, 2, 'c');
        tw.tp = t;

        std::string serialized;
        using serialization::operator<<;
        using serialization::operator>>;
        serialized << tw;
        tuple_wrapper tw_d;
        serialized >> tw_d;
        BOOST_CHECK(std::get<0>(t) == std::get<0>(tw_d.tp));
        BOOST_CHECK(std::get<1>(t) == std::get<1>(tw_d.tp));
        BOOST_CHECK(std::get<2>(t) == std::get<2>(tw_d.tp));
    }

    BOOST_AUTO_TEST_CASE(in_memory_payload) {

        message mes = pack(std::vector<int>{ 1, 2, 3 }, false);
        BOOST_CHECK(mes.data.empty());
        BOOST_CHECK(unpack<std::vector<int>>(mes) == std::vector<int>({ 1, 2, 3 }));

        // cannot leave the process
        BOOST_CHECK_THROW(mes.encode(), serialization::serialization_exception);
    }

    BOOST_AUTO_TEST_CASE(type_mismatch) {

        message mes = pack(42, false);
        BOOST_CHECK_THROW(unpack<std::string>(mes), serialization::serialization_exception);

        try {
            unpack<double>(mes);
            BOOST_ERROR("serialization_exception expected");
        } catch(const serialization::serialization_exception& e) {
            BOOST_CHECK(std::string(e.what()).find("payload holds") == 0);
        }
    }

    BOOST_AUTO_TEST_CASE(garbage_input) {

        BOOST_CHECK_THROW(message::decode("x"), serialization::serialization_exception);

        message mes(message::emessage_tag::VALUE, "\x01");
        BOOST_CHECK_THROW(unpack<std::string>(mes), serialization::serialization_exception);
    }

BOOST_AUTO_TEST_SUITE_END ( )
