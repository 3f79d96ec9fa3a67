#include "message.hpp"

namespace pf {

    message::message(emessage_tag tag) : tag(tag) { }

    message::message(emessage_tag tag, std::string data)
        : tag(tag), data(std::move(data))
    { }

    message::message(message&& other)
        : tag(other.tag), data(std::move(other.data)), value(std::move(other.value))
    { }

    message& message::operator=(message&& other) {
        tag = other.tag;
        data = std::move(other.data);
        value = std::move(other.value);
        return *this;
    }

    message message::end() {
        return message(emessage_tag::END);
    }

    bool message::is_end() const {
        return tag == emessage_tag::END;
    }

    std::string message::encode() const {

        if(!value.empty())
            throw serialization::serialization_exception(
                    "in-memory payload cannot cross a process boundary");

        std::ostringstream os;
        try {
            ::boost::archive::binary_oarchive archive(os, ::boost::archive::no_header);
            int raw_tag = static_cast<int>(tag);
            archive << raw_tag;
            archive << data;
        } catch(::boost::archive::archive_exception& ae) {
            throw serialization::serialization_exception(ae.what());
        }
        return os.str();
    }

    message message::decode(const std::string& bytes) {

        message mes;
        try {
            std::istringstream is(bytes);
            ::boost::archive::binary_iarchive archive(is, ::boost::archive::no_header);
            int raw_tag;
            archive >> raw_tag;
            archive >> mes.data;
            if(raw_tag != static_cast<int>(emessage_tag::VALUE) && raw_tag != static_cast<int>(emessage_tag::END))
                throw serialization::serialization_exception("Unrecognized tag: " + std::to_string(raw_tag));
            mes.tag = static_cast<emessage_tag>(raw_tag);
        } catch(::boost::archive::archive_exception& ae) {
            throw serialization::serialization_exception(ae.what());
        }
        return mes;
    }

    // --- fault -----------------

    fault::fault(std::string stage_name, uint stage_index, uint worker_index, efault_type type, std::string what)
        : stage_name(std::move(stage_name)),
        stage_index(stage_index),
        worker_index(worker_index),
        type(type),
        what(std::move(what))
    { }

    std::string fault::to_string() const {
        return pf::to_string(type) + " in " + stage_name + "[" + std::to_string(stage_index) + "] worker "
            + std::to_string(worker_index) + ": " + what;
    }

    std::string to_string(fault::efault_type type) {
        switch(type) {
            case fault::efault_type::SETUP_FAILURE:
                return "setup failure";
            case fault::efault_type::PROCESSING_FAILURE:
                return "processing failure";
            case fault::efault_type::TEARDOWN_FAILURE:
                return "teardown failure";
            case fault::efault_type::SERIALIZATION_FAILURE:
                return "serialization failure";
            case fault::efault_type::WORKER_LOST:
                return "worker lost";
        }
        return "unknown failure";
    }

    // --- end_message -----------------

    end_message::end_message(uint stage_index, uint worker_index)
        : stage_index(stage_index), worker_index(worker_index)
    { }

    bool end_message::failed() const {
        return !faults.empty();
    }

    end_message& end_message::operator<<(const message& mes) {
        using serialization::operator>>;
        if(!mes.is_end())
            throw serialization::serialization_exception("worker report expected, got a value");
        mes.data >> *this;
        return *this;
    }

    message& operator<<(message& mes, const end_message& end_mes) {
        using serialization::operator<<;
        mes.tag = message::emessage_tag::END;
        mes.value = boost::any();
        mes.data << end_mes;
        return mes;
    }
}
