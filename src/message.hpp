#ifndef MESSAGE_HPP
#define MESSAGE_HPP

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/any.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/archive/binary_iarchive.hpp>

namespace pf {

    struct end_message;

    /**
     * Unit crossing a stage boundary - a carried value or the end sentinel.
     * The payload lives in value for in-memory channels and in data
     * (binary archive) for channels crossing a process boundary.
     */
    struct message {

        enum class emessage_tag {
            VALUE,
            END
        };

        message() = default;
        message(emessage_tag tag);
        message(emessage_tag tag, std::string data);
        message(message&& other);
        message(const message& other) = default;
        message& operator=(message&& other);
        message& operator=(const message& other) = default;

        static message end();

        bool is_end() const;

        /**
         * Packs the message into a single byte string suitable for
         * a process-shared queue, and back
         */
        std::string encode() const;
        static message decode(const std::string& bytes);

        emessage_tag tag = emessage_tag::VALUE;
        std::string data;
        boost::any value;
    };

    struct fault {

        enum class efault_type {
            SETUP_FAILURE,
            PROCESSING_FAILURE,
            TEARDOWN_FAILURE,
            SERIALIZATION_FAILURE,
            WORKER_LOST
        };

        fault() = default;
        fault(std::string stage_name, uint stage_index, uint worker_index, efault_type type, std::string what);

        std::string stage_name;
        uint stage_index = 0;
        uint worker_index = 0;
        efault_type type = efault_type::PROCESSING_FAILURE;
        std::string what;

        std::string to_string() const;

        private:
            friend class boost::serialization::access;
            template<class Archive> void serialize(Archive& ar, const unsigned int /* version */) {
                ar & stage_name;
                ar & stage_index;
                ar & worker_index;
                ar & type;
                ar & what;
            }
    };

    std::string to_string(fault::efault_type type);

    /**
     * Report produced exactly once by every worker when it terminates.
     * It plays the role of the per-worker end sentinel.
     */
    struct end_message {

        end_message() = default;
        end_message(uint stage_index, uint worker_index);

        uint stage_index = 0;
        uint worker_index = 0;
        std::vector<fault> faults;

        bool failed() const;

        end_message& operator<<(const message& mes);

        private:
            friend class boost::serialization::access;
            template<class Archive> void serialize(Archive& ar, const unsigned int /* version */) {
                ar & stage_index;
                ar & worker_index;
                ar & faults;
            }
    };

    message& operator<<(message& mes, const end_message& end_mes);

    namespace serialization {

        /**
         * A payload could not be archived or restored, or it holds
         * another type than the one requested
         */
        class serialization_exception : public std::runtime_error {

            public:
                explicit serialization_exception(const std::string& what)
                    : std::runtime_error(what) { }

                static serialization_exception type_mismatch(const std::string& requested, const std::string& held) {
                    return serialization_exception("payload holds " + held + ", requested " + requested);
                }
        };

        const unsigned int archive_flags = boost::archive::no_header;

        // data is replaced with the archived value
        template <typename T>
            std::string& operator<<(std::string& data, const T& value) {
                std::ostringstream buffer;
                try {
                    boost::archive::binary_oarchive archive(buffer, archive_flags);
                    archive << value;
                } catch(const boost::archive::archive_exception& e) {
                    throw serialization_exception(std::string("cannot archive payload: ") + e.what());
                }
                data = buffer.str();
                return data;
            }

        template <typename T>
            const std::string& operator>>(const std::string& data, T& value) {
                std::istringstream buffer(data);
                try {
                    boost::archive::binary_iarchive archive(buffer, archive_flags);
                    archive >> value;
                } catch(const boost::archive::archive_exception& e) {
                    throw serialization_exception(std::string("cannot restore payload: ") + e.what());
                }
                return data;
            }
    }
}

#endif
