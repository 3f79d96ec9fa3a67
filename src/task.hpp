#ifndef TASK_HPP
#define TASK_HPP

#include <string>
#include <typeinfo>
#include <boost/any.hpp>
#include "channel.hpp"
#include "message.hpp"

namespace pf {

    /**
     * Input type of stages which only generate values
     */
    struct none {
        template<class Archive> void serialize(Archive& /* ar */, const unsigned int /* version */) { }
    };

    template <typename T>
        message pack(const T& value, bool serialized) {
            using serialization::operator<<;

            message mes(message::emessage_tag::VALUE);
            if(serialized) mes.data << value;
            else mes.value = value;
            return mes;
        }

    /**
     * @throws serialization::serialization_exception if the message holds
     * a value of another type or its data cannot be read as T
     */
    template <typename T>
        T unpack(const message& mes) {
            using serialization::operator>>;

            if(!mes.value.empty()) {
                const T* value = boost::any_cast<T>(&mes.value);
                if(value == nullptr)
                    throw serialization::serialization_exception::type_mismatch(typeid(T).name(), mes.value.type().name());
                return *value;
            }

            T value;
            mes.data >> value;
            return value;
        }

    class base_unit {

        public:
            virtual ~base_unit() = default;

            base_unit(std::string name);

            std::string name() const;

            /**
             * Connects the unit to the channel it emits into.
             * A null output discards everything emitted.
             */
            void bind(exec::channel* output, uint worker_index, uint worker_count);

            uint worker_index() const;
            // number of workers running the stage
            uint concurrency() const;

        private:
            std::string _name;
            uint _worker_index = 0;
            uint _worker_count = 1;

        protected:
            exec::channel* output = nullptr;
    };

    /**
     * Base class of every stage. All lifecycle methods are optional:
     *
     *  class square : public pf::base_stage<int, int> {
     *
     *      public:
     *          square() : base_stage<int, int>("square") { }
     *
     *          void setup(int offset) {         // arguments given to make_stage
     *              this->offset = offset;
     *          }
     *
     *          virtual void process(const int& value) override {
     *              emit(value * value + offset);
     *          }
     *
     *      private:
     *          int offset = 0;
     *  };
     *
     * setup is looked up by name so it can take any arguments, process is
     * called for every value received, teardown once the input is exhausted.
     * Every method may emit.
     */
    template <typename Input, typename Output>
        class base_stage : public base_unit {

            public:
                typedef Input input_type;
                typedef Output output_type;

                base_stage(std::string name) : base_unit(std::move(name)) { }

                void setup() { }

                virtual void process(const Input& /* input */) { }

                virtual void teardown() { }

            protected:
                /**
                 * Sends value to the next stage, blocks while its channel is full
                 */
                void emit(const Output& value) const {
                    if(output == nullptr) return;
                    output->send(pack(value, output->serializing()));
                }
        };
}

#endif
