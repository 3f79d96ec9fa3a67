#ifndef NODE_HPP
#define NODE_HPP

#include <cstddef>
#include <exception>
#include <string>
#include <tuple>
#include <type_traits>

#include "template_utils.hpp"
#include "message.hpp"
#include "channel.hpp"
#include "task.hpp"

namespace pf {

    class pipeline_exception : public std::exception {
        public:

            pipeline_exception(std::string message);
            virtual ~pipeline_exception() = default;
            virtual const char* what() const throw();

        private:
            std::string message;
    };

    /**
     * Part of stage construction reserved for the engine
     */
    struct stage_options {

        explicit stage_options(uint concurrency = 1, std::size_t capacity = 0);

        uint concurrency;
        std::size_t capacity; // 0 - configured default
    };

    class stage_node {

        friend void link_stages(stage_node& upstream, stage_node& downstream);
        friend void mark_started(stage_node& node);

        public:
            stage_node(std::string name, stage_options options);
            virtual ~stage_node() = default;

            std::string name() const;
            uint concurrency() const;
            std::size_t capacity() const;

            bool has_upstream() const;
            bool has_downstream() const;
            bool started() const;

            /**
             * Runs one worker from setup to teardown. Values are taken from input
             * until the end sentinel arrives; everything emitted goes to output.
             * Faults of the unit are caught and returned in the report, after
             * a fault the worker keeps draining its input without processing it.
             */
            virtual end_message run_worker(uint stage_index, uint worker_index, uint worker_count,
                    exec::channel& input, exec::channel* output) = 0;

        protected:
            /**
             * Receives the next value
             * @return false once the end sentinel arrived or the channel failed
             */
            bool next(exec::channel& input, message& mes, end_message& report);

            void record(end_message& report, fault::efault_type type, const std::string& what) const;

            template <typename F>
                bool guard(end_message& report, fault::efault_type type, F f) const {
                    try {
                        f();
                        return true;
                    } catch(const serialization::serialization_exception& e) {
                        record(report, fault::efault_type::SERIALIZATION_FAILURE, e.what());
                    } catch(const std::exception& e) {
                        record(report, type, e.what());
                    } catch(...) {
                        record(report, type, "unknown exception");
                    }
                    return false;
                }

        private:
            std::string _name;
            stage_options options;
            bool upstream = false;
            bool downstream = false;
            bool _started = false;
    };

    /**
     * Attaches downstream as the only consumer of upstream
     * @throws pipeline_exception if either side is already connected or running
     */
    void link_stages(stage_node& upstream, stage_node& downstream);

    /**
     * @throws pipeline_exception if the stage was started before
     */
    void mark_started(stage_node& node);

    /**
     * node class is a stage container: it keeps the arguments for setup
     * and creates a fresh Unit for every worker, so workers never share
     * the state of a unit
     */
    template <typename Unit, typename... Args>
        class stage : public stage_node {

            static_assert(std::is_base_of<base_stage<typename Unit::input_type, typename Unit::output_type>, Unit>::value,
                    "Unit is not derived class of base_stage");
            static_assert(!is_any_same<stage_options, Args...>{},
                    "stage_options has to be the first argument of make_stage");

            public:
                typedef typename Unit::input_type input_type;
                typedef typename Unit::output_type output_type;

                template <typename... A>
                    stage(stage_options options, A&&... setup_args)
                        : stage_node(Unit().name(), options), args(std::forward<A>(setup_args)...)
                    { }

                virtual end_message run_worker(uint stage_index, uint worker_index, uint worker_count,
                        exec::channel& input, exec::channel* output) override
                {
                    end_message report(stage_index, worker_index);

                    Unit unit;
                    unit.bind(output, worker_index, worker_count);

                    bool running = guard(report, fault::efault_type::SETUP_FAILURE, [&]() {
                        call_setup(unit, args);
                    });

                    message mes;
                    while(next(input, mes, report)) {
                        if(!running) continue; // draining after a fault
                        running = guard(report, fault::efault_type::PROCESSING_FAILURE, [&]() {
                            unit.process(unpack<input_type>(mes));
                        });
                    }

                    if(running) {
                        guard(report, fault::efault_type::TEARDOWN_FAILURE, [&]() {
                            unit.teardown();
                        });
                    }

                    return report;
                }

            private:
                std::tuple<Args...> args;
        };
}

#endif
