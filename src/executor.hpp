#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/lockfree/queue.hpp>

#include "backend.hpp"
#include "config.hpp"
#include "message.hpp"

namespace pf {

    class stage_node;

    /**
     * Thrown after a run in which at least one worker failed
     */
    class pipeline_failure : public std::exception {

        public:
            pipeline_failure(std::vector<fault> faults);
            virtual ~pipeline_failure() = default;
            virtual const char* what() const throw();

            const std::vector<fault>& faults() const;

        private:
            std::vector<fault> _faults;
            std::string message;
    };

    namespace exec {

        /**
         * Class responsible for execution of one pipeline: it creates every
         * channel, spawns the workers of each stage and runs the barrier which
         * forwards the end sentinel downstream once all workers of a stage
         * have reported
         */
        class controller {

            public:

                enum class estate {
                    CREATED,
                    RUNNING,
                    FINISHED
                };

                controller(std::vector<std::shared_ptr<stage_node>> stages, config cfg);
                ~controller();

                controller(const controller&) = delete;
                controller& operator=(const controller&) = delete;

                /**
                 * @param collect keep everything emitted by the last stage
                 * @throws pipeline_exception if the pipeline cannot be run
                 */
                void start(bool collect);

                /**
                 * Blocks until every worker terminated
                 * @throws pipeline_failure if faults were recorded and the policy says so
                 */
                void wait();

                bool collecting() const;

                const std::vector<message>& collected() const;
                const std::vector<fault>& faults() const;

            private:
                void forward_end(uint stage_index);
                void discard_input(uint stage_index);
                void collect_results();
                void record(const fault& f);
                void drain_faults();
                void join_threads();
                void check_faults() const;

            private:

                std::vector<std::shared_ptr<stage_node>> stages;
                config cfg;
                std::unique_ptr<backend> _backend;
                estate _state = estate::CREATED;
                bool collect = false;

                // input channel of every stage
                std::vector<std::unique_ptr<channel>> inputs;
                // output of the last stage, only when collecting
                std::unique_ptr<channel> results_channel;
                std::vector<uint> worker_counts;
                std::vector<worker_handles> handles;
                // set once a stage has sent end to all of its consumers
                std::unique_ptr<std::atomic<bool>[]> forwarded;

                // barrier threads, one per stage
                std::vector<std::thread> supervisors;
                std::unique_ptr<std::thread> collector;

                // faults reported by barrier and collector threads
                boost::lockfree::queue<fault*> pending_faults;
                std::vector<fault> _faults;
                std::vector<message> _collected;
        };
    }
}

#endif
