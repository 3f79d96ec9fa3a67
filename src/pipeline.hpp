#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "executor.hpp"
#include "node.hpp"

namespace pf {

    typedef std::vector<std::shared_ptr<stage_node>> stage_chain;

    /**
     * Joins two chains, the head of downstream becomes the only consumer
     * of the tail of upstream
     * @throws pipeline_exception if the stages are already connected elsewhere
     */
    stage_chain concatenate(const stage_chain& upstream, const stage_chain& downstream);

    /**
     * Linear chain of stages. Input is the type accepted by the first stage,
     * Output the type emitted by the last one.
     *
     * Handles are cheap to copy; copies refer to the same stages and the
     * same execution.
     */
    template <typename Input, typename Output>
        class pipeline {

            template <typename, typename> friend class pipeline;

            public:
                typedef Input input_type;
                typedef Output output_type;

                explicit pipeline(stage_chain stages)
                    : stages(std::move(stages)), execution(std::make_shared<execution_slot>())
                { }

                /**
                 * Attaches next as the only downstream of the last stage
                 * @return handle for the whole chain
                 */
                template <typename NextInput, typename NextOutput>
                    pipeline<Input, NextOutput> into(const pipeline<NextInput, NextOutput>& next) const {
                        static_assert(std::is_same<Output, NextInput>::value,
                                "downstream stage does not accept the values emitted by this pipeline");
                        return pipeline<Input, NextOutput>(concatenate(stages, next.stages));
                    }

                /**
                 * Starts the pipeline, blocks until completion and discards the output
                 */
                void execute() {
                    execute(config::current());
                }

                void execute(const config& cfg) {
                    launch(cfg, false);
                    execution->controller->wait();
                }

                /**
                 * Starts the pipeline and returns immediately; the output is kept
                 * for a following wait or results
                 */
                void start() {
                    start(config::current());
                }

                void start(const config& cfg) {
                    launch(cfg, true);
                }

                void wait() {
                    if(!execution->controller) throw pipeline_exception("pipeline has not been started");
                    execution->controller->wait();
                }

                /**
                 * Starts the pipeline unless it is already running, blocks until
                 * completion and returns everything emitted by the last stage
                 * in order of arrival
                 */
                std::vector<Output> results() {
                    if(execution->controller) return collect();
                    return results(config::current());
                }

                std::vector<Output> results(const config& cfg) {
                    if(!execution->controller) launch(cfg, true);
                    return collect();
                }

                /**
                 * Faults recorded by the last run, complete after it finished
                 */
                std::vector<fault> faults() const {
                    if(!execution->controller) return std::vector<fault>();
                    return execution->controller->faults();
                }

                bool started() const {
                    return static_cast<bool>(execution->controller);
                }

                const stage_chain& chain() const {
                    return stages;
                }

            private:
                struct execution_slot {
                    std::unique_ptr<exec::controller> controller;
                };

                void launch(const config& cfg, bool collect) {
                    if(execution->controller)
                        throw pipeline_exception("You cannot start a pipeline that has already been run");

                    std::unique_ptr<exec::controller> controller(new exec::controller(stages, cfg));
                    controller->start(collect);
                    execution->controller = std::move(controller);
                }

                std::vector<Output> collect() {
                    if(!execution->controller->collecting())
                        throw pipeline_exception("pipeline was executed without keeping its results");

                    execution->controller->wait();

                    std::vector<Output> values;
                    values.reserve(execution->controller->collected().size());
                    for(auto& mes: execution->controller->collected()) values.push_back(unpack<Output>(mes));
                    return values;
                }

                stage_chain stages;
                std::shared_ptr<execution_slot> execution;
        };

    template <typename Unit, typename... Args>
        pipeline<typename Unit::input_type, typename Unit::output_type>
        make_stage(stage_options options, Args&&... args)
        {
            std::shared_ptr<stage_node> node(
                    new stage<Unit, typename std::decay<Args>::type...>(options, std::forward<Args>(args)...));
            return pipeline<typename Unit::input_type, typename Unit::output_type>(stage_chain{ node });
        }

    /**
     * Creates a single stage pipeline, args are handed to setup of every worker
     */
    template <typename Unit, typename... Args>
        pipeline<typename Unit::input_type, typename Unit::output_type>
        make_stage(Args&&... args)
        {
            return make_stage<Unit>(stage_options(), std::forward<Args>(args)...);
        }
}

#endif
