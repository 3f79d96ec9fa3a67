#include "executor.hpp"
#include "node.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>

namespace pf {

    // --- pipeline_failure -----------------

    pipeline_failure::pipeline_failure(std::vector<fault> faults)
        : _faults(std::move(faults))
    {
        message = std::to_string(_faults.size()) + " worker fault(s)";
        if(!_faults.empty()) message += ", first: " + _faults.front().to_string();
    }

    const char* pipeline_failure::what() const throw() {
        return message.c_str();
    }

    const std::vector<fault>& pipeline_failure::faults() const {
        return _faults;
    }

    namespace exec {

        controller::controller(std::vector<std::shared_ptr<stage_node>> stages, config cfg)
            : stages(std::move(stages)),
            cfg(std::move(cfg)),
            pending_faults(32)
        { }

        controller::~controller() {
            join_threads();
            drain_faults();
        }

        void controller::start(bool collect) {

            if(_state != estate::CREATED)
                throw pipeline_exception("You cannot start a pipeline that has already been run");
            if(stages.empty())
                throw pipeline_exception("pipeline has no stages");
            if(stages.front()->has_upstream())
                throw pipeline_exception("stage " + stages.front()->name() + " is fed by a stage outside of this pipeline");
            if(stages.back()->has_downstream())
                throw pipeline_exception("stage " + stages.back()->name() + " feeds a stage outside of this pipeline");
            for(auto& stage: stages) {
                if(stage->started())
                    throw pipeline_exception("stage " + stage->name() + " has already been run");
            }
            for(auto& stage: stages) mark_started(*stage);

            this->collect = collect;
            _backend = make_backend(cfg);

            auto logger = log::get();
            logger->debug("starting pipeline of {} stage(s) on {} backend", stages.size(), to_string(cfg.backend));

            // every channel exists before the first worker starts
            const uint stage_count = stages.size();
            for(uint i = 0; i < stage_count; i++) {
                worker_counts.push_back(_backend->worker_count(stages[i]->concurrency()));

                std::size_t capacity = stages[i]->capacity() != 0 ? stages[i]->capacity() : cfg.channel_capacity;
                if(i == 0) capacity = std::max<std::size_t>(capacity, worker_counts[0]);
                inputs.emplace_back(_backend->make_channel(capacity));
            }
            if(collect) results_channel = _backend->make_channel(cfg.channel_capacity);

            // the first stage has no upstream, its input carries only the end sentinel
            for(uint i = 0; i < worker_counts[0]; i++) inputs[0]->send(message::end());

            _state = estate::RUNNING;
            handles.resize(stage_count);
            forwarded.reset(new std::atomic<bool>[stage_count]);
            for(uint i = 0; i < stage_count; i++) forwarded[i] = false;

            auto output_of = [this, stage_count](uint i) -> channel* {
                return (i + 1 < stage_count) ? inputs[i + 1].get() : results_channel.get();
            };

            if(_backend->concurrent()) {
                for(uint i = 0; i < stage_count; i++) {
                    logger->debug("stage {} [{}]: spawning {} worker(s)", stages[i]->name(), i, worker_counts[i]);
                    handles[i] = _backend->spawn(*stages[i], i, worker_counts[i], *inputs[i], output_of(i));
                }

                // threads of the parent are created only once every worker exists,
                // a forked worker must not inherit them
                for(uint i = 0; i < stage_count; i++)
                    supervisors.emplace_back(&controller::forward_end, this, i);
                if(collect) collector.reset(new std::thread(&controller::collect_results, this));

            } else {
                for(uint i = 0; i < stage_count; i++) {
                    logger->debug("stage {} [{}]: running to completion", stages[i]->name(), i);
                    handles[i] = _backend->spawn(*stages[i], i, worker_counts[i], *inputs[i], output_of(i));
                    forward_end(i);
                }
                if(collect) collect_results();
            }
        }

        void controller::wait() {

            if(_state == estate::CREATED)
                throw pipeline_exception("pipeline has not been started");

            if(_state == estate::RUNNING) {
                join_threads();
                drain_faults();
                std::stable_sort(begin(_faults), end(_faults), [](const fault& a, const fault& b) {
                    return a.stage_index < b.stage_index
                        || (a.stage_index == b.stage_index && a.worker_index < b.worker_index);
                });
                _state = estate::FINISHED;
                log::get()->debug("pipeline finished, {} value(s) collected, {} fault(s)",
                        _collected.size(), _faults.size());
            }

            check_faults();
        }

        bool controller::collecting() const {
            return collect;
        }

        const std::vector<message>& controller::collected() const {
            return _collected;
        }

        const std::vector<fault>& controller::faults() const {
            return _faults;
        }

        void controller::forward_end(uint stage_index) {

            stage_node& stage = *stages[stage_index];

            // barrier - all workers of the stage have to report first
            std::vector<end_message> reports;
            try {
                reports = _backend->join(handles[stage_index]);
            } catch(const std::exception& e) {
                record(fault(stage.name(), stage_index, 0, fault::efault_type::WORKER_LOST,
                            std::string("joining workers failed: ") + e.what()));
            }
            bool lost = false;
            for(auto& report: reports) {
                for(auto& f: report.faults) {
                    if(f.type == fault::efault_type::WORKER_LOST) lost = true;
                    record(f);
                }
            }

            // a dead worker stops consuming, upstream must not block on its input
            if(lost) discard_input(stage_index);

            channel* downstream;
            uint consumers;
            if(stage_index + 1 < stages.size()) {
                downstream = inputs[stage_index + 1].get();
                consumers = worker_counts[stage_index + 1];
            } else {
                downstream = results_channel.get();
                consumers = collect ? 1 : 0;
            }

            log::get()->debug("stage {} [{}]: {} worker(s) finished, ending {} consumer(s)",
                    stage.name(), stage_index, reports.size(), consumers);

            try {
                for(uint i = 0; i < consumers; i++) downstream->send(message::end());
            } catch(const std::exception& e) {
                record(fault(stage.name(), stage_index, 0, fault::efault_type::SERIALIZATION_FAILURE,
                            std::string("forwarding end failed: ") + e.what()));
            }
            forwarded[stage_index] = true;
        }

        void controller::discard_input(uint stage_index) {

            channel& input = *inputs[stage_index];
            std::size_t discarded = 0;

            while(true) {
                // everything upstream sent is in the channel once the flag is set
                bool upstream_done = stage_index == 0 || forwarded[stage_index - 1];

                message mes;
                bool received;
                try {
                    received = input.try_receive(mes);
                } catch(const serialization::serialization_exception&) {
                    received = true;
                } catch(const std::exception& e) {
                    record(fault(stages[stage_index]->name(), stage_index, 0, fault::efault_type::WORKER_LOST,
                                std::string("discarding input failed: ") + e.what()));
                    break;
                }

                if(received) {
                    if(!mes.is_end()) discarded++;
                    continue;
                }
                if(upstream_done) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }

            if(discarded > 0)
                log::get()->warn("stage {} [{}]: discarded {} value(s) left for lost workers",
                        stages[stage_index]->name(), stage_index, discarded);
        }

        void controller::collect_results() {

            const uint tail = stages.size() - 1;
            while(true) {
                message mes;
                try {
                    mes = results_channel->receive();
                } catch(const serialization::serialization_exception& e) {
                    record(fault(stages[tail]->name(), tail, 0, fault::efault_type::SERIALIZATION_FAILURE,
                                std::string("result lost: ") + e.what()));
                    continue;
                } catch(const std::exception& e) {
                    record(fault(stages[tail]->name(), tail, 0, fault::efault_type::PROCESSING_FAILURE,
                                std::string("result channel failed: ") + e.what()));
                    return;
                }

                if(mes.is_end()) return;
                _collected.push_back(std::move(mes));
            }
        }

        void controller::record(const fault& f) {
            fault* pending = new fault(f);
            if(!pending_faults.push(pending)) {
                log::get()->error("fault could not be queued: {}", f.to_string());
                delete pending;
            }
        }

        void controller::drain_faults() {
            fault* pending;
            while(pending_faults.pop(pending)) {
                std::unique_ptr<fault> owned(pending);
                _faults.push_back(*owned);
            }
        }

        void controller::join_threads() {
            for(auto& supervisor: supervisors) {
                if(supervisor.joinable()) supervisor.join();
            }
            if(collector && collector->joinable()) collector->join();
        }

        void controller::check_faults() const {
            if(!_faults.empty() && cfg.fault_policy == efault_policy::THROW)
                throw pipeline_failure(_faults);
        }
    }
}
