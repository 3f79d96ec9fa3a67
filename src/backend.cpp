#include "backend.hpp"
#include "node.hpp"
#include "log.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>

namespace pf {

    namespace exec {

        namespace {

            void flush_streams() {
                std::cout.flush();
                std::cerr.flush();
                std::fflush(nullptr);
                log::get()->flush();
            }

            // body of a forked worker, never returns to the caller
            void run_child(stage_node& stage, uint stage_index, uint worker_index, uint count,
                    channel& input, channel* output, interprocess_channel& report_channel)
            {
                int status = 0;
                try {
                    end_message report = stage.run_worker(stage_index, worker_index, count, input, output);

                    message mes;
                    mes << report;
                    try {
                        report_channel.send(std::move(mes));
                    } catch(const serialization::serialization_exception&) {
                        end_message brief(stage_index, worker_index);
                        const fault& first = report.faults.front();
                        brief.faults.emplace_back(first.stage_name, stage_index, worker_index, first.type,
                                first.what.substr(0, 512) + " (report of " + std::to_string(report.faults.size())
                                + " faults truncated)");
                        message brief_mes;
                        brief_mes << brief;
                        report_channel.send(std::move(brief_mes));
                    }
                } catch(const std::exception& e) {
                    log::get()->error("worker {} of {} failed outside of the stage: {}",
                            worker_index, stage.name(), e.what());
                    status = 1;
                } catch(...) {
                    log::get()->error("worker {} of {} failed outside of the stage", worker_index, stage.name());
                    status = 1;
                }

                flush_streams();
                ::_exit(status);
            }
        }

        // --- backend -----------------

        uint backend::worker_count(uint requested) const {
            return requested;
        }

        std::vector<end_message> backend::join(worker_handles& handles) {
            std::vector<end_message> reports;
            reports.reserve(handles.size());
            for(auto& handle: handles) reports.push_back(handle->join());
            return reports;
        }

        std::unique_ptr<backend> make_backend(const config& cfg) {
            switch(cfg.backend) {
                case ebackend::ISOLATED_WORKER:
                    return std::unique_ptr<backend>(new process_backend(cfg.max_message_size));
                case ebackend::SHARED_MEMORY_WORKER:
                    return std::unique_ptr<backend>(new thread_backend());
                case ebackend::SYNCHRONOUS:
                    return std::unique_ptr<backend>(new synchronous_backend());
            }
            throw config_exception("unknown backend");
        }

        // --- process_backend -----------------

        process_backend::process_backend(std::size_t max_message_size)
            : max_message_size(max_message_size)
        { }

        ebackend process_backend::variant() const {
            return ebackend::ISOLATED_WORKER;
        }

        bool process_backend::concurrent() const {
            return true;
        }

        std::unique_ptr<channel> process_backend::make_channel(std::size_t capacity) {
            return std::unique_ptr<channel>(new interprocess_channel(capacity, max_message_size));
        }

        worker_handles process_backend::spawn(stage_node& stage, uint stage_index, uint count,
                channel& input, channel* output)
        {
            // children must not inherit buffered output of the parent
            flush_streams();

            worker_handles handles;
            for(uint worker_index = 0; worker_index < count; worker_index++) {

                std::unique_ptr<interprocess_channel> report_channel(
                        new interprocess_channel(1, max_message_size));

                pid_t pid = ::fork();
                if(pid < 0)
                    throw std::system_error(errno, std::generic_category(), "fork() failed for stage " + stage.name());
                if(pid == 0)
                    run_child(stage, stage_index, worker_index, count, input, output, *report_channel);

                log::get()->debug("stage {} worker {} runs in process {}", stage.name(), worker_index, pid);
                handles.emplace_back(new process_handle(
                            pid, stage.name(), stage_index, worker_index, std::move(report_channel)));
            }
            return handles;
        }

        // --- thread_backend -----------------

        ebackend thread_backend::variant() const {
            return ebackend::SHARED_MEMORY_WORKER;
        }

        bool thread_backend::concurrent() const {
            return true;
        }

        std::unique_ptr<channel> thread_backend::make_channel(std::size_t capacity) {
            return std::unique_ptr<channel>(new memory_channel(capacity));
        }

        worker_handles thread_backend::spawn(stage_node& stage, uint stage_index, uint count,
                channel& input, channel* output)
        {
            worker_handles handles;
            for(uint worker_index = 0; worker_index < count; worker_index++) {
                std::packaged_task<end_message()> task(std::bind(&stage_node::run_worker, &stage,
                            stage_index, worker_index, count, std::ref(input), output));
                std::future<end_message> report = task.get_future();

                std::thread worker(std::move(task));
                handles.emplace_back(new thread_handle(std::move(worker), std::move(report)));
            }
            return handles;
        }

        // --- synchronous_backend -----------------

        ebackend synchronous_backend::variant() const {
            return ebackend::SYNCHRONOUS;
        }

        bool synchronous_backend::concurrent() const {
            return false;
        }

        uint synchronous_backend::worker_count(uint /* requested */) const {
            return 1;
        }

        std::unique_ptr<channel> synchronous_backend::make_channel(std::size_t /* capacity */) {
            return std::unique_ptr<channel>(new synchronous_channel());
        }

        worker_handles synchronous_backend::spawn(stage_node& stage, uint stage_index, uint count,
                channel& input, channel* output)
        {
            worker_handles handles;
            for(uint worker_index = 0; worker_index < count; worker_index++) {
                end_message report = stage.run_worker(stage_index, worker_index, count, input, output);
                handles.emplace_back(new finished_handle(std::move(report)));
            }
            return handles;
        }

        // --- process_handle -----------------

        process_handle::process_handle(pid_t pid, std::string stage_name, uint stage_index, uint worker_index,
                std::unique_ptr<interprocess_channel> report_channel)
            : pid(pid),
            stage_name(std::move(stage_name)),
            stage_index(stage_index),
            worker_index(worker_index),
            report_channel(std::move(report_channel))
        { }

        process_handle::~process_handle() {
            if(joined) return;
            // abandoned worker, e.g. the pipeline failed to start
            ::kill(pid, SIGKILL);
            int status = 0;
            while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) { }
        }

        end_message process_handle::join() {
            if(joined) throw std::logic_error("worker process joined twice");

            int status = 0;
            while(::waitpid(pid, &status, 0) < 0) {
                if(errno != EINTR) {
                    joined = true;
                    return lost(std::string("waitpid() failed: ") + std::strerror(errno));
                }
            }
            joined = true;

            message mes;
            try {
                if(report_channel->try_receive(mes)) {
                    end_message report;
                    report << mes;
                    return report;
                }
            } catch(const serialization::serialization_exception& e) {
                return lost(std::string("unreadable report: ") + e.what());
            }

            if(WIFSIGNALED(status))
                return lost("killed by signal " + std::to_string(WTERMSIG(status)));
            return lost("exited with status " + std::to_string(WEXITSTATUS(status)) + " without a report");
        }

        end_message process_handle::lost(const std::string& reason) const {
            end_message report(stage_index, worker_index);
            report.faults.emplace_back(stage_name, stage_index, worker_index, fault::efault_type::WORKER_LOST,
                    "process " + std::to_string(pid) + " " + reason);
            log::get()->error("{}", report.faults.back().to_string());
            return report;
        }

        // --- thread_handle -----------------

        thread_handle::thread_handle(std::thread worker, std::future<end_message> report)
            : worker(std::move(worker)), report(std::move(report))
        { }

        thread_handle::~thread_handle() {
            if(worker.joinable()) worker.join();
        }

        end_message thread_handle::join() {
            if(worker.joinable()) worker.join();
            return report.get();
        }

        // --- finished_handle -----------------

        finished_handle::finished_handle(end_message report) : report(std::move(report)) { }

        end_message finished_handle::join() {
            return report;
        }
    }
}
