#include "node.hpp"
#include "log.hpp"

namespace pf {

    // --- pipeline_exception -----------------

    pipeline_exception::pipeline_exception(std::string message) : message(std::move(message)) { }

    const char* pipeline_exception::what() const throw() {
        return message.c_str();
    }

    // --- stage_options -----------------

    stage_options::stage_options(uint concurrency, std::size_t capacity)
        : concurrency(concurrency), capacity(capacity)
    {
        if(concurrency == 0) throw pipeline_exception("stage concurrency must be at least 1");
    }

    // --- stage_node -----------------

    stage_node::stage_node(std::string name, stage_options options)
        : _name(std::move(name)), options(options)
    { }

    std::string stage_node::name() const {
        return _name;
    }

    uint stage_node::concurrency() const {
        return options.concurrency;
    }

    std::size_t stage_node::capacity() const {
        return options.capacity;
    }

    bool stage_node::has_upstream() const {
        return upstream;
    }

    bool stage_node::has_downstream() const {
        return downstream;
    }

    bool stage_node::started() const {
        return _started;
    }

    bool stage_node::next(exec::channel& input, message& mes, end_message& report) {
        while(true) {
            try {
                mes = input.receive();
                return !mes.is_end();
            } catch(const serialization::serialization_exception& e) {
                // message is lost, the channel itself is still usable
                record(report, fault::efault_type::SERIALIZATION_FAILURE, e.what());
            } catch(const std::exception& e) {
                record(report, fault::efault_type::PROCESSING_FAILURE,
                        std::string("input channel failed: ") + e.what());
                return false;
            }
        }
    }

    void stage_node::record(end_message& report, fault::efault_type type, const std::string& what) const {
        report.faults.emplace_back(_name, report.stage_index, report.worker_index, type, what);
        log::get()->warn("{}", report.faults.back().to_string());
    }

    void link_stages(stage_node& upstream, stage_node& downstream) {
        if(&upstream == &downstream)
            throw pipeline_exception("stage " + upstream.name() + " cannot feed itself");
        if(upstream._started || downstream._started)
            throw pipeline_exception("You cannot change a pipeline once it is running");
        if(upstream.downstream)
            throw pipeline_exception("stage " + upstream.name() + " already has a downstream stage");
        if(downstream.upstream)
            throw pipeline_exception("stage " + downstream.name() + " already has an upstream stage");

        upstream.downstream = true;
        downstream.upstream = true;
    }

    void mark_started(stage_node& node) {
        if(node._started)
            throw pipeline_exception("stage " + node.name() + " has already been run");
        node._started = true;
    }
}
