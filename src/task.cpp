#include "task.hpp"

namespace pf {

    base_unit::base_unit(std::string name) : _name(std::move(name)) { }

    std::string base_unit::name() const {
        return _name;
    }

    void base_unit::bind(exec::channel* output, uint worker_index, uint worker_count) {
        this->output = output;
        _worker_index = worker_index;
        _worker_count = worker_count;
    }

    uint base_unit::worker_index() const {
        return _worker_index;
    }

    uint base_unit::concurrency() const {
        return _worker_count;
    }
}
