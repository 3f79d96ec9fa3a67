#include "pipeline.hpp"

#include <algorithm>

namespace pf {

    stage_chain concatenate(const stage_chain& upstream, const stage_chain& downstream) {

        if(upstream.empty() || downstream.empty())
            throw pipeline_exception("cannot connect an empty pipeline");

        for(auto& node: downstream) {
            if(std::find(begin(upstream), end(upstream), node) != end(upstream))
                throw pipeline_exception("stage " + node->name() + " is already part of this pipeline");
        }

        link_stages(*upstream.back(), *downstream.front());

        stage_chain joined(upstream);
        joined.insert(end(joined), begin(downstream), end(downstream));
        return joined;
    }
}
