#include "../../pipeflow.hpp"

#include <iostream>
#include <sstream>

/**
 * Runs a shell command over ssh on many hosts, up to ten at a time,
 * and prints the outputs:
 *
 *      mussh host1,host2,host3 "uname -a"
 */
int main(int argc, char* argv[]) {

    if(argc < 3) {
        std::cerr << "Usage: " << argv[0] << " hostnames(comma-separated) command" << std::endl;
        return 1;
    }

    std::vector<std::string> commands;
    std::istringstream hosts(argv[1]);
    std::string host;
    while(std::getline(hosts, host, ',')) {
        if(!host.empty()) commands.push_back("ssh " + pf::tools::shell_quote(host) + " " + pf::tools::shell_quote(argv[2]));
    }

    auto pipe = pf::make_stage<pf::tools::iter<std::string>>(commands)
        .into(pf::make_stage<pf::tools::exec>(pf::stage_options(10)))
        .into(pf::make_stage<pf::tools::print<std::string>>());

    pf::config cfg = pf::config::current();
    cfg.fault_policy = pf::efault_policy::RECORD;
    pipe.execute(cfg);

    for(auto& f: pipe.faults()) std::cerr << f.to_string() << std::endl;
    return pipe.faults().empty() ? 0 : 2;
}
