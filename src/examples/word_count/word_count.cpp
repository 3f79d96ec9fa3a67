#include "../../pipeflow.hpp"

#include <iostream>
#include <map>
#include <sstream>

/**
 * Reads the files named on the command line with four concurrent readers,
 * counts the words in a single stage and prints the counts:
 *
 *      word_count file1.txt file2.txt file3.txt
 */
class word_counter : public pf::base_stage<std::string, std::string> {

    public:
        word_counter() : base_stage<std::string, std::string>("word_counter") { }

        virtual void process(const std::string& line) override {
            std::istringstream words(line);
            std::string word;
            while(words >> word) counts[word]++;
        }

        virtual void teardown() override {
            for(auto& count: counts) emit(count.first + " " + std::to_string(count.second));
        }

    private:
        std::map<std::string, int> counts;
};

int main(int argc, char* argv[]) {

    if(argc < 2) {
        std::cerr << "Usage: " << argv[0] << " file..." << std::endl;
        return 1;
    }

    std::vector<std::string> files(argv + 1, argv + argc);

    auto pipe = pf::make_stage<pf::tools::iter<std::string>>(files)
        .into(pf::make_stage<pf::tools::read_lines>(pf::stage_options(4)))
        .into(pf::make_stage<word_counter>())
        .into(pf::make_stage<pf::tools::print<std::string>>());

    try {
        pipe.execute();
    } catch(const pf::pipeline_failure& e) {
        for(auto& f: e.faults()) std::cerr << f.to_string() << std::endl;
        return 2;
    }

    return 0;
}
