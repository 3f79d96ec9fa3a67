#include "tools.hpp"

#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace pf {

    namespace tools {

        void write_line(std::ostream& out, const std::string& line) {
            static std::mutex output_mutex;
            std::lock_guard<std::mutex> lock(output_mutex);
            out << line << std::endl;
        }

        std::string shell_quote(const std::string& word) {
            std::string quoted = "'";
            for(char c: word) {
                if(c == '\'') quoted += "'\\''";
                else quoted += c;
            }
            return quoted + "'";
        }

        // --- read_lines -----------------

        read_lines::read_lines() : base_stage<std::string, std::string>("read_lines") { }

        void read_lines::setup(const std::string& filename) {
            emit_file(filename);
        }

        void read_lines::process(const std::string& filename) {
            emit_file(filename);
        }

        void read_lines::emit_file(const std::string& filename) {
            if(filename.empty()) return;

            std::ifstream ifs(filename);
            if(!ifs) throw std::runtime_error("cannot open file " + filename);

            std::string line;
            while(std::getline(ifs, line)) emit(line);
        }

        // --- exec -----------------

        exec::exec() : base_stage<std::string, std::string>("exec") { }

        void exec::setup(const std::string& command) {
            run(command);
        }

        void exec::process(const std::string& command) {
            run(command);
        }

        void exec::run(const std::string& command) {
            if(command.empty()) return;

            bp::ipstream out;
            bp::child child(bp::search_path("sh"), "-c", command, bp::std_out > out);

            std::string output((std::istreambuf_iterator<char>(out)), std::istreambuf_iterator<char>());
            child.wait();

            if(child.exit_code() != 0)
                throw std::runtime_error("command '" + command + "' exited with status "
                        + std::to_string(child.exit_code()));
            emit(output);
        }

        // --- grep -----------------

        grep::grep() : base_stage<std::string, std::string>("grep") { }

        void grep::setup(const std::string& pattern) {
            expression = std::regex(pattern);
        }

        void grep::process(const std::string& text) {
            if(std::regex_search(text, expression)) emit(text);
        }
    }
}
