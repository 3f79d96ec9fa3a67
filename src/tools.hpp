#ifndef TOOLS_HPP
#define TOOLS_HPP

#include <functional>
#include <iostream>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include "task.hpp"

namespace pf {

    namespace tools {

        /**
         * Writes one whole line to out, lines of concurrent workers never interleave
         */
        void write_line(std::ostream& out, const std::string& line);

        /**
         * Quotes word for sh, the shell sees it as a single word
         * whatever characters it contains
         */
        std::string shell_quote(const std::string& word);

        /**
         * Emits every element of the vector given to make_stage
         *
         *  make_stage<iter<int>>(std::vector<int>{ 1, 5, 10 })
         */
        template <typename T>
            class iter : public base_stage<none, T> {

                public:
                    iter() : base_stage<none, T>("iter") { }

                    void setup(const std::vector<T>& values) {
                        for(auto& value: values) this->emit(value);
                    }
            };

        /**
         * Emits the result of the given function for every input
         *
         *  make_stage<fn<int, int>>([](const int& x) { return x * x; })
         */
        template <typename In, typename Out>
            class fn : public base_stage<In, Out> {

                public:
                    fn() : base_stage<In, Out>("fn") { }

                    void setup(std::function<Out(const In&)> function) {
                        this->function = std::move(function);
                    }

                    virtual void process(const In& input) override {
                        this->emit(function(input));
                    }

                private:
                    std::function<Out(const In&)> function;
            };

        /**
         * Writes every input to standard output, or to the stream given to
         * make_stage as std::ref(stream). Emits nothing.
         */
        template <typename T>
            class print : public base_stage<T, T> {

                public:
                    print() : base_stage<T, T>("print") { }

                    void setup() { }

                    void setup(std::ostream& out) {
                        this->out = &out;
                    }

                    virtual void process(const T& input) override {
                        std::ostringstream line;
                        line << input;
                        write_line(*out, line.str());
                    }

                private:
                    std::ostream* out = &std::cout;
            };

        /**
         * Receives values until none are left, then emits them in reverse order
         */
        template <typename T>
            class reverse : public base_stage<T, T> {

                public:
                    reverse() : base_stage<T, T>("reverse") { }

                    virtual void process(const T& input) override {
                        data.push_back(input);
                    }

                    virtual void teardown() override {
                        for(auto it = data.rbegin(); it != data.rend(); ++it) this->emit(*it);
                    }

                private:
                    std::vector<T> data;
            };

        /**
         * Emits the lines of the file named in make_stage and of every file
         * name received as input, without the line terminators
         */
        class read_lines : public base_stage<std::string, std::string> {

            public:
                read_lines();

                using base_stage<std::string, std::string>::setup;
                void setup(const std::string& filename);

                virtual void process(const std::string& filename) override;

            private:
                void emit_file(const std::string& filename);
        };

        /**
         * Runs a shell command given to make_stage and each command received
         * as input, emits the standard output of every command unchanged
         * @throws std::runtime_error from process if a command exits with non-zero status
         */
        class exec : public base_stage<std::string, std::string> {

            public:
                exec();

                using base_stage<std::string, std::string>::setup;
                void setup(const std::string& command);

                virtual void process(const std::string& command) override;

            private:
                void run(const std::string& command);
        };

        /**
         * Emits only inputs containing a match of the regular expression
         * given to make_stage
         */
        class grep : public base_stage<std::string, std::string> {

            public:
                grep();

                void setup(const std::string& pattern);

                virtual void process(const std::string& text) override;

            private:
                std::regex expression;
        };
    }
}

#endif
