#pragma once

#include <chrono>
#include <iostream>
#include <string>

namespace benchmark {
    //! prints the lifetime of the object on destruction
    class timer {
        using clock_t = std::chrono::steady_clock;

        std::string _name;
        clock_t::time_point _start;

    public:
        timer(const std::string &name)
            : _name(name)
            , _start(clock_t::now())
        {}

        ~timer() {
            const auto dur = std::chrono::duration_cast<std::chrono::microseconds>(clock_t::now() - _start);
            std::cout << _name << ": " << dur.count() / 1000.0 << " ms" << std::endl;
        }

        timer(const timer &) = delete;
        timer &operator=(const timer &) = delete;
    };
};
