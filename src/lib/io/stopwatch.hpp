#pragma once

#include <chrono>
#include <iostream>
#include <string>

namespace memocache {

// Prints the lifetime of the enclosing scope on destruction unless quiet.
struct Stopwatch {
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    Stopwatch(std::string description = "", bool quiet = false)
        : description_(description), quiet_(quiet) {}

    ~Stopwatch() {
        if (quiet_) return;
        std::cout << "\"" << description_ << "\""
                  << " took " << ElapsedSeconds() * 1e3 << " ms" << std::endl;
    }

    double ElapsedSeconds() const {
        std::chrono::duration<double> dur = std::chrono::steady_clock::now() - start;
        return dur.count();
    }

   private:
    std::string description_;
    bool quiet_;
};

}  // namespace memocache
