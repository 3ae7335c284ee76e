#pragma once
#ifndef LFRBENCH_SCOPED_TIMER_HPP
#define LFRBENCH_SCOPED_TIMER_HPP

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace lfrbench {

//! prints "<label> took <ms>ms" on destruction if constructed with a label
class ScopedTimer {
    using clock = std::chrono::steady_clock;

public:
    ScopedTimer() : begin_(clock::now()) {}

    explicit ScopedTimer(std::string label) : label_(std::move(label)), begin_(clock::now()) {}

    ~ScopedTimer() {
        if (!label_.empty())
            std::cout << label_ << " took " << elapsed() << "ms\n";
    }

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;

    void start() { begin_ = clock::now(); }

    //! milliseconds since construction or the last start()
    [[nodiscard]] double elapsed() const {
        return std::chrono::duration<double, std::milli>(clock::now() - begin_).count();
    }

private:
    std::string label_;
    clock::time_point begin_;
};

}

#endif // LFRBENCH_SCOPED_TIMER_HPP
