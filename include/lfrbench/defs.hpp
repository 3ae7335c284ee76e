#ifndef LFRBENCH_DEFS_HPP
#define LFRBENCH_DEFS_HPP

#include <cstdlib>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace lfrbench {

    using node = uint64_t;
    using edgeid = uint64_t;
    using count = uint64_t;
    using community_id = uint64_t;

    //! raised when LFRParameters violate a constraint; parameter() names the offending field
    class ParameterError : public std::invalid_argument {
    public:
        ParameterError(std::string parameter, const std::string &what)
            : std::invalid_argument(what), parameter_(std::move(parameter)) {}

        [[nodiscard]] const std::string &parameter() const noexcept { return parameter_; }

    private:
        std::string parameter_;
    };

    //! raised by LFRGenerator::generate before any sampling if the host graph is unsuitable
    class GenerationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

}

#endif //LFRBENCH_DEFS_HPP
