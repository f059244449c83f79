#ifndef PRINCE_ERRORS_HPP
#define PRINCE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace prince {

// Out-of-range option value. Thrown by setters before any process is started;
// the options object keeps its previous state.
class configuration_error : public std::invalid_argument {
public:
    explicit configuration_error(const std::string& what)
    : std::invalid_argument(what) {}
};

// The engine could not be started at all (missing executable, permissions,
// pipe/process creation failure). Distinct from an unsuccessful conversion.
class launch_error : public std::runtime_error {
public:
    launch_error(const std::string& what, int code)
    : std::runtime_error(what), code_(code) {}

    // errno on POSIX, GetLastError() on Windows
    int code() const { return code_; }

private:
    int code_;
};

// Input file / output sink could not be opened, or a pipe failed with
// something other than EOF / EPIPE. The child is already reaped when thrown.
class io_error : public std::runtime_error {
public:
    explicit io_error(const std::string& what)
    : std::runtime_error(what) {}
};

} // namespace prince

#endif // PRINCE_ERRORS_HPP
