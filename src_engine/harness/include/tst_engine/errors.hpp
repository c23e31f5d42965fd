#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tst::engine {

/// Malformed test document or test entry.
class TestDefinitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Fatal condition of the surrounding environment (no subjects, no tests, missing files).
class EnvironmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief A child process could not be started.
 *
 * transient() distinguishes resource exhaustion, which is worth retrying,
 * from permanent conditions such as a missing executable.
 */
class SpawnError : public std::runtime_error {
public:
    SpawnError(const std::string& what, int error_code);

    [[nodiscard]] int error_code() const noexcept { return error_code_; }
    [[nodiscard]] bool transient() const noexcept;

private:
    int error_code_;
};

}  // namespace tst::engine
