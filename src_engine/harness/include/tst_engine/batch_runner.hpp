#pragma once

#include "engine.hpp"
#include "subject.hpp"
#include "test_case.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tst::engine {

/**
 * \brief Runs every (subject, test case) pair on a pool of worker threads.
 *
 * Runs may finish in any order; each subject's results are re-sequenced into
 * test declaration order before the subject is built. Completed subjects are
 * handed to the callback in input order, each as soon as it and all subjects
 * before it are done. With `jobs == 1` the pairs run strictly sequentially.
 */
class BatchRunner {
public:
    struct Config {
        std::size_t jobs{1};
    };

    using SubjectCallback = std::function<void(const TestSubject&)>;

    BatchRunner(const Engine& engine, Config config);

    [[nodiscard]] std::vector<TestSubject> run(const std::vector<std::string>& subjects,
                                               const std::vector<TestCase>& tests,
                                               const SubjectCallback& on_subject = {}) const;

private:
    const Engine* engine_;
    Config config_;
};

}  // namespace tst::engine
