#include "tst_engine/batch_runner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace tst::engine {

namespace {

// Slots for one subject's runs, filled in completion order.
struct PendingSubject {
    std::vector<std::optional<RunResult>> slots;
    std::size_t remaining{0};
};

}  // namespace

BatchRunner::BatchRunner(const Engine& engine, Config config) : engine_{&engine}, config_{config} {}

std::vector<TestSubject> BatchRunner::run(const std::vector<std::string>& subjects,
                                          const std::vector<TestCase>& tests,
                                          const SubjectCallback& on_subject) const {
    const std::size_t total = subjects.size() * tests.size();
    const std::size_t workers = std::clamp<std::size_t>(config_.jobs, 1, std::max<std::size_t>(total, 1));
    spdlog::info("running {} test(s) on {} subject(s) with {} worker(s)", tests.size(), subjects.size(), workers);

    std::vector<PendingSubject> pending(subjects.size());
    for (auto& entry : pending) {
        entry.slots.resize(tests.size());
        entry.remaining = tests.size();
    }

    std::vector<TestSubject> finished;
    finished.reserve(subjects.size());

    std::mutex mutex;
    std::atomic<std::size_t> next_job{0};
    std::exception_ptr failure;

    // Must be called with the mutex held: publishes the completed prefix.
    auto publish_ready = [&]() {
        while (finished.size() < subjects.size() && pending[finished.size()].remaining == 0) {
            const auto index = finished.size();
            TestSubject subject{subjects[index]};
            for (auto& slot : pending[index].slots) {
                subject.add_run(std::move(*slot));
            }
            pending[index].slots.clear();
            finished.push_back(std::move(subject));
            if (on_subject) {
                on_subject(finished.back());
            }
        }
    };

    auto worker = [&]() {
        while (true) {
            const auto job = next_job.fetch_add(1);
            if (job >= total) {
                return;
            }
            const auto subject_index = job / tests.size();
            const auto test_index = job % tests.size();
            try {
                auto result = engine_->run(tests[test_index], subjects[subject_index]);
                std::lock_guard<std::mutex> lock(mutex);
                auto& entry = pending[subject_index];
                entry.slots[test_index] = std::move(result);
                --entry.remaining;
                publish_ready();
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
                next_job.store(total);
                return;
            }
        }
    };

    {
        std::lock_guard<std::mutex> lock(mutex);
        publish_ready();  // subjects with no tests at all
    }

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    spdlog::info("finished {} subject(s)", finished.size());
    return finished;
}

}  // namespace tst::engine
