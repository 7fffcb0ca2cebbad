#pragma once
#include <cstddef>
#include <functional>

/**
 * Runs `task(i)` for every i in [0, count) and returns only after all of them finished.
 * A task that throws fails the whole call: the lowest failing index is rethrown once
 * every task has returned.
 */
class RepeatExecutor {
public:
    virtual ~RepeatExecutor() = default;
    virtual void forEachIndex(size_t count, const std::function<void(size_t)>& task) const = 0;
};

class SequentialExecutor : public RepeatExecutor {
public:
    void forEachIndex(size_t count, const std::function<void(size_t)>& task) const override;
};

// Dynamic-schedule OpenMP loop; plain loop when built without USE_OPENMP.
class OpenMPExecutor : public RepeatExecutor {
public:
    // threads <= 0 keeps the OpenMP runtime default.
    explicit OpenMPExecutor(int threads = 0);

    void forEachIndex(size_t count, const std::function<void(size_t)>& task) const override;

    int threads() const { return threads_; }

private:
    int threads_;
};
