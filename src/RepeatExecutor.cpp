#include "RepeatExecutor.h"
#include <algorithm>
#include <exception>
#include <vector>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
void rethrowFirst(const std::vector<std::exception_ptr>& failures) {
    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }
}
} // namespace

void SequentialExecutor::forEachIndex(size_t count, const std::function<void(size_t)>& task) const {
    std::vector<std::exception_ptr> failures(count);
    for (size_t i = 0; i < count; ++i) {
        try {
            task(i);
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }
    rethrowFirst(failures);
}

OpenMPExecutor::OpenMPExecutor(int threads) : threads_(threads) {}

void OpenMPExecutor::forEachIndex(size_t count, const std::function<void(size_t)>& task) const {
    std::vector<std::exception_ptr> failures(count);

    #ifdef USE_OPENMP
    const int threadCount = threads_ > 0 ? threads_ : std::max(1, omp_get_max_threads());
    #pragma omp parallel for schedule(dynamic) num_threads(threadCount)
    for (long long i = 0; i < static_cast<long long>(count); ++i) {
        try {
            task(static_cast<size_t>(i));
        } catch (...) {
            failures[static_cast<size_t>(i)] = std::current_exception();
        }
    }
    #else
    for (size_t i = 0; i < count; ++i) {
        try {
            task(i);
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }
    #endif

    rethrowFirst(failures);
}
