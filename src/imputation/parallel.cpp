#include "station_impute/imputation/parallel.hpp"
#include "station_impute/core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <functional>
#include <iterator>
#include <mutex>
#include <thread>

namespace station_impute::imputation {

int compute_worker_count(unsigned units, double fraction, int max_workers, size_t tasks) {
    int workers = static_cast<int>(std::floor(static_cast<double>(units) * fraction));
    workers = std::max(1, workers);
    if (max_workers > 0) {
        workers = std::min(workers, max_workers);
    }
    if (tasks > 0) {
        workers = static_cast<int>(std::min(static_cast<size_t>(workers), tasks));
    }
    return std::max(1, workers);
}

int compute_worker_count(double fraction, int max_workers, size_t tasks) {
    unsigned units = std::thread::hardware_concurrency();
    if (units == 0) {
        units = 1;
    }
    return compute_worker_count(units, fraction, max_workers, tasks);
}

ParallelImputationResult run_parallel_imputation(std::vector<TimeSlice>& slices,
                                                 const SliceProcessor& processor,
                                                 int workers,
                                                 const ProgressCallback& on_progress) {
    ParallelImputationResult result;
    result.workers = std::max(1, workers);

    const size_t n = slices.size();
    result.slice_stats.assign(n, {});
    std::vector<std::vector<ImputationLogEntry>> slice_logs(n);
    std::vector<std::string> slice_errors(n);
    std::vector<char> slice_failed(n, 0);

    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::mutex progress_mutex;

    std::vector<std::string> worker_names;
    worker_names.reserve(static_cast<size_t>(result.workers));
    for (int w = 0; w < result.workers; ++w) {
        worker_names.push_back("worker-" + std::to_string(w));
    }

    auto worker_loop = [&](const std::string& worker) {
        while (true) {
            const size_t si = next.fetch_add(1);
            if (si >= n) {
                break;
            }
            Matrix2Dd original;
            bool saved = false;
            try {
                original = slices[si].values;
                saved = true;
                result.slice_stats[si] = processor(slices[si], worker, slice_logs[si]);
            } catch (const std::exception& e) {
                slice_failed[si] = 1;
                slice_errors[si] = e.what();
            } catch (...) {
                slice_failed[si] = 1;
                slice_errors[si] = "unknown_error";
            }
            if (slice_failed[si]) {
                // An unsaved copy means the processor never ran
                if (saved) {
                    slices[si].values.swap(original);
                }
                slice_logs[si].clear();
                result.slice_stats[si] = {};
            }

            const size_t d = done.fetch_add(1) + 1;
            if (on_progress) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                on_progress(d, n, result.workers);
            }
        }
    };

    if (result.workers > 1 && n > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(result.workers));
        for (int w = 0; w < result.workers; ++w) {
            pool.emplace_back(worker_loop, std::cref(worker_names[static_cast<size_t>(w)]));
        }
        for (auto& t : pool) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker_loop(worker_names.front());
    }

    for (size_t si = 0; si < n; ++si) {
        if (slice_failed[si]) {
            result.failures.push_back({si, slices[si].timestamp, slice_errors[si]});
            continue;
        }
        result.totals.accumulate(result.slice_stats[si]);
        result.log.insert(result.log.end(),
                          std::make_move_iterator(slice_logs[si].begin()),
                          std::make_move_iterator(slice_logs[si].end()));
    }
    return result;
}

void write_imputation_log(const fs::path& path, const std::vector<ImputationLogEntry>& log) {
    std::string text;
    for (const auto& entry : log) {
        text += format_log_line(entry);
        text += '\n';
    }
    core::write_text(path, text);
}

} // namespace station_impute::imputation
