#pragma once

#include <tbb/global_control.h>
#include <atomic>
#include <memory>
#include <mutex>

/**
 * @brief Bounds the parallelism of every TBB algorithm used by the hashing pipeline
 *
 * Holds a tbb::global_control for max_allowed_parallelism. Without it TBB
 * uses all hardware threads.
 */
class ThreadPoolManager
{
public:
    /**
     * @brief Initialize the thread pool manager
     * @param num_threads Number of threads; invalid values fall back to 4
     */
    static void initialize(size_t num_threads);

    /**
     * @brief Initialize from max_processing_threads in VideoHashConfig
     */
    static void initializeFromConfig();

    /**
     * @brief Release the parallelism limit
     */
    static void shutdown();

    /**
     * @brief Change the parallelism limit
     * @param new_num_threads New number of threads
     * @return true if resize was successful, false otherwise
     */
    static bool resizeThreadPool(size_t new_num_threads);

    /**
     * @brief Get current thread pool size, 0 when not initialized
     */
    static size_t getCurrentThreadCount();

    static bool isInitialized() { return initialized_.load(); }

    /**
     * @brief Accept counts in [1, 64]; warns above twice the hardware concurrency
     */
    static bool validateThreadCount(size_t thread_count);

    static constexpr size_t DEFAULT_THREAD_COUNT = 4;

private:
    static std::unique_ptr<tbb::global_control> global_control_;
    static std::atomic<bool> initialized_;
    static std::atomic<size_t> current_thread_count_;
    static std::mutex resize_mutex_;
};
