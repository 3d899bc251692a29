#pragma once

/**
 * @file priority_task_queue.hpp
 * @brief Thread-safe priority task queue with FIFO ordering inside a priority level
 *
 * Tasks are served lowest Priority value first (HIGH before MEDIUM before LOW).
 * Tasks sharing a priority leave in the order they were added, decided by a
 * per-queue sequence number assigned under the same lock as the insertion.
 */

#include "priority.hpp"

#include <taskq/common/debug.hpp>
#include <taskq/common/error.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace taskq::core {

// ============================================================================
// Null payload detection
// ============================================================================

namespace detail {

template<typename T>
struct is_smart_pointer : std::false_type {};

template<typename T, typename D>
struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};

template<typename T>
struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};

template<typename T>
struct is_std_function : std::false_type {};

template<typename R, typename... Args>
struct is_std_function<std::function<R(Args...)>> : std::true_type {};

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

}  // namespace detail

/**
 * @brief Whether a payload counts as "no task" and must be rejected by add()
 *
 * Null raw and smart pointers, empty std::function, disengaged std::optional
 * and empty strings are null. A C string counts as a string, so both a null
 * and a "" char pointer are null. Nothing else is.
 */
template<typename T>
bool is_null_payload(const T& payload) noexcept {
    if constexpr (std::is_pointer_v<T> &&
                  std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>) {
        return payload == nullptr || payload[0] == '\0';
    } else if constexpr (std::is_pointer_v<T> || std::is_null_pointer_v<T>) {
        return payload == nullptr;
    } else if constexpr (detail::is_smart_pointer<T>::value) {
        return payload == nullptr;
    } else if constexpr (detail::is_std_function<T>::value) {
        return !static_cast<bool>(payload);
    } else if constexpr (detail::is_optional<T>::value) {
        return !payload.has_value();
    } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
        return payload.empty();
    } else {
        (void)payload;
        return false;
    }
}

// ============================================================================
// Configuration, statistics and snapshot
// ============================================================================

struct PriorityTaskQueueConfig {
    EmptyQueueMode empty_queue_mode = EmptyQueueMode::OPTIONAL;
    std::string name                = "default";
};

/**
 * @brief Queue counters
 *
 * Updated with relaxed atomics after the queue lock is released, so a reader
 * may briefly see them lag behind size().
 */
struct PriorityTaskQueueStats {
    std::atomic<uint64_t> tasks_added{0};
    std::atomic<uint64_t> tasks_taken{0};
    std::atomic<uint64_t> tasks_discarded{0};  ///< Dropped by clear()
    std::atomic<uint64_t> peeks{0};
    std::atomic<uint64_t> empty_polls{0};      ///< take()/peek() on an empty queue
    std::atomic<uint64_t> rejected_invalid_priority{0};
    std::atomic<uint64_t> rejected_invalid_argument{0};
    std::atomic<uint64_t> clears{0};
    std::atomic<uint64_t> peak_size{0};

    uint64_t total_rejected() const noexcept {
        return rejected_invalid_priority.load(std::memory_order_relaxed) +
               rejected_invalid_argument.load(std::memory_order_relaxed);
    }

    void update_peak(uint64_t size) noexcept {
        uint64_t current = peak_size.load(std::memory_order_relaxed);
        while (size > current &&
               !peak_size.compare_exchange_weak(current, size, std::memory_order_relaxed)) {
        }
    }

    void reset() noexcept {
        tasks_added.store(0, std::memory_order_relaxed);
        tasks_taken.store(0, std::memory_order_relaxed);
        tasks_discarded.store(0, std::memory_order_relaxed);
        peeks.store(0, std::memory_order_relaxed);
        empty_polls.store(0, std::memory_order_relaxed);
        rejected_invalid_priority.store(0, std::memory_order_relaxed);
        rejected_invalid_argument.store(0, std::memory_order_relaxed);
        clears.store(0, std::memory_order_relaxed);
        peak_size.store(0, std::memory_order_relaxed);
    }
};

/**
 * @brief Counts read under a single lock acquisition
 *
 * total == high + medium + low always holds.
 */
struct QueueSnapshot {
    size_t total           = 0;
    size_t high            = 0;
    size_t medium          = 0;
    size_t low             = 0;
    uint64_t next_sequence = 0;

    size_t count(Priority p) const noexcept {
        switch (p) {
            case Priority::HIGH:   return high;
            case Priority::MEDIUM: return medium;
            case Priority::LOW:    return low;
            default:               return 0;
        }
    }
};

// ============================================================================
// PriorityTaskQueue
// ============================================================================

/**
 * @brief Thread-safe priority queue of opaque tasks
 *
 * Every public operation is one critical section on a single mutex that
 * guards the heap, the sequence counter and the per-priority counts together.
 * Nothing blocks waiting for work: take() and peek() on an empty queue return
 * immediately according to the configured EmptyQueueMode.
 *
 * @tparam T payload type, must be move-constructible and move-assignable
 */
template<typename T>
class PriorityTaskQueue {
    static_assert(std::is_move_constructible_v<T>, "payload must be move-constructible");

public:
    using value_type = T;

    explicit PriorityTaskQueue(PriorityTaskQueueConfig config = {})
        : config_(std::move(config)) {
        TASKQ_LOG_DEBUG(common::debug::category::QUEUE,
                        "[" << config_.name << "] created, empty_queue_mode="
                            << empty_queue_mode_name(config_.empty_queue_mode));
    }

    ~PriorityTaskQueue() = default;

    PriorityTaskQueue(const PriorityTaskQueue&)            = delete;
    PriorityTaskQueue& operator=(const PriorityTaskQueue&) = delete;
    PriorityTaskQueue(PriorityTaskQueue&&)                 = delete;
    PriorityTaskQueue& operator=(PriorityTaskQueue&&)      = delete;

    /**
     * @brief Insert a task
     *
     * Fails with PRIORITY_INVALID for a priority outside HIGH/MEDIUM/LOW and
     * with INVALID_ARGUMENT for a null payload. A failed add leaves the queue
     * untouched.
     */
    common::Result<void> add(T payload, Priority priority) {
        if (!is_valid_priority(priority)) {
            stats_.rejected_invalid_priority.fetch_add(1, std::memory_order_relaxed);
            TASKQ_LOG_WARN(common::debug::category::QUEUE,
                           "[" << config_.name << "] rejected task with priority level "
                               << static_cast<int>(priority));
            return common::err(common::ErrorCode::PRIORITY_INVALID,
                               "priority must be HIGH, MEDIUM or LOW");
        }

        if (is_null_payload(payload)) {
            stats_.rejected_invalid_argument.fetch_add(1, std::memory_order_relaxed);
            TASKQ_LOG_WARN(common::debug::category::QUEUE,
                           "[" << config_.name << "] rejected null task");
            return common::err(common::ErrorCode::INVALID_ARGUMENT, "task must not be null");
        }

        uint64_t sequence;
        size_t new_size;
        {
            std::lock_guard lock(mutex_);
            sequence = next_sequence_++;
            heap_.push(Entry{priority, sequence, std::move(payload)});
            ++counts_[index_of(priority)];
            new_size = heap_.size();
        }

        stats_.tasks_added.fetch_add(1, std::memory_order_relaxed);
        stats_.update_peak(new_size);
        TASKQ_LOG_TRACE(common::debug::category::QUEUE,
                        "[" << config_.name << "] add priority=" << priority_name(priority)
                            << " seq=" << sequence << " size=" << new_size);
        return common::ok();
    }

    /// Insert a task at MEDIUM priority
    common::Result<void> add(T payload) { return add(std::move(payload), Priority::MEDIUM); }

    /**
     * @brief Remove and return the most urgent task
     *
     * Each task is delivered to exactly one caller.
     */
    common::Result<std::optional<T>> take() {
        std::optional<T> task;
        Priority priority = Priority::MEDIUM;
        uint64_t sequence = 0;
        size_t remaining  = 0;
        {
            std::lock_guard lock(mutex_);
            if (!heap_.empty()) {
                Entry entry = std::move(const_cast<Entry&>(heap_.top()));
                heap_.pop();
                --counts_[index_of(entry.priority)];
                priority = entry.priority;
                sequence = entry.sequence;
                task.emplace(std::move(entry.payload));
                remaining = heap_.size();
            }
        }

        if (!task) {
            return on_empty("take");
        }

        stats_.tasks_taken.fetch_add(1, std::memory_order_relaxed);
        TASKQ_LOG_TRACE(common::debug::category::QUEUE,
                        "[" << config_.name << "] take priority=" << priority_name(priority)
                            << " seq=" << sequence << " size=" << remaining);
        return common::Result<std::optional<T>>(std::move(task));
    }

    /**
     * @brief Copy of the task the next take() would return, left in place
     */
    common::Result<std::optional<T>> peek() const {
        static_assert(std::is_copy_constructible_v<T>, "peek() requires a copyable payload");

        std::optional<T> task;
        {
            std::lock_guard lock(mutex_);
            if (!heap_.empty()) {
                task.emplace(heap_.top().payload);
            }
        }

        if (!task) {
            return on_empty("peek");
        }

        stats_.peeks.fetch_add(1, std::memory_order_relaxed);
        return common::Result<std::optional<T>>(std::move(task));
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return heap_.size();
    }

    bool is_empty() const {
        std::lock_guard lock(mutex_);
        return heap_.empty();
    }

    /**
     * @brief Drop every task and restart the sequence counter
     * @return number of tasks discarded
     */
    size_t clear() {
        size_t discarded;
        {
            std::lock_guard lock(mutex_);
            discarded = heap_.size();
            heap_          = Heap{};
            next_sequence_ = 0;
            counts_.fill(0);
        }

        stats_.clears.fetch_add(1, std::memory_order_relaxed);
        stats_.tasks_discarded.fetch_add(discarded, std::memory_order_relaxed);
        TASKQ_LOG_DEBUG(common::debug::category::QUEUE,
                        "[" << config_.name << "] cleared " << discarded << " task(s)");
        return discarded;
    }

    QueueSnapshot snapshot() const {
        std::lock_guard lock(mutex_);
        QueueSnapshot snap;
        snap.total         = heap_.size();
        snap.high          = counts_[index_of(Priority::HIGH)];
        snap.medium        = counts_[index_of(Priority::MEDIUM)];
        snap.low           = counts_[index_of(Priority::LOW)];
        snap.next_sequence = next_sequence_;
        return snap;
    }

    const PriorityTaskQueueStats& stats() const noexcept { return stats_; }

    void reset_stats() noexcept { stats_.reset(); }

    EmptyQueueMode mode() const noexcept { return config_.empty_queue_mode; }

    const std::string& name() const noexcept { return config_.name; }

private:
    struct Entry {
        Priority priority;
        uint64_t sequence;
        T payload;

        // Min-heap key: priority first, then arrival order
        bool operator>(const Entry& other) const noexcept {
            if (priority != other.priority) {
                return priority > other.priority;
            }
            return sequence > other.sequence;
        }
    };

    using Heap = std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>>;

    static constexpr size_t index_of(Priority p) noexcept {
        return static_cast<size_t>(p) - 1;
    }

    common::Result<std::optional<T>> on_empty(std::string_view operation) const {
        stats_.empty_polls.fetch_add(1, std::memory_order_relaxed);
        if (config_.empty_queue_mode == EmptyQueueMode::STRICT) {
            return common::err<std::optional<T>>(
                common::ErrorCode::QUEUE_EMPTY,
                std::string(operation) + " on empty queue '" + config_.name + "'");
        }
        return common::Result<std::optional<T>>(std::optional<T>{});
    }

    PriorityTaskQueueConfig config_;

    mutable std::mutex mutex_;
    Heap heap_;
    uint64_t next_sequence_ = 0;
    std::array<size_t, 3> counts_{};

    mutable PriorityTaskQueueStats stats_;
};

}  // namespace taskq::core
