#pragma once

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <type_traits>

namespace bourse {

// Thread safety annotations (checked by clang -Wthread-safety)
#if defined(__clang__)
#define THREAD_ANNOTATION(x) __attribute__((x))
#else
#define THREAD_ANNOTATION(x)
#endif
#define GUARDED_BY(x) THREAD_ANNOTATION(guarded_by(x))
#define REQUIRES(x) THREAD_ANNOTATION(requires_capability(x))
#define EXCLUDES(x) THREAD_ANNOTATION(locks_excluded(x))

// Atomic wrapper with memory ordering
template<typename T>
class atomic_wrapper {
public:
    atomic_wrapper() = default;
    atomic_wrapper(T value) : value_(value) {}

    T load(std::memory_order order = std::memory_order_seq_cst) const {
        return value_.load(order);
    }

    void store(T value, std::memory_order order = std::memory_order_seq_cst) {
        value_.store(value, order);
    }

    T fetch_add(T delta, std::memory_order order = std::memory_order_seq_cst) requires std::is_integral_v<T> {
        return value_.fetch_add(delta, order);
    }

    operator T() const {
        return load();
    }

private:
    std::atomic<T> value_{};
};

// Serializes every settlement: at most one order submission, cancellation or
// balance adjustment runs its read-decide-write section at a time. Readers
// that need a consistent view across balances and orders take the shared mode.
class SettlementGate {
public:
    class ExclusiveLock {
    public:
        explicit ExclusiveLock(SettlementGate& gate);
        ~ExclusiveLock();

        ExclusiveLock(const ExclusiveLock&) = delete;
        ExclusiveLock& operator=(const ExclusiveLock&) = delete;

    private:
        SettlementGate& gate_;
    };

    SettlementGate() = default;
    SettlementGate(const SettlementGate&) = delete;
    SettlementGate& operator=(const SettlementGate&) = delete;

    [[nodiscard]] ExclusiveLock exclusive() { return ExclusiveLock(*this); }
    [[nodiscard]] std::shared_lock<std::shared_mutex> shared() {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }

    // True only on the thread currently holding the exclusive mode
    bool held_by_current_thread() const {
        return owner_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    uint64_t settlements() const { return settlements_.load(); }

private:
    std::shared_mutex mutex_;
    std::atomic<std::thread::id> owner_{};
    atomic_wrapper<uint64_t> settlements_{0};
};

} // namespace bourse
