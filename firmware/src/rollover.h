#ifndef GUARD_QJMRPHTWKXCZEAOV
#define GUARD_QJMRPHTWKXCZEAOV

#include <atomic>
#include <cstdint>

// storage for the rollover count. the wrap interrupt is the only writer;
// anything may read.

template<typename Count>
class AtomicCell {
    std::atomic<Count> value_;
public:
    explicit AtomicCell(Count initial) :
        value_(initial) {
    }
    AtomicCell(AtomicCell const &) = delete; AtomicCell & operator=(AtomicCell const &) = delete; // noncopyable

    void increment() {
        value_.fetch_add(1, std::memory_order_release);
    }
    Count load() const {
        return value_.load(std::memory_order_acquire);
    }
};

// for counts the core can't load in one instruction (uint64_t on cortex-m).
// Guard is an RAII type that keeps the wrap interrupt out while it lives.
template<typename Count, typename Guard>
class GuardedCell {
    volatile Count value_;
public:
    explicit GuardedCell(Count initial) :
        value_(initial) {
    }
    GuardedCell(GuardedCell const &) = delete; GuardedCell & operator=(GuardedCell const &) = delete; // noncopyable

    void increment() {
        { Guard g;
            value_ = value_ + 1;
        }
    }
    Count load() const {
        Count result;
        { Guard g;
            result = value_;
        }
        return result;
    }
};

template<typename Count, typename Cell>
class RolloverTracker {
    Cell cell_;
public:
    typedef Count count_type;

    explicit RolloverTracker(Count initial=0) :
        cell_(initial) {
    }
    RolloverTracker(RolloverTracker const &) = delete; RolloverTracker & operator=(RolloverTracker const &) = delete; // noncopyable

    // only from the wrap interrupt, once per wrap
    void on_wrap() {
        cell_.increment();
    }

    Count snapshot() const {
        return cell_.load();
    }
};

#endif
