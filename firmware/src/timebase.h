#ifndef GUARD_HNUWTEGOKZBMRLAF
#define GUARD_HNUWTEGOKZBMRLAF

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <limits>
#include <ratio>
#include <type_traits>

// Extends a wrapping down-counter to a wide tick count.
//
// Counter must provide
//     uint32_t remaining() const; // counts left before the next wrap
//     uint32_t reload() const;    // value loaded on wrap
//     void start();               // configure, start counting, arm the wrap interrupt
// Tracker is a RolloverTracker whose on_wrap() runs from the counter's wrap
// interrupt.
//
// The wrap is the transition from 0 back to reload, and that is where the
// interrupt counts it. remaining() == 0 is the last tick of the old period,
// remaining() == reload the first tick of the new one, so a period is
// reload + 1 ticks long.


// Integer units are computed from whole seconds and the sub-second remainder
// separately, so no intermediate exceeds 64 bits for any Frequency below 2^32
// and any unit down to nanoseconds. The result is rounded down.
template<typename ToDuration, uint32_t Frequency, bool Floating>
struct TickConversion {
    typedef typename ToDuration::period Period;
    static_assert(Period::den <= 1000000000, "unit finer than a nanosecond");

    static ToDuration convert(uint64_t ticks) {
        uint64_t const whole = ticks / Frequency;
        uint64_t const rem = ticks % Frequency;

        uint64_t const scaled = whole * Period::den;
        uint64_t units = scaled / Period::num;
        uint64_t const carry = scaled % Period::num;
        units += (carry * Frequency + rem * Period::den) / (Period::num * static_cast<uint64_t>(Frequency));

        return ToDuration(static_cast<typename ToDuration::rep>(units));
    }
};

template<typename ToDuration, uint32_t Frequency>
struct TickConversion<ToDuration, Frequency, true> {
    static ToDuration convert(uint64_t ticks) {
        return std::chrono::duration_cast<ToDuration>(
            std::chrono::duration<typename ToDuration::rep, std::ratio<1, Frequency>>(ticks));
    }
};

template<typename ToDuration, uint32_t Frequency>
ToDuration ticks_to(uint64_t ticks) {
    static_assert(Frequency > 0, "tick rate must be nonzero");
    return TickConversion<ToDuration, Frequency,
        std::chrono::treat_as_floating_point<typename ToDuration::rep>::value>::convert(ticks);
}


template<typename Counter, typename Tracker, uint32_t Frequency>
class Timebase {
public:
    typedef typename Tracker::count_type Ticks;
    typedef std::chrono::duration<Ticks, std::ratio<1, Frequency>> Duration;

    static_assert(std::is_unsigned<Ticks>::value, "tick count must be unsigned");
    static_assert(sizeof(Ticks) >= sizeof(uint32_t), "tick count narrower than the counter");
    static_assert(Frequency > 0, "tick rate must be nonzero");

private:
    Counter & counter_;
    Tracker & tracker_;
    uint32_t const reload_;
    Ticks const period_;

    Ticks elapsed_in_period() const {
        return reload_ - counter_.remaining();
    }

    static uint64_t ticks_ceil(uint32_t count, uint32_t per_second) {
        return (static_cast<uint64_t>(count) * Frequency + per_second - 1) / per_second;
    }

public:
    // clock is the frequency the counter was actually configured for
    Timebase(Counter & counter, Tracker & tracker, uint32_t clock) :
        counter_(counter),
        tracker_(tracker),
        reload_(counter.reload()),
        period_(static_cast<Ticks>(counter.reload()) + 1) {
        assert(clock == Frequency);
        counter_.start();
    }
    Timebase(Timebase const &) = delete; Timebase & operator=(Timebase const &) = delete; // noncopyable

    static constexpr uint32_t ticks_per_second() {
        return Frequency;
    }

    Ticks period() const {
        return period_;
    }

    // not with the wrap interrupt masked across a wrap (critical section,
    // higher priority handler): the count reads a period low until it runs
    Ticks now() const {
        Ticks rollovers = tracker_.snapshot();
        Ticks elapsed = elapsed_in_period();
        Ticks const check = tracker_.snapshot();
        if(check != rollovers) {
            // wrapped while reading. the interrupt is a whole period away from
            // firing again, so one more counter read pairs with check
            rollovers = check;
            elapsed = elapsed_in_period();
        }
        return rollovers * period_ + elapsed;
    }

    Duration now_duration() const {
        return Duration(now());
    }

    template<typename ToDuration>
    ToDuration now_as() const {
        return ticks_to<ToDuration, Frequency>(now());
    }

    // valid as long as less than one full tick count width has passed
    Ticks elapsed_since(Ticks start) const {
        return now() - start;
    }

    void delay_ticks(uint64_t ticks) const {
        Ticks const max_step = std::numeric_limits<Ticks>::max() / 2;
        while(ticks) {
            Ticks const step = static_cast<Ticks>(std::min<uint64_t>(ticks, max_step));
            Ticks const start = now();
            while(elapsed_since(start) < step);
            ticks -= step;
        }
    }

    void delay(Duration d) const {
        delay_ticks(d.count());
    }

    void delay_us(uint32_t us) const {
        delay_ticks(ticks_ceil(us, 1000000));
    }

    void delay_ms(uint32_t ms) const {
        delay_ticks(ticks_ceil(ms, 1000));
    }
};

#endif
