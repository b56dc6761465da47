#ifndef GUARD_OGAPHGVYGDTBGDYV
#define GUARD_OGAPHGVYGDTBGDYV

#include <cassert>

#include <libopencm3/cm3/cortex.h>

// nests; only unmasks if interrupts were enabled on entry
class CriticalSection {
    bool masked_prior_;
public:
    CriticalSection() :
        masked_prior_(cm_is_masked_interrupts()) {
        if(!masked_prior_) {
            cm_disable_interrupts();
        }
    }
    ~CriticalSection() {
        assert(cm_is_masked_interrupts());
        if(!masked_prior_) {
            cm_enable_interrupts();
        }
    }
    CriticalSection(CriticalSection const &) = delete; CriticalSection & operator=(CriticalSection const &) = delete; // noncopyable
};

#define CAT2(a, b) CAT2_(a, b)
#define CAT2_(a, b) a ## b

#endif
