#ifndef FERRY_SPINLOCK_HPP
#define FERRY_SPINLOCK_HPP

#include <atomic>
#include <thread>

namespace ferry {

//! Lock for critical sections of a handful of instructions
/*!
    Guards transfer-unit exit state and supervisor bookkeeping, which are
    touched from io-service threads and must never block on a mutex held
    across a monitor callback. Callbacks are always invoked unlocked.
*/
class spinlock
{
public:

    spinlock()
     : _locked(false)
    { }

    spinlock(const spinlock &) = delete;
    spinlock & operator=(const spinlock &) = delete;

    bool try_acquire()
    {
        return !_locked.exchange(true, std::memory_order_acquire);
    }

    void acquire()
    {
        for(unsigned spins = 0; !try_acquire(); ++spins)
        {
            // holder was likely preempted
            if(spins > 64)
            {
                std::this_thread::yield();
            }
        }
    }

    void release()
    {
        _locked.store(false, std::memory_order_release);
    }

    class guard
    {
    public:

        explicit guard(spinlock & lock)
         : _lock(lock)
        { _lock.acquire(); }

        ~guard()
        { _lock.release(); }

        guard(const guard &) = delete;
        guard & operator=(const guard &) = delete;

    private:

        spinlock & _lock;
    };

private:

    std::atomic<bool> _locked;
};

}

#endif
