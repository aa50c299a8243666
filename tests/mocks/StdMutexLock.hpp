#ifndef STD_MUTEX_LOCK_HPP
#define STD_MUTEX_LOCK_HPP

#include <mutex>

// Host stand-in for RtosLock.
class StdMutexLock {
public:
    bool lock()   { _m.lock(); return true; }
    void unlock() { _m.unlock(); }

private:
    std::mutex _m;
};

// A lock that can never be taken (mutex creation failed / timeout).
class RefusingLock {
public:
    bool lock()   { return false; }
    void unlock() {}
};

// Counts every acquisition across all records that use it.
class CountingLock {
public:
    bool lock()   { acquisitions++; return true; }
    void unlock() {}

    static inline int acquisitions = 0;
};

#endif // STD_MUTEX_LOCK_HPP
