/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef LOCKED_RECORD_HPP
#define LOCKED_RECORD_HPP

/*
 * LockedRecord<T, Lock>
 *
 * One shared record behind its own lock.
 *
 *   snapshot()  -> copy of the whole record (lock held only for the copy)
 *   replace(v)  -> overwrite the whole record
 *   update(fn)  -> mutate in place under the lock (fn must not block)
 *
 * Lock must provide:  bool lock() const;  void unlock() const;
 * A failed lock() leaves the record untouched and snapshot() returns the
 * default-constructed value.
 */
template <typename T, typename Lock>
class LockedRecord {
public:
    LockedRecord() = default;
    explicit LockedRecord(const T& initial) : _value(initial) {}

    T snapshot() const {
        T out{};
        if (_lock.lock()) {
            out = _value;
            _lock.unlock();
        }
        return out;
    }

    void replace(const T& value) {
        if (!_lock.lock()) return;
        _value = value;
        _lock.unlock();
    }

    template <typename Fn>
    void update(Fn fn) {
        if (!_lock.lock()) return;
        fn(_value);
        _lock.unlock();
    }

private:
    mutable Lock _lock;
    T _value{};
};

#endif // LOCKED_RECORD_HPP
