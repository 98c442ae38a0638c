#pragma once

#include <type_traits>
#include <mutex>
#include <atomic>
#include <thread>
#include <utility>
#include <cmath>

#include "config.h"

namespace ember
{
    // Formats the message, logs it and hands it to Config.fatal, aborts if that returns
    [[noreturn]] void FatalError(const char* fmt, ...);

    template <typename T>
    T clamp(T val, T min, T max)
    {
        return val > max ? max : val < min ? min : val;
    }

    template <typename T>
    T Lerp(T from, T to, float t)
    {
        return from + (to - from) * t;
    }

    // Maps val from [from0, from1] onto [to0, to1], values outside are clamped to the nearest end.
    // A degenerate source range or a NaN value maps onto to0.
    inline float RemapClamp(float val, float from0, float from1, float to0, float to1)
    {
        if (from0 == from1 || std::isnan(val)) return to0;

        auto lo = from0 < from1 ? from0 : from1;
        auto hi = from0 < from1 ? from1 : from0;
        auto t = (clamp(val, lo, hi) - from0) / (from1 - from0);
        return Lerp(to0, to1, t);
    }

    // A value paired with the mutex guarding it. Acquiring it again from the thread that
    // already holds it is a programming error and goes to FatalError instead of deadlocking.
    template <typename T>
    struct Mutex
    {
        struct Guard
        {
            explicit Guard(Mutex& source)
                : _source{ source }
            {
                auto self = std::this_thread::get_id();
                if (_source._owner.load() == self)
                    FatalError("Reentrant lock of %s\n", _source._name);

                if (!_source._mutex.try_lock())
                    _source._mutex.lock();
                _source._owner.store(self);
            }

            Guard(const Guard&) = delete;
            Guard& operator=(const Guard&) = delete;

            ~Guard()
            {
                _source._owner.store(std::thread::id{});
                _source._mutex.unlock();
            }

            T* operator->() { return &_source._value; }
            T& operator*() { return _source._value; }

        private:

            Mutex& _source;
        };

        explicit Mutex(const char* name, T value = T{})
            : _value{ std::move(value) }, _name{ name }
        {}

        Mutex(const Mutex& src)
            : _value{ src.Get() }, _name{ src._name }
        {}

        Mutex& operator=(const Mutex&) = delete;

        [[nodiscard]] Guard Lock() { return Guard{ *this }; }

        // Copies the value out under the lock
        [[nodiscard]] T Get() const
        {
            auto guard = const_cast<Mutex*>(this)->Lock();
            return *guard;
        }

        void Set(T value)
        {
            auto guard = Lock();
            *guard = std::move(value);
        }

        const char* Name() const { return _name; }

    private:

        T _value;
        const char* _name = "";
        std::mutex _mutex;
        std::atomic<std::thread::id> _owner{};
    };
}
