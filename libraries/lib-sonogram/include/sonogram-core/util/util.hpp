#pragma once

#ifndef sonogram_util_hpp
#define sonogram_util_hpp

#include <sstream>
#include <iostream>
#include <string>
#include <chrono>
#include <cstdint>

namespace sonogram
{
    class scoped_timer
    {
        std::string message;
        std::chrono::high_resolution_clock::time_point t0;
    public:
        scoped_timer(std::string message) : message{ std::move(message) }, t0{ std::chrono::high_resolution_clock::now() } {}
        ~scoped_timer()
        {
            const auto timestamp_ms = (std::chrono::duration<float>(std::chrono::high_resolution_clock::now() - t0).count() * 1000);
            std::cout << message << " completed in " << std::to_string(timestamp_ms) << " ms\n";
        }
    };

    class manual_timer
    {
        std::chrono::high_resolution_clock::time_point t0;
        double timestamp{ 0.0 };
    public:
        void start() { t0 = std::chrono::high_resolution_clock::now(); }
        void stop() { timestamp = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - t0).count() * 1000; }
        double running() const { return std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - t0).count() * 1000; }
        const double & get() const { return timestamp; }
    };

    class non_copyable
    {
    protected:
        non_copyable() = default;
        ~non_copyable() = default;
        non_copyable(const non_copyable & r) = delete;
        non_copyable & operator = (const non_copyable & r) = delete;
    };

    template <typename T>
    class singleton : public non_copyable
    {
    protected:
        static T * single;
        singleton() = default;
        ~singleton() = default;
    public:
        static T * get() { if (!single) single = new T(); return single; };
    };

    struct as_string
    {
        std::ostringstream ss;
        operator std::string() const { return ss.str(); }
        template<class T> as_string & operator << (const T & val) { ss << val; return *this; }
    };

} // end namespace sonogram

#endif // end sonogram_util_hpp
