#pragma once

#include <chrono>
#include <string>

namespace nearme {

/// Formats as YYYY-MM-DDTHH:MM:SS.mmmZ
std::string formatIso8601(std::chrono::system_clock::time_point time);

class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;

    std::string iso8601() const { return formatIso8601(now()); }
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace nearme
