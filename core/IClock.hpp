#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace iotpipe {

/// Wall clock used for token expiry and message timestamps
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual uint64_t epochSeconds() const = 0;
    virtual std::string iso8601() const = 0;
};

/// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string formatIso8601(std::chrono::system_clock::time_point time);

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    uint64_t epochSeconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            now().time_since_epoch()).count();
    }

    std::string iso8601() const override { return formatIso8601(now()); }
};

} // namespace iotpipe
