#pragma once

#include "Route.hpp"
#include <chrono>
#include <string>

namespace routesim {

class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;
    virtual std::string iso8601() const;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }
};

// Clock pinned to a settable instant, for deterministic "now" queries.
class FixedClock : public IClock {
public:
    explicit FixedClock(Timestamp instant = Timestamp{}) : instant_(instant) {}

    Timestamp now() const override { return instant_; }

    void setCurrentTime(Timestamp instant) { instant_ = instant; }
    void advance(std::chrono::milliseconds duration) { instant_ += duration; }

private:
    Timestamp instant_;
};

} // namespace routesim
