#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "croncpp.h"

namespace llmtrigger::cron {

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ScheduleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Standard 5-field cron expression (minute hour day-of-month month day-of-week),
// evaluated against the host's local time at minute granularity.
//
// When both day-of-month and day-of-week are restricted a day matches if
// either field matches, as in vixie cron.
class CronExpression {
public:
    using Clock = std::chrono::system_clock;

    // Throws ParseError on a wrong field count or a malformed field.
    static CronExpression Parse(const std::string& expr);

    // Earliest matching instant strictly after `after`. Throws ScheduleError
    // when the expression has no future occurrence.
    Clock::time_point Next(Clock::time_point after) const;

    const std::string& Expression() const { return expr_; }

private:
    CronExpression(std::string expr, std::vector<::cron::cronexpr> variants);

    std::string expr_;
    std::vector<::cron::cronexpr> variants_;
};

}  // namespace llmtrigger::cron
