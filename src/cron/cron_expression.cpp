#include "cron/cron_expression.hpp"

#include <optional>
#include <utility>

#include "utils/common.hpp"

namespace llmtrigger::cron {
namespace {

constexpr std::size_t kFieldCount = 5;
constexpr std::size_t kDayOfMonthField = 2;
constexpr std::size_t kDayOfWeekField = 4;

bool IsUnrestricted(const std::string& field) {
    return !field.empty() && (field.front() == '*' || field.front() == '?');
}

// croncpp only knows 0-6 for the day of week; 7 is Sunday as well.
// "7" becomes "0" and "a-7" becomes "a-6,0". Stepped items are left alone.
std::string NormalizeDayOfWeek(const std::string& field) {
    std::vector<std::string> items;
    for (const auto& item : utils::Split(field, ",")) {
        if (item.find('/') != std::string::npos) {
            items.push_back(item);
            continue;
        }
        if (item == "7") {
            items.push_back("0");
            continue;
        }
        const auto dash = item.find('-');
        if (dash != std::string::npos && item.substr(dash + 1) == "7") {
            const auto start = item.substr(0, dash);
            if (start == "7") {
                items.push_back("0");
            } else if (start == "6") {
                items.push_back("6,0");
            } else {
                items.push_back(start + "-6,0");
            }
            continue;
        }
        items.push_back(item);
    }
    return utils::Join(items, ",");
}

// croncpp expects a leading seconds field.
::cron::cronexpr MakeCron(const std::vector<std::string>& fields) {
    return ::cron::make_cron("0 " + utils::Join(fields, " "));
}

}  // namespace

CronExpression::CronExpression(std::string expr, std::vector<::cron::cronexpr> variants)
    : expr_(std::move(expr))
    , variants_(std::move(variants)) {}

CronExpression CronExpression::Parse(const std::string& expr) {
    auto fields = utils::SplitWhitespace(expr);
    if (fields.size() != kFieldCount) {
        throw ParseError("cron expression '" + expr + "' must have 5 fields, got " +
                         std::to_string(fields.size()));
    }
    fields[kDayOfWeekField] = NormalizeDayOfWeek(fields[kDayOfWeekField]);

    std::vector<::cron::cronexpr> variants;
    try {
        if (IsUnrestricted(fields[kDayOfMonthField]) || IsUnrestricted(fields[kDayOfWeekField])) {
            variants.push_back(MakeCron(fields));
        } else {
            auto by_day_of_month = fields;
            by_day_of_month[kDayOfWeekField] = "*";
            auto by_day_of_week = fields;
            by_day_of_week[kDayOfMonthField] = "*";
            variants.push_back(MakeCron(by_day_of_month));
            variants.push_back(MakeCron(by_day_of_week));
        }
    } catch (const ::cron::bad_cronexpr& ex) {
        throw ParseError("invalid cron expression '" + expr + "': " + ex.what());
    }
    return CronExpression(expr, std::move(variants));
}

CronExpression::Clock::time_point CronExpression::Next(Clock::time_point after) const {
    std::optional<Clock::time_point> best;
    for (const auto& variant : variants_) {
        Clock::time_point candidate;
        try {
            candidate = ::cron::cron_next(variant, after);
        } catch (const ::cron::bad_cronexpr&) {
            continue;
        }
        // croncpp signals "no match within its search horizon" with an
        // invalid time at or before the reference.
        if (candidate <= after) {
            continue;
        }
        if (!best.has_value() || candidate < best.value()) {
            best = candidate;
        }
    }
    if (!best.has_value()) {
        throw ScheduleError("cron expression '" + expr_ + "' has no future occurrence");
    }
    return best.value();
}

}  // namespace llmtrigger::cron
