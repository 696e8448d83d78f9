#include "common/settings.hpp"

#include <algorithm>

#include "common/json_utils.hpp"
#include "common/time_utils.hpp"

namespace daybreak {

EngineSettings settingsFromJson(const nlohmann::json &j)
{
    EngineSettings settings;
    if (!j.is_object()) {
        return settings;
    }

    const std::string resetTime = stringField(j, "resetTime", kDefaultResetTime);
    settings.resetTime = isValidResetTime(resetTime) ? resetTime : kDefaultResetTime;

    const int days = intField(j, "dataRetentionDays", kDefaultRetentionDays);
    settings.dataRetentionDays = validateRetentionDays(days)
        ? days
        : kDefaultRetentionDays;

    settings.autoReset = boolField(j, "autoReset", true);
    return settings;
}

void mergeSettingsInto(nlohmann::json &record, const EngineSettings &settings)
{
    if (!record.is_object()) {
        record = nlohmann::json::object();
    }
    record["resetTime"] = settings.resetTime;
    record["dataRetentionDays"] = settings.dataRetentionDays;
    record["autoReset"] = settings.autoReset;
}

int clampRetentionDays(int days)
{
    return std::clamp(days, kMinRetentionDays, kMaxRetentionDays);
}

bool validateResetTime(const std::string &value, std::string *error)
{
    if (isValidResetTime(value)) {
        return true;
    }
    if (error) {
        *error = "Invalid time format. Use HH:MM format";
    }
    return false;
}

bool validateRetentionDays(int days, std::string *error)
{
    if (days >= kMinRetentionDays && days <= kMaxRetentionDays) {
        return true;
    }
    if (error) {
        *error = "Data retention must be between 7 and 365 days";
    }
    return false;
}

} // namespace daybreak
