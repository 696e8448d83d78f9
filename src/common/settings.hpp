#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace daybreak {

constexpr int kDefaultRetentionDays = 30;
constexpr int kMinRetentionDays = 7;
constexpr int kMaxRetentionDays = 365;
constexpr const char *kDefaultResetTime = "00:00";

// Loads the engine's view of the "app_settings" record. Values that would be
// rejected by the mutators are replaced with defaults instead of failing.
EngineSettings settingsFromJson(const nlohmann::json &j);

// Writes the engine-owned keys into an existing settings record, keeping any
// keys that belong to other collaborators.
void mergeSettingsInto(nlohmann::json &record, const EngineSettings &settings);

int clampRetentionDays(int days);

bool validateResetTime(const std::string &value, std::string *error = nullptr);
bool validateRetentionDays(int days, std::string *error = nullptr);

} // namespace daybreak
