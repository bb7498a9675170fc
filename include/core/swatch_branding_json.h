#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "core/swatch_branding_types.h"

/**
 * SwatchBrandingJson - JSON forms of the raw record and the profile.
 *
 * Keys are camelCase, matching what the in-page collector emits. Empty
 * colours and strings are written as null. Reading is tolerant: missing
 * keys and values of the wrong type fall back to the field default, only
 * a document that is not a JSON object is rejected.
 */
class SwatchBrandingJson {
public:
  static nlohmann::json ProfileToJson(const BrandingProfile& profile);
  static std::string SerializeProfile(const BrandingProfile& profile, int indent = -1);

  static nlohmann::json RawRecordToJson(const RawBrandingRecord& raw);
  static bool RawRecordFromJson(const nlohmann::json& root, RawBrandingRecord& out, std::string& error);
  static bool ParseRawRecord(const std::string& text, RawBrandingRecord& out, std::string& error);

  static nlohmann::json MergeReportToJson(const MergeReport& report);

private:
  static nlohmann::json DebugToJson(const BrandingDebug& debug);
  static nlohmann::json SnapshotToJson(const StyleSnapshot& snapshot);
  static StyleSnapshot SnapshotFromJson(const nlohmann::json& node);
  static nlohmann::json LogoCandidateToJson(const LogoCandidate& logo);
  static LogoCandidate LogoCandidateFromJson(const nlohmann::json& node);
};
