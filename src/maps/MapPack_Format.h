#pragma once

// Identifiers of the map pack manifest (maps/pack.json) and the runner's
// JSON report, shared by the runner, the tools and the tests.

namespace rocketrun::maps::packfmt {

inline constexpr const char* kPackFormat   = "RocketRun.MapPack";
// Version history (map pack manifest)
//  v1: list of level files with optional titles
inline constexpr int         kPackVersion  = 1;

inline constexpr const char* kReportFormat = "RocketRun.RunReport";
inline constexpr int         kReportVersion = 1;

} // namespace rocketrun::maps::packfmt
