#pragma once

#include <string>

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for a run that is still going).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Format a duration given in whole seconds with the same rules as format_duration.
std::string format_seconds(long seconds);
