#pragma once

// cmd_first_at: print the smallest id at <timestamp>
// cmd_last_at: print the largest id at <timestamp>
// <timestamp> is unix milliseconds or ISO 8601 UTC.
int cmd_first_at(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_last_at(int argc, char* argv[]);   // NOLINT(modernize-avoid-c-arrays)
