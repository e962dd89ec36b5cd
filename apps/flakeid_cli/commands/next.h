#pragma once

// cmd_next: generate --count fresh ids and print one per line
int cmd_next(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
