#pragma once

// cmd_decode: print the timestamp, machine id and sequence encoded in <id> as JSON
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
