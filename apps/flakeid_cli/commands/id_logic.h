#pragma once

#include "flakeid/snowflake/snowflake_generator.h"

#include <ostream>
#include <string>

namespace flakeid::cli {

// Subcommand bodies, separated from flag parsing so they can be driven from tests.
// Each writes results to `out`, errors to `err`, and returns the process exit code
// (0 success, 1 operation failed).

// execute_next: print `count` fresh ids, one per line. Stops with exit code 1 once the
// clock has run past the generator's 41-bit timestamp range.
int execute_next(snowflake::SnowflakeGenerator& generator, int count, std::ostream& out,
                 std::ostream& err);

// execute_boundary: print the first (or last) id at a unix-ms or ISO 8601 timestamp.
int execute_boundary(const snowflake::SnowflakeGenerator& generator, const std::string& timestamp,
                     bool last, std::ostream& out, std::ostream& err);

// execute_decode: print the decoded fields of `id` as a JSON object.
int execute_decode(const snowflake::SnowflakeGenerator& generator, const std::string& id,
                   std::ostream& out, std::ostream& err);

}  // namespace flakeid::cli
