#pragma once

// cmd_snowflake: resolve the worker identity and print --count snowflake ids as JSON
// cmd_worker_identity: print the resolved worker identity and the machine fingerprint
int cmd_snowflake(int argc, char* argv[]);        // NOLINT(modernize-avoid-c-arrays)
int cmd_worker_identity(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
