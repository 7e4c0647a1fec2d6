#pragma once

// cmd_obfuscate: mask each positional integer with --key (default key when omitted)
// cmd_deobfuscate: reverse cmd_obfuscate for the same --key
int cmd_obfuscate(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
int cmd_deobfuscate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
