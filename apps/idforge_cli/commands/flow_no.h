#pragma once

// cmd_flow_no: print --count flow numbers for --prefix as JSON
int cmd_flow_no(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
