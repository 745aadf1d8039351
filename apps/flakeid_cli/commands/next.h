#pragma once

// cmd_next: issue identifiers from a generator configured by --config and flags
int cmd_next(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
