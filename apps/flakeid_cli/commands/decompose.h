#pragma once

// cmd_decompose: print the fields of an identifier given as the first positional argument
int cmd_decompose(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
