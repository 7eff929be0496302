#pragma once

// cmd_encode:  print the 13-character text form of a decimal id
// cmd_decode:  print the decimal id for a 13-character text form
// cmd_inspect: print the fields and generation time of an id in either form
int cmd_encode(int argc, char* argv[]);   // NOLINT(modernize-avoid-c-arrays)
int cmd_decode(int argc, char* argv[]);   // NOLINT(modernize-avoid-c-arrays)
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
