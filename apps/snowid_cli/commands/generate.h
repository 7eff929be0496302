#pragma once

// cmd_generate: print freshly generated ids for --node (or $SNOWID_NODE_ID)
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
