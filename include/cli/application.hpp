#pragma once

namespace arcstream::cli {

// Parses argv, runs one command and returns the process exit code.
int run(int argc, char** argv);

} // namespace arcstream::cli
