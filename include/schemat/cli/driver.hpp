#ifndef SCHEMAT_CLI_DRIVER_HPP
#define SCHEMAT_CLI_DRIVER_HPP

// Runs the command line: configures logging, parses options and dispatches.
// Returns the process exit status.
int schemat_main(int argc, char* argv[]);

#endif // SCHEMAT_CLI_DRIVER_HPP
