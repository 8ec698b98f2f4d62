//! # schemat Entry Point
//!
//! All work happens in the CLI driver (`cli/driver.hpp`).

#include "schemat/cli/driver.hpp"

int main(int argc, char* argv[]) {
    return schemat_main(argc, argv);
}
