//! # lit-test-helper Entry Point
//!
//! The binary is driven by a compiler's lit regression suite: each test
//! invokes it once with one action flag and compares what it writes against
//! golden output.
//!
//! ```bash
//! lit-test-helper -deserialize -pre-edit-tree tree.json -out out.swift
//! lit-test-helper -classify-syntax -source-file input.swift
//! ```
//!
//! All work happens in `cli/driver.cpp`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return lth_main(argc, argv);
}
