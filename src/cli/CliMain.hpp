#pragma once

// Entrypoint of the estimap_cli tool, kept separate from main() so the
// command dispatch can be linked into tests.
//
// Implementation: src/cli/CliMain.cpp

namespace estimap {

int EstimapCliMain(int argc, char** argv);

} // namespace estimap
