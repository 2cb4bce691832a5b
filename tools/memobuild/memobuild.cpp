//===-- memobuild.cpp - memobuild Frontend Utillity -----------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "memobuild/Basic/Version.h"

#include "memobuild/Commands/Commands.h"

#include "llvm/Support/Path.h"

#include <cstdio>
#include <cstdlib>

using namespace memobuild;
using namespace memobuild::commands;

static void usage(int exitCode) {
  fprintf(stderr, "Usage: %s [--version] [--help] <command> [<args>]\n",
          getProgramName());
  fprintf(stderr, "\n");
  fprintf(stderr, "Available commands:\n");
  fprintf(stderr, "  make  -- Bring rules up-to-date\n");
  fprintf(stderr, "  clean -- Remove the outputs of rules\n");
  fprintf(stderr, "  touch -- Mark the outputs of rules as up-to-date\n");
  fprintf(stderr, "\n");
  exit(exitCode);
}

int main(int argc, const char **argv) {
  setProgramName(llvm::sys::path::filename(argv[0]));

  // Expect the first argument to be the name of a subtool to delegate to.
  if (argc == 1)
    usage(1);
  if (std::string(argv[1]) == "--help")
    usage(0);

  if (std::string(argv[1]) == "--version") {
    // Print the version and exit.
    printf("%s\n", getMemobuildFullVersion().c_str());
    return 0;
  }

  // Otherwise, expect a command name.
  std::string command(argv[1]);
  std::vector<std::string> args;
  for (int i = 2; i != argc; ++i) {
    args.push_back(argv[i]);
  }

  if (command == "make") {
    return executeMakeCommand(args);
  } else if (command == "clean") {
    return executeCleanCommand(args);
  } else if (command == "touch") {
    return executeTouchCommand(args);
  } else {
    fprintf(stderr, "error: %s: unknown command '%s'\n", getProgramName(),
            command.c_str());
    return 1;
  }
}
