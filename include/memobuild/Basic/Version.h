//===- Version.h ------------------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_BASIC_VERSION_H
#define MEMOBUILD_BASIC_VERSION_H

#include "memobuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace memobuild {

/// Get the version string of the tool, including vendor information if the
/// build was configured with any.
std::string getMemobuildFullVersion(StringRef productName = "memobuild");

}

#endif
