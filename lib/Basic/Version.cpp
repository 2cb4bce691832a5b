//===-- Version.cpp -------------------------------------------------------===//
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

#include "llvm/ADT/Twine.h"

#include <string>

#ifndef MEMOBUILD_VERSION_MAJOR
#define MEMOBUILD_VERSION_MAJOR 0
#endif
#ifndef MEMOBUILD_VERSION_MINOR
#define MEMOBUILD_VERSION_MINOR 0
#endif

namespace memobuild {

std::string getMemobuildFullVersion(StringRef productName) {
  std::string result = (productName + " version " +
                        Twine(MEMOBUILD_VERSION_MAJOR) + "." +
                        Twine(MEMOBUILD_VERSION_MINOR)).str();

  // Include the additional build version information, if present.
#ifdef MEMOBUILD_VENDOR_STRING
  result = std::string(MEMOBUILD_VENDOR_STRING) + " " + result;
#endif
#ifdef MEMOBUILD_VERSION_STRING
  result = result + " (" + std::string(MEMOBUILD_VERSION_STRING) + ")";
#endif

  return result;
}

}
