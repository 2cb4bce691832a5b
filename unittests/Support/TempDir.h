//===- unittests/Support/TempDir.h ------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_UNITTESTS_TEMPDIR_H
#define MEMOBUILD_UNITTESTS_TEMPDIR_H

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <string>

namespace memobuild {

/// Creates a temporary directory in its constructor and removes it in its
/// destructor. Makes it available via str() and c_str().
class TmpDir {
private:
  TmpDir(const TmpDir&) = delete;
  TmpDir& operator=(const TmpDir&) = delete;

  llvm::SmallString<256> tempDir;

public:
  TmpDir(llvm::StringRef namePrefix = "");
  ~TmpDir();

  const char *c_str();
  std::string str() const;

  /// Get the path of \arg name inside the directory.
  std::string path(const llvm::Twine& name) const;
};

/// Write \arg contents to the file at \arg path, creating its directory.
void writeTestFile(llvm::StringRef path, llvm::StringRef contents);

/// Read the contents of the file at \arg path, or "<missing>".
std::string readTestFile(llvm::StringRef path);

}

#endif
