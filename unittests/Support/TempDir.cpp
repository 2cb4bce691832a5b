//===- unittests/Support/TempDir.cpp --------------------------------------===//
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

#include "TempDir.h"

#include "memobuild/Basic/FileSystem.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <cassert>

memobuild::TmpDir::TmpDir(llvm::StringRef namePrefix) {
  llvm::SmallString<256> tempDirPrefix;
  llvm::sys::path::system_temp_directory(true, tempDirPrefix);
  llvm::sys::path::append(tempDirPrefix, namePrefix);

  std::error_code ec = llvm::sys::fs::createUniqueDirectory(
      tempDirPrefix.str(), tempDir);
  assert(!ec);
  (void)ec;

  // Resolve symbolic links (e.g. a /tmp link), so paths compare equal to the
  // normalized paths of rules.
  llvm::SmallString<256> realPath;
  if (!llvm::sys::fs::real_path(tempDir, realPath))
    tempDir = realPath;
}

memobuild::TmpDir::~TmpDir() {
  auto fs = basic::createLocalFileSystem();
  bool result = fs->remove(tempDir.c_str());
  assert(result);
  (void)result;
}

const char *memobuild::TmpDir::c_str() { return tempDir.c_str(); }
std::string memobuild::TmpDir::str() const { return tempDir.str().str(); }

std::string memobuild::TmpDir::path(const llvm::Twine& name) const {
  llvm::SmallString<256> result(tempDir);
  llvm::sys::path::append(result, name);
  return result.str().str();
}

void memobuild::writeTestFile(llvm::StringRef path, llvm::StringRef contents) {
  auto fs = basic::createLocalFileSystem();
  std::string error;
  (void)fs->createDirectories(llvm::sys::path::parent_path(path).str());
  bool result = fs->writeFileContents(path.str(), contents, &error);
  assert(result && "unable to write test file");
  (void)result;
}

std::string memobuild::readTestFile(llvm::StringRef path) {
  auto buffer = llvm::MemoryBuffer::getFile(path);
  if (!buffer)
    return "<missing>";
  return (*buffer)->getBuffer().str();
}
