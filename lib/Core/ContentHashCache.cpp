//===-- ContentHashCache.cpp ----------------------------------------------===//
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

#include "memobuild/Core/ContentHashCache.h"

#include "memobuild/Basic/FileSystem.h"

#include "llvm/Support/MemoryBuffer.h"

using namespace memobuild;
using namespace memobuild::core;

bool ContentHashCache::getContentHash(basic::FileSystem& fs,
                                      const std::string& path,
                                      std::string& digest_out) {
  std::string realPath = fs.getRealPath(path);
  basic::FileInfo info = fs.getFileInfo(realPath);
  if (info.isMissing() || info.isDirectory())
    return false;

  {
    std::lock_guard<std::mutex> lock(entriesMutex);
    auto it = entries.find(realPath);
    if (it != entries.end() && it->second.modTime == info.modTime) {
      digest_out = it->second.digest;
      return true;
    }
  }

  // Hash outside of the lock, other workers may be hashing other files.
  auto contents = fs.getFileContents(realPath);
  if (!contents)
    return false;
  std::string digest =
    basic::FileChecksum::getChecksumForData(contents->getBuffer()).asHex();

  {
    std::lock_guard<std::mutex> lock(entriesMutex);
    entries[realPath] = Entry{ info.modTime, digest };
    ++numComputed;
  }

  digest_out = digest;
  return true;
}

void ContentHashCache::clear() {
  std::lock_guard<std::mutex> lock(entriesMutex);
  entries.clear();
}

size_t ContentHashCache::size() {
  std::lock_guard<std::mutex> lock(entriesMutex);
  return entries.size();
}

uint64_t ContentHashCache::getNumComputed() {
  std::lock_guard<std::mutex> lock(entriesMutex);
  return numComputed;
}
