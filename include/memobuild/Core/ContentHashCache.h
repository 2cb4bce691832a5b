//===- ContentHashCache.h ---------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_CORE_CONTENTHASHCACHE_H
#define MEMOBUILD_CORE_CONTENTHASHCACHE_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/FileInfo.h"
#include "memobuild/Basic/LLVM.h"

#include "llvm/ADT/StringMap.h"

#include <mutex>
#include <string>

namespace memobuild {
namespace basic {
class FileSystem;
}

namespace core {

/// A cache of file content digests, keyed by real path.
///
/// An entry is only used while the modification time recorded with it matches
/// the file's current one; a mismatching entry is recomputed and replaced. The
/// cache is safe to use from multiple threads.
class ContentHashCache {
  ContentHashCache(const ContentHashCache&) MEMOBUILD_DELETED_FUNCTION;
  void operator=(const ContentHashCache&) MEMOBUILD_DELETED_FUNCTION;

  struct Entry {
    basic::FileTimestamp modTime;
    std::string digest;
  };

  std::mutex entriesMutex;
  llvm::StringMap<Entry> entries;

  /// The number of digests computed (as opposed to served from the cache).
  uint64_t numComputed = 0;

public:
  ContentHashCache() {}

  /// Get the content digest (as lowercase hex) of the file at \arg path.
  ///
  /// \returns True on success, false if the file is missing or unreadable.
  bool getContentHash(basic::FileSystem& fs, const std::string& path,
                      std::string& digest_out);

  /// Drop every entry.
  void clear();

  /// The number of entries in the cache.
  size_t size();

  /// The number of digests computed from file contents so far.
  uint64_t getNumComputed();
};

}
}

#endif
