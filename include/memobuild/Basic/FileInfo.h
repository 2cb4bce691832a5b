//===- FileInfo.h -----------------------------------------------*- C++ -*-===//
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
//
// This file contains the FileInfo wrapper used to decide whether rule outputs
// are out of date, and the content checksum used for value files.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_BASIC_FILEINFO_H
#define MEMOBUILD_BASIC_FILEINFO_H

#include "memobuild/Basic/BinaryCoding.h"
#include "memobuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <cstring>
#include <string>

namespace memobuild {
namespace basic {

/// File timestamp wrapper.
struct FileTimestamp {
  uint64_t seconds;
  uint64_t nanoseconds;

  /// Check if this is the epoch (zero) timestamp.
  ///
  /// The make engine stamps the outputs of failed rules with this value, so a
  /// file carrying it is never considered up-to-date.
  bool isEpoch() const {
    return seconds == 0 && nanoseconds == 0;
  }

  bool operator==(const FileTimestamp& rhs) const {
    return seconds == rhs.seconds && nanoseconds == rhs.nanoseconds;
  }
  bool operator!=(const FileTimestamp& rhs) const {
    return !(*this == rhs);
  }
  bool operator<(const FileTimestamp& rhs) const {
    return (seconds < rhs.seconds ||
            (seconds == rhs.seconds && nanoseconds < rhs.nanoseconds));
  }
  bool operator<=(const FileTimestamp& rhs) const {
    return (seconds < rhs.seconds ||
            (seconds == rhs.seconds && nanoseconds <= rhs.nanoseconds));
  }
  bool operator>(const FileTimestamp& rhs) const {
    return rhs < *this;
  }
  bool operator>=(const FileTimestamp& rhs) const {
    return rhs <= *this;
  }

  /// Get the current time.
  static FileTimestamp now();
};

/// An MD5 digest of a file's contents.
struct FileChecksum {
  uint8_t bytes[16] = {0};

  bool operator==(const FileChecksum& rhs) const {
    return (memcmp(bytes, rhs.bytes, sizeof(bytes)) == 0);
  }

  bool operator!=(const FileChecksum& rhs) const {
    return !(*this==rhs);
  }

  /// Get the lowercase hexadecimal form of the digest.
  std::string asHex() const;

  /// Compute the checksum of the given data.
  static FileChecksum getChecksumForData(StringRef data);

  /// Compute the checksum of the file at \arg path.
  ///
  /// \returns True on success, false if the file could not be read.
  static bool getChecksumForPath(const std::string& path,
                                 FileChecksum& checksum_out);
};

/// File information which is intended to be used as a proxy for when a file has
/// changed.
///
/// This structure is intentionally sized to have no packing holes.
struct FileInfo {
  /// The device number.
  uint64_t device;
  /// The inode number.
  uint64_t inode;
  /// The mode flags of the file.
  uint64_t mode;
  /// The size of the file.
  uint64_t size;
  /// The modification time of the file.
  FileTimestamp modTime;

  /// Check if this is a FileInfo representing a missing file.
  bool isMissing() const {
    // We use an all-zero FileInfo as a sentinel, under the assumption this can
    // never exist in normal circumstances.
    return (device == 0 && inode == 0 && mode == 0 && size == 0 &&
            modTime.seconds == 0 && modTime.nanoseconds == 0);
  }

  /// Check if the FileInfo corresponds to a directory.
  bool isDirectory() const;

  /// Check if the FileInfo corresponds to a regular file.
  bool isRegularFile() const;

  bool operator==(const FileInfo& rhs) const {
    return (device == rhs.device &&
            inode == rhs.inode &&
            size == rhs.size &&
            modTime == rhs.modTime);
  }

  bool operator!=(const FileInfo& rhs) const {
    return !(*this == rhs);
  }

  /// Get the information to represent the state of the given node in the file
  /// system.
  ///
  /// \param asLink If yes, checks the information for the file path without
  /// looking through symbolic links.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path does not exist (or any error was encountered).
  static FileInfo getInfoForPath(const std::string& path, bool asLink = false);
};

template<>
struct BinaryCodingTraits<FileTimestamp> {
  static inline void encode(const FileTimestamp& value, BinaryEncoder& coder) {
    coder.write(value.seconds);
    coder.write(value.nanoseconds);
  }
  static inline void decode(FileTimestamp& value, BinaryDecoder& coder) {
    coder.read(value.seconds);
    coder.read(value.nanoseconds);
  }
};

}
}

#endif
