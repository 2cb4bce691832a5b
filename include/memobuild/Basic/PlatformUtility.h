//===- PlatformUtility.h ----------------------------------------*- C++ -*-===//
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
// This file declares thin wrappers for the POSIX calls memobuild makes, and
// the buffered pipe helpers used to talk to worker processes.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_BASIC_PLATFORMUTILITY_H
#define MEMOBUILD_BASIC_PLATFORMUTILITY_H

#include <cstdint>
#include <string>

#include <sys/stat.h>

namespace memobuild {
namespace basic {
namespace sys {

using StatStruct = struct ::stat;

int close(int fileHandle);
int lstat(const char *fileName, StatStruct *buf);
bool mkdir(const char *fileName);
int pipe(int ptHandles[2]);
int read(int fileHandle, void *destinationBuffer, unsigned int maxCharCount);
int rmdir(const char *path);
int stat(const char *fileName, StatStruct *buf);
int unlink(const char *fileName);
int write(int fileHandle, const void *sourceBuffer, unsigned int maxCharCount);
std::string strerror(int error);

/// Write the entire buffer to \arg fileHandle, retrying on interruption.
///
/// \returns True on success.
bool writeAll(int fileHandle, const void *sourceBuffer, size_t count);

/// Read from \arg fileHandle until end of file, retrying on interruption.
///
/// \returns True on success.
bool readAll(int fileHandle, std::string& result);

}
}
}

#endif
