//===- Support/PlatformUtility.cpp - Platform Specific Utilities ----------===//
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

#include "memobuild/Basic/PlatformUtility.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

using namespace memobuild;
using namespace memobuild::basic;

int sys::close(int fileHandle) {
  return ::close(fileHandle);
}

int sys::lstat(const char *fileName, sys::StatStruct *buf) {
  return ::lstat(fileName, buf);
}

bool sys::mkdir(const char* fileName) {
  return ::mkdir(fileName, S_IRWXU | S_IRWXG |  S_IRWXO) == 0;
}

int sys::pipe(int ptHandles[2]) {
  // Descriptors are always created close-on-exec; worker processes which need
  // one of them keep it across fork, which does not close it.
  return ::pipe2(ptHandles, O_CLOEXEC);
}

int sys::read(int fileHandle, void *destinationBuffer,
              unsigned int maxCharCount) {
  return ::read(fileHandle, destinationBuffer, maxCharCount);
}

int sys::rmdir(const char *path) {
  return ::rmdir(path);
}

int sys::stat(const char *fileName, StatStruct *buf) {
  return ::stat(fileName, buf);
}

int sys::unlink(const char *fileName) {
  return ::unlink(fileName);
}

int sys::write(int fileHandle, const void *sourceBuffer,
               unsigned int maxCharCount) {
  return ::write(fileHandle, sourceBuffer, maxCharCount);
}

std::string sys::strerror(int error) {
  char buf[256];
  return std::string(::strerror_r(error, buf, sizeof(buf)));
}

bool sys::writeAll(int fileHandle, const void *sourceBuffer, size_t count) {
  const char* data = static_cast<const char*>(sourceBuffer);
  while (count != 0) {
    unsigned chunk = count > 65536 ? 65536 : unsigned(count);
    int result = sys::write(fileHandle, data, chunk);
    if (result < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    data += result;
    count -= result;
  }
  return true;
}

bool sys::readAll(int fileHandle, std::string& result) {
  char buf[4096];
  while (true) {
    int numBytes = sys::read(fileHandle, buf, sizeof(buf));
    if (numBytes < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (numBytes == 0)
      return true;
    result.append(buf, numBytes);
  }
}
