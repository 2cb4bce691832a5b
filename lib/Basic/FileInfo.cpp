//===-- FileInfo.cpp ------------------------------------------------------===//
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

#include "memobuild/Basic/FileInfo.h"

#include "memobuild/Basic/Hashing.h"
#include "memobuild/Basic/PlatformUtility.h"

#include "llvm/Support/MD5.h"

#include <cassert>
#include <cstdio>
#include <cstring>
#include <ctime>

using namespace memobuild;
using namespace memobuild::basic;

FileTimestamp FileTimestamp::now() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return FileTimestamp{ uint64_t(ts.tv_sec), uint64_t(ts.tv_nsec) };
}

std::string FileChecksum::asHex() const {
  return toHex(ArrayRef<uint8_t>(bytes, sizeof(bytes)));
}

FileChecksum FileChecksum::getChecksumForData(StringRef data) {
  llvm::MD5 hasher;
  hasher.update(data);
  llvm::MD5::MD5Result output;
  hasher.final(output);

  FileChecksum result;
  std::copy(output.Bytes.begin(), output.Bytes.end(), result.bytes);
  return result;
}

bool FileChecksum::getChecksumForPath(const std::string& path,
                                      FileChecksum& checksum_out) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (file == nullptr)
    return false;

  llvm::MD5 hasher;
  uint8_t buffer[4*4096];
  size_t bytesRead = 0;
  while ((bytesRead = fread(buffer, 1, sizeof(buffer), file)) > 0) {
    hasher.update(ArrayRef<uint8_t>(buffer, bytesRead));
  }
  bool hadError = ferror(file) != 0;
  fclose(file);
  if (hadError)
    return false;

  llvm::MD5::MD5Result output;
  hasher.final(output);
  std::copy(output.Bytes.begin(), output.Bytes.end(), checksum_out.bytes);
  return true;
}

bool FileInfo::isDirectory() const {
  return S_ISDIR(mode);
}

bool FileInfo::isRegularFile() const {
  return S_ISREG(mode);
}

/// Stat \arg path, following a final symbolic link unless \arg asLink.
FileInfo FileInfo::getInfoForPath(const std::string& path, bool asLink) {
  FileInfo result;

  sys::StatStruct buf;
  auto statResult =
    asLink ? sys::lstat(path.c_str(), &buf) : sys::stat(path.c_str(), &buf);
  if (statResult != 0) {
    memset(&result, 0, sizeof(result));
    assert(result.isMissing());
    return result;
  }

  result.device = buf.st_dev;
  result.inode = buf.st_ino;
  result.mode = buf.st_mode;
  result.size = buf.st_size;
#if defined(__APPLE__)
  auto seconds = buf.st_mtimespec.tv_sec;
  auto nanoseconds = buf.st_mtimespec.tv_nsec;
#else
  auto seconds = buf.st_mtim.tv_sec;
  auto nanoseconds = buf.st_mtim.tv_nsec;
#endif
  result.modTime.seconds = seconds;
  result.modTime.nanoseconds = nanoseconds;

  // Enforce we never accidentally create our sentinel missing file value.
  if (result.isMissing()) {
    result.mode = S_IFREG;
    assert(!result.isMissing());
  }

  return result;
}
