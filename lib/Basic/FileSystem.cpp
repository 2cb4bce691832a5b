//===-- FileSystem.cpp ----------------------------------------------------===//
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

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Basic/PlatformUtility.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>

using namespace memobuild;
using namespace memobuild::basic;

FileSystem::~FileSystem() {}

bool FileSystem::createDirectories(const std::string& path) {
  // Attempt to create the final directory first, to optimize for the common
  // case where we don't need to recurse.
  if (createDirectory(path))
    return true;

  // If that failed, attempt to create the parent.
  StringRef parent = llvm::sys::path::parent_path(path);
  if (parent.empty())
    return false;
  return createDirectories(parent.str()) && createDirectory(path);
}

std::string FileSystem::getRealPath(const std::string& path) {
  return path;
}

namespace {

class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() {}

  virtual bool
  createDirectory(const std::string& path) override {
    if (!memobuild::basic::sys::mkdir(path.c_str())) {
      if (errno != EEXIST) {
        return false;
      }
      // Something already exists at the path, make sure it is a directory.
      return FileInfo::getInfoForPath(path).isDirectory();
    }
    return true;
  }

  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    auto result = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                              /*RequiresNullTerminator=*/false);
    if (result.getError()) {
      return nullptr;
    }
    return std::unique_ptr<llvm::MemoryBuffer>(result->release());
  }

  virtual bool writeFileContents(const std::string& path, StringRef contents,
                                 std::string* error_out) override {
    int fd;
    llvm::SmallString<256> tempPath;
    if (auto ec = llvm::sys::fs::createUniqueFile(
            path + ".tmp-%%%%%%%%", fd, tempPath)) {
      *error_out = "unable to create '" + path + "': " + ec.message();
      return false;
    }

    bool wrote = sys::writeAll(fd, contents.data(), contents.size());
    int writeErrno = errno;
    sys::close(fd);
    if (!wrote) {
      *error_out = "unable to write '" + path + "': " +
        sys::strerror(writeErrno);
      sys::unlink(tempPath.c_str());
      return false;
    }

    if (auto ec = llvm::sys::fs::rename(tempPath, path)) {
      *error_out = "unable to write '" + path + "': " + ec.message();
      sys::unlink(tempPath.c_str());
      return false;
    }
    return true;
  }

  virtual bool remove(const std::string& path) override {
    // Assume `path` is a regular file.
    if (memobuild::basic::sys::unlink(path.c_str()) == 0) {
      return true;
    }

    // Error can't be that `path` is actually a directory (on Linux `EISDIR`
    // will be returned since 2.1.132).
    if (errno != EPERM && errno != EISDIR) {
      return false;
    }

    // Check if `path` is a directory.
    memobuild::basic::sys::StatStruct statbuf;
    if (memobuild::basic::sys::lstat(path.c_str(), &statbuf) != 0) {
      return false;
    }

    if (S_ISDIR(statbuf.st_mode)) {
      if (memobuild::basic::sys::rmdir(path.c_str()) == 0) {
        return true;
      }
      return !llvm::sys::fs::remove_directories(path);
    }

    return false;
  }

  virtual bool setFileTimestamp(const std::string& path,
                                const FileTimestamp& timestamp,
                                std::string* error_out) override {
    struct timespec times[2];
    times[0].tv_sec = timestamp.seconds;
    times[0].tv_nsec = timestamp.nanoseconds;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
      *error_out = "unable to set timestamp of '" + path + "': " +
        sys::strerror(errno);
      return false;
    }
    return true;
  }

  virtual std::string getRealPath(const std::string& path) override {
    llvm::SmallString<256> result;
    if (llvm::sys::fs::real_path(path, result))
      return path;
    return result.str().str();
  }

  virtual FileInfo getFileInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path);
  }

  virtual FileInfo getLinkInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path, /*isLink:*/ true);
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}
