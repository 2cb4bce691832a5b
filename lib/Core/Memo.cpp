//===-- Memo.cpp ----------------------------------------------------------===//
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

#include "memobuild/Core/Memo.h"

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Basic/Hashing.h"
#include "memobuild/Core/ContentHashCache.h"

#include "llvm/ADT/SmallPtrSet.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <cctype>
#include <cmath>

using namespace memobuild;
using namespace memobuild::core;

namespace json = llvm::json;

char MemoAuthenticationError::ID = 0;
char MemoTypeMismatchError::ID = 0;

void MemoAuthenticationError::log(raw_ostream& os) const {
  os << "memo record '" << path << "' failed authentication (it was modified, "
     << "or written with a different key)";
}

void MemoTypeMismatchError::log(raw_ostream& os) const {
  os << "memo record '" << path << "' has type '" << foundType
     << "', expected '" << expectedType << "'";
}

Memo::~Memo() {}

StringRef Memo::getTypeName(MemoKind kind) {
  switch (kind) {
  case MemoKind::StringHash:
    return "str_hash_memo";
  case MemoKind::Authenticated:
    return "authenticated_memo";
  }
  llvm_unreachable("unexpected memo kind");
}

// MARK: Memoization View

namespace {

/// Canonical strings longer than this are replaced by their digest.
const size_t MaxRawRepresentationLength = 1000;

void writeQuoted(raw_ostream& os, StringRef string) {
  os << '\'';
  for (unsigned char c: string) {
    if (c == '\'' || c == '\\') {
      os << '\\' << c;
    } else if (std::isprint(c)) {
      os << c;
    } else {
      os << "\\x" << llvm::format_hex_no_prefix(c, 2);
    }
  }
  os << '\'';
}

void writeCanonical(raw_ostream& os, const Value& value) {
  switch (value.getKind()) {
  case Value::Kind::None:
    os << "None";
    return;
  case Value::Kind::Bool:
    os << (value.getBool() ? "True" : "False");
    return;
  case Value::Kind::Int:
    os << value.getInt();
    return;
  case Value::Kind::Float: {
    std::string text;
    llvm::raw_string_ostream(text) << llvm::format("%.17g", value.getFloat());
    // Keep floats distinguishable from integers.
    if (text.find_first_of(".eni") == std::string::npos)
      text += ".0";
    os << "float(" << text << ")";
    return;
  }
  case Value::Kind::String:
    writeQuoted(os, value.getString());
    return;
  case Value::Kind::Bytes:
    os << "bytes('" << basic::toHex(value.getString()) << "')";
    return;
  case Value::Kind::Path:
    os << "Path(";
    writeQuoted(os, value.getString());
    os << ")";
    return;
  case Value::Kind::List:
  case Value::Kind::Tuple:
  case Value::Kind::Set: {
    if (value.isSet() && value.getElements().empty()) {
      os << "set()";
      return;
    }
    os << (value.isList() ? "[" : value.isTuple() ? "(" : "{");
    for (const auto& element: value.getElements()) {
      writeCanonical(os, element);
      os << ",";
    }
    os << (value.isList() ? "]" : value.isTuple() ? ")" : "}");
    return;
  }
  case Value::Kind::Dict:
    os << "{";
    for (const auto& entry: value.getEntries()) {
      writeCanonical(os, entry.first);
      os << ":";
      writeCanonical(os, entry.second);
      os << ",";
    }
    os << "}";
    return;
  case Value::Kind::File:
  case Value::Kind::Atom:
    // The memoization view never contains files or atoms.
    os << "<" << Value::getKindName(value.getKind()) << ">";
    return;
  }
}

/// Check if an (acyclic) value holds a file or an atom.
bool hasFileOrAtom(const Value& value) {
  if (value.isFile() || value.isAtom())
    return true;
  if (value.isDict()) {
    for (const auto& entry: value.getEntries()) {
      if (hasFileOrAtom(entry.first) || hasFileOrAtom(entry.second))
        return true;
    }
  } else if (value.isSequence()) {
    for (const auto& element: value.getElements()) {
      if (hasFileOrAtom(element))
        return true;
    }
  }
  return false;
}

/// Computes the memoization view of an argument tree.
class MemoValueBuilder {
  std::vector<LazyMemoFile>& lazyFiles;

  /// The containers currently being visited.
  llvm::SmallPtrSet<const void*, 16> active;

public:
  MemoValueBuilder(std::vector<LazyMemoFile>& lazyFiles)
      : lazyFiles(lazyFiles) {}

  llvm::Expected<Value> visit(const Value& value, const std::string& key) {
    switch (value.getKind()) {
    case Value::Kind::File: {
      auto file = value.getFile();
      if (file.isValueFile())
        lazyFiles.push_back(LazyMemoFile{ key, file.path });
      return Value::makeNone();
    }
    case Value::Kind::Atom:
    case Value::Kind::List:
    case Value::Kind::Tuple:
    case Value::Kind::Set:
    case Value::Kind::Dict:
      return visitContainer(value, key);
    default:
      return value;
    }
  }

private:
  llvm::Expected<Value> visitContainer(const Value& value,
                                       const std::string& key) {
    const void* identity = value.getStorageIdentity();
    if (!active.insert(identity).second) {
      return llvm::createStringError(
          llvm::inconvertibleErrorCode(),
          "memoized arguments contain a reference cycle at '%s'",
          key.c_str());
    }
    auto result = visitContents(value, key);
    active.erase(identity);
    return result;
  }

  llvm::Expected<Value> visitContents(const Value& value,
                                      const std::string& key) {
    if (value.isAtom())
      return visit(value.getAtomMemo(), key);

    if (value.isDict()) {
      Value::EntryList entries;
      for (const auto& entry: value.getEntries()) {
        auto entryKey = visit(entry.first, key + "[?]");
        if (!entryKey)
          return entryKey.takeError();
        // Keys are memoized as they are, so they may not hold files or atoms.
        if (hasFileOrAtom(entry.first)) {
          return llvm::createStringError(
              llvm::inconvertibleErrorCode(),
              "memoized arguments have a file or an atom in a dictionary key "
              "at '%s'", key.c_str());
        }
        auto entryValue = visit(entry.second,
                                key + "[" + getCanonicalString(*entryKey) +
                                "]");
        if (!entryValue)
          return entryValue.takeError();
        entries.emplace_back(std::move(*entryKey), std::move(*entryValue));
      }
      return Value::makeDict(std::move(entries));
    }

    Value::ElementList elements;
    const auto& source = value.getElements();
    for (size_t i = 0, e = source.size(); i != e; ++i) {
      auto element = visit(source[i], key + "[" + std::to_string(i) + "]");
      if (!element)
        return element.takeError();
      elements.push_back(std::move(*element));
    }
    if (value.isList())
      return Value::makeList(std::move(elements));
    if (value.isTuple())
      return Value::makeTuple(std::move(elements));
    return Value::makeSet(std::move(elements));
  }
};

}

llvm::Expected<Value> core::getMemoValue(const Value& args,
                                         std::vector<LazyMemoFile>& lazyFiles) {
  MemoValueBuilder builder(lazyFiles);
  return builder.visit(args, "$");
}

std::string core::getCanonicalString(const Value& memoValue) {
  std::string result;
  llvm::raw_string_ostream os(result);
  writeCanonical(os, memoValue);
  return os.str();
}

// MARK: Saved Records

namespace {

/// Load the saved record at \arg path and check its type.
///
/// \returns The record's "data" object, None if there is no readable record,
/// or an error if the record has a different type.
llvm::Expected<Optional<json::Object>>
loadSavedRecord(basic::FileSystem& fs, const std::string& path,
                MemoKind kind) {
  auto buffer = fs.getFileContents(path);
  if (!buffer)
    return None;

  auto parsed = json::parse(buffer->getBuffer());
  if (!parsed) {
    llvm::consumeError(parsed.takeError());
    return None;
  }

  json::Object* root = parsed->getAsObject();
  if (!root)
    return None;
  auto type = root->getString("type");
  json::Object* data = root->getObject("data");
  if (!type || !data)
    return None;

  StringRef expectedType = Memo::getTypeName(kind);
  if (*type != expectedType) {
    return llvm::make_error<MemoTypeMismatchError>(path, expectedType, *type);
  }

  return Optional<json::Object>(std::move(*data));
}

llvm::Error writeRecord(basic::FileSystem& fs, const std::string& path,
                        MemoKind kind, json::Object data) {
  StringRef parent = llvm::sys::path::parent_path(path);
  if (!parent.empty() && !fs.createDirectories(parent.str())) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unable to create directory '%s'",
                                   parent.str().c_str());
  }

  json::Object root{
    {"type", Memo::getTypeName(kind)},
    {"data", std::move(data)},
  };
  std::string contents;
  llvm::raw_string_ostream os(contents);
  os << json::Value(std::move(root));
  os.flush();

  std::string error;
  if (!fs.writeFileContents(path, contents, &error)) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   error.c_str());
  }
  return llvm::Error::success();
}

/// Compute the digest of every value file.
///
/// \returns False if some value file cannot be hashed.
bool computeLazyDigests(basic::FileSystem& fs, ContentHashCache& cache,
                        ArrayRef<LazyMemoFile> lazyFiles,
                        std::vector<std::pair<std::string, std::string>>&
                          digests_out,
                        std::string* failedPath_out = nullptr) {
  for (const auto& file: lazyFiles) {
    std::string digest;
    if (!cache.getContentHash(fs, file.path, digest)) {
      if (failedPath_out)
        *failedPath_out = file.path;
      return false;
    }
    digests_out.emplace_back(file.key, digest);
  }
  return true;
}

llvm::Error makeUnhashableError(StringRef path) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "unable to compute the digest of '%s'",
                                 path.str().c_str());
}

// MARK: String-Hash Records

class StringHashMemo : public Memo {
  /// The canonical string of the arguments, or its digest.
  std::string code;

public:
  StringHashMemo(std::string code, std::vector<LazyMemoFile> lazyFiles)
      : Memo(std::move(lazyFiles)), code(std::move(code)) {}

  virtual MemoKind getKind() const override { return MemoKind::StringHash; }

  virtual llvm::Expected<bool>
  compareToSaved(basic::FileSystem& fs, ContentHashCache& cache,
                 const std::string& path) const override {
    auto saved = loadSavedRecord(fs, path, getKind());
    if (!saved)
      return saved.takeError();
    if (!saved->hasValue())
      return false;
    const json::Object& data = saved->getValue();

    auto savedCode = data.getString("code");
    if (!savedCode || *savedCode != code)
      return false;

    const json::Object* savedFiles = data.getObject("files");
    if (!savedFiles || savedFiles->size() != lazyFiles.size())
      return false;

    for (const auto& file: lazyFiles) {
      auto savedDigest = savedFiles->getString(file.key);
      if (!savedDigest)
        return false;
      std::string digest;
      if (!cache.getContentHash(fs, file.path, digest) ||
          digest != *savedDigest)
        return false;
    }
    return true;
  }

  virtual llvm::Error save(basic::FileSystem& fs, ContentHashCache& cache,
                           const std::string& path) const override {
    std::vector<std::pair<std::string, std::string>> digests;
    std::string failedPath;
    if (!computeLazyDigests(fs, cache, lazyFiles, digests, &failedPath))
      return makeUnhashableError(failedPath);

    json::Object files;
    for (auto& entry: digests)
      files[entry.first] = std::move(entry.second);

    return writeRecord(fs, path, getKind(), json::Object{
        {"code", code},
        {"files", std::move(files)},
      });
  }
};

// MARK: Authenticated Records

class AuthenticatedMemo : public Memo {
  std::vector<uint8_t> key;

  /// The memoization view of the arguments.
  Value memoValue;

  /// The encoding of \see memoValue.
  std::string code;

  basic::SHA256Digest getDigest(StringRef payload) const {
    return basic::computeHMACSHA256(key, payload);
  }

  /// Decode and verify a hex payload and its digest.
  ///
  /// \returns The payload, None if the fields are absent, or an error if the
  /// payload does not match the digest.
  llvm::Expected<Optional<std::string>>
  getVerifiedPayload(const json::Object& data, StringRef codeField,
                     StringRef digestField, const std::string& path) const {
    auto codeHex = data.getString(codeField);
    auto digestHex = data.getString(digestField);
    if (!codeHex || !digestHex)
      return None;

    std::vector<uint8_t> payload, digest;
    if (!basic::fromHex(*codeHex, payload) ||
        !basic::fromHex(*digestHex, digest)) {
      return llvm::make_error<MemoAuthenticationError>(path);
    }

    std::string payloadBytes(payload.begin(), payload.end());
    auto expected = getDigest(payloadBytes);
    StringRef expectedBytes(reinterpret_cast<const char*>(expected.data()),
                            expected.size());
    StringRef savedBytes(reinterpret_cast<const char*>(digest.data()),
                         digest.size());
    if (!basic::constantTimeEquals(expectedBytes, savedBytes))
      return llvm::make_error<MemoAuthenticationError>(path);

    return Optional<std::string>(std::move(payloadBytes));
  }

  static Value makeDigestDict(
      std::vector<std::pair<std::string, std::string>>& digests) {
    Value::EntryList entries;
    for (auto& entry: digests) {
      entries.emplace_back(Value::makeString(entry.first),
                           Value::makeString(entry.second));
    }
    return Value::makeDict(std::move(entries));
  }

public:
  AuthenticatedMemo(std::vector<uint8_t> key, Value memoValue,
                    std::string code, std::vector<LazyMemoFile> lazyFiles)
      : Memo(std::move(lazyFiles)), key(std::move(key)),
        memoValue(std::move(memoValue)), code(std::move(code)) {}

  virtual MemoKind getKind() const override { return MemoKind::Authenticated; }

  virtual llvm::Expected<bool>
  compareToSaved(basic::FileSystem& fs, ContentHashCache& cache,
                 const std::string& path) const override {
    auto saved = loadSavedRecord(fs, path, getKind());
    if (!saved)
      return saved.takeError();
    if (!saved->hasValue())
      return false;
    const json::Object& data = saved->getValue();

    // Compare the arguments.
    auto payload = getVerifiedPayload(data, "code", "digest", path);
    if (!payload)
      return payload.takeError();
    if (!payload->hasValue())
      return false;
    auto savedValue = decodeValue(payload->getValue());
    if (!savedValue) {
      // Verified, but written by an incompatible encoder.
      llvm::consumeError(savedValue.takeError());
      return false;
    }
    if (*savedValue != memoValue)
      return false;

    // Compare the value files.
    auto lazyPayload = getVerifiedPayload(data, "lazy_code", "lazy_digest",
                                          path);
    if (!lazyPayload)
      return lazyPayload.takeError();
    if (!lazyPayload->hasValue())
      return false;
    auto savedDigests = decodeValue(lazyPayload->getValue());
    if (!savedDigests) {
      llvm::consumeError(savedDigests.takeError());
      return false;
    }

    std::vector<std::pair<std::string, std::string>> digests;
    if (!computeLazyDigests(fs, cache, lazyFiles, digests))
      return false;
    return *savedDigests == makeDigestDict(digests);
  }

  virtual llvm::Error save(basic::FileSystem& fs, ContentHashCache& cache,
                           const std::string& path) const override {
    std::vector<std::pair<std::string, std::string>> digests;
    std::string failedPath;
    if (!computeLazyDigests(fs, cache, lazyFiles, digests, &failedPath))
      return makeUnhashableError(failedPath);

    auto lazyCode = encodeValue(makeDigestDict(digests));
    if (!lazyCode)
      return lazyCode.takeError();

    return writeRecord(fs, path, getKind(), json::Object{
        {"code", basic::toHex(code)},
        {"digest", basic::toHex(getDigest(code))},
        {"lazy_code", basic::toHex(*lazyCode)},
        {"lazy_digest", basic::toHex(getDigest(*lazyCode))},
      });
  }
};

}

// MARK: MemoFactory

llvm::Expected<MemoFactory> MemoFactory::create(MemoKind kind,
                                                ArrayRef<uint8_t> key) {
  if (kind == MemoKind::Authenticated && key.empty()) {
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        "authenticated memoization requires a key");
  }
  return MemoFactory(kind, std::vector<uint8_t>(key.begin(), key.end()));
}

llvm::Expected<MemoFactory> MemoFactory::createWithHexKey(MemoKind kind,
                                                          StringRef hexKey) {
  std::vector<uint8_t> key;
  if (!basic::fromHex(hexKey, key)) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "invalid hexadecimal memoization key");
  }
  return create(kind, key);
}

llvm::Expected<std::unique_ptr<Memo>>
MemoFactory::createMemo(const Value& args) const {
  std::vector<LazyMemoFile> lazyFiles;
  auto memoValue = getMemoValue(args, lazyFiles);
  if (!memoValue)
    return memoValue.takeError();

  switch (kind) {
  case MemoKind::StringHash: {
    std::string code = getCanonicalString(*memoValue);
    if (code.size() > MaxRawRepresentationLength)
      code = "sha256:" + basic::computeSHA256Hex(code);
    return std::unique_ptr<Memo>(
        new StringHashMemo(std::move(code), std::move(lazyFiles)));
  }

  case MemoKind::Authenticated: {
    auto code = encodeValue(*memoValue);
    if (!code)
      return code.takeError();

    // The record is only useful if decoding yields the same tree.
    auto decoded = decodeValue(*code);
    if (!decoded)
      return decoded.takeError();
    if (*decoded != *memoValue) {
      std::string rendering;
      llvm::raw_string_ostream os(rendering);
      memoValue->dump(os);
      return llvm::createStringError(
          llvm::inconvertibleErrorCode(),
          "memoized arguments do not survive an encoding round trip: %s",
          os.str().c_str());
    }

    return std::unique_ptr<Memo>(
        new AuthenticatedMemo(key, std::move(*memoValue), std::move(*code),
                              std::move(lazyFiles)));
  }
  }
  llvm_unreachable("unexpected memo kind");
}
