//===-- Value.cpp ---------------------------------------------------------===//
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

#include "memobuild/Core/Value.h"

#include "memobuild/Basic/Hashing.h"

#include "llvm/ADT/SmallPtrSet.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cmath>
#include <cstring>

using namespace memobuild;
using namespace memobuild::core;

namespace {

/// The maximum nesting depth accepted when decoding.
const unsigned MaxDecodeDepth = 512;

template<typename T>
int compareScalars(const T& lhs, const T& rhs) {
  if (lhs < rhs)
    return -1;
  if (rhs < lhs)
    return 1;
  return 0;
}

int compareFloats(double lhs, double rhs) {
  bool lhsIsNaN = std::isnan(lhs), rhsIsNaN = std::isnan(rhs);
  if (lhsIsNaN || rhsIsNaN) {
    // NaNs are ordered before all numbers.
    if (lhsIsNaN == rhsIsNaN)
      return 0;
    return lhsIsNaN ? -1 : 1;
  }
  return compareScalars(lhs, rhs);
}

bool lessThan(const Value& lhs, const Value& rhs) {
  return Value::compare(lhs, rhs) < 0;
}

}

// MARK: Construction

Value Value::makeBool(bool value) {
  Value result(Kind::Bool);
  result.boolValue = value;
  return result;
}

Value Value::makeInt(int64_t value) {
  Value result(Kind::Int);
  result.intValue = value;
  return result;
}

Value Value::makeFloat(double value) {
  Value result(Kind::Float);
  result.floatValue = value;
  return result;
}

Value Value::makeString(StringRef value) {
  Value result(Kind::String);
  result.stringValue = value.str();
  return result;
}

Value Value::makeBytes(StringRef value) {
  Value result(Kind::Bytes);
  result.stringValue = value.str();
  return result;
}

Value Value::makePath(StringRef value) {
  Value result(Kind::Path);
  result.stringValue = value.str();
  return result;
}

Value Value::makeList(ElementList elements) {
  Value result(Kind::List);
  result.elements = std::make_shared<ElementList>(std::move(elements));
  return result;
}

Value Value::makeTuple(ElementList elements) {
  Value result(Kind::Tuple);
  result.elements = std::make_shared<ElementList>(std::move(elements));
  return result;
}

Value Value::makeSet(ElementList elements) {
  std::sort(elements.begin(), elements.end(), lessThan);
  elements.erase(std::unique(elements.begin(), elements.end(),
                             [](const Value& lhs, const Value& rhs) {
                               return compare(lhs, rhs) == 0;
                             }),
                 elements.end());

  Value result(Kind::Set);
  result.elements = std::make_shared<ElementList>(std::move(elements));
  return result;
}

Value Value::makeDict(EntryList entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const std::pair<Value, Value>& lhs,
                      const std::pair<Value, Value>& rhs) {
                     return lessThan(lhs.first, rhs.first);
                   });

  // Keep the last of each run of equal keys.
  EntryList uniqued;
  uniqued.reserve(entries.size());
  for (auto& entry: entries) {
    if (!uniqued.empty() && compare(uniqued.back().first, entry.first) == 0) {
      uniqued.back() = std::move(entry);
    } else {
      uniqued.push_back(std::move(entry));
    }
  }

  Value result(Kind::Dict);
  result.entries = std::make_shared<EntryList>(std::move(uniqued));
  return result;
}

Value Value::makeFile(StringRef path, FileKind kind) {
  Value result(Kind::File);
  result.stringValue = path.str();
  result.fileKind = kind;
  return result;
}

Value Value::makeAtom(Value real, Value memo) {
  auto storage = std::make_shared<AtomStorage>();
  storage->real = std::move(real);
  storage->memo = std::move(memo);

  Value result(Kind::Atom);
  result.atom = std::move(storage);
  return result;
}

Value Value::makeOpaqueAtomImpl(std::shared_ptr<const void> object,
                                const std::type_info& type, Value memo) {
  auto storage = std::make_shared<AtomStorage>();
  storage->object = std::move(object);
  storage->objectType = &type;
  storage->memo = std::move(memo);

  Value result(Kind::Atom);
  result.atom = std::move(storage);
  return result;
}

// MARK: Accessors

const Value* Value::lookup(const Value& key) const {
  assert(isDict());
  auto it = std::lower_bound(entries->begin(), entries->end(), key,
                             [](const std::pair<Value, Value>& entry,
                                const Value& key) {
                               return lessThan(entry.first, key);
                             });
  if (it == entries->end() || compare(it->first, key) != 0)
    return nullptr;
  return &it->second;
}

bool Value::isOpaqueAtom() const {
  assert(isAtom());
  return atom->objectType != nullptr;
}

const Value& Value::getAtomReal() const {
  assert(isAtom() && !isOpaqueAtom());
  return atom->real;
}

const Value& Value::getAtomMemo() const {
  assert(isAtom());
  return atom->memo;
}

const void* Value::getOpaqueAtomObject(const std::type_info& type) const {
  assert(isAtom());
  if (!atom->objectType || *atom->objectType != type)
    return nullptr;
  return atom->object.get();
}

const void* Value::getStorageIdentity() const {
  switch (kind) {
  case Kind::List:
  case Kind::Tuple:
  case Kind::Set:
    return elements.get();
  case Kind::Dict:
    return entries.get();
  case Kind::Atom:
    return atom.get();
  default:
    return nullptr;
  }
}

void Value::append(Value element) {
  assert(isList() && "only lists can be modified");
  elements->push_back(std::move(element));
}

// MARK: Comparison

int Value::compare(const Value& lhs, const Value& rhs) {
  if (lhs.kind != rhs.kind)
    return lhs.kind < rhs.kind ? -1 : 1;

  switch (lhs.kind) {
  case Kind::None:
    return 0;
  case Kind::Bool:
    return compareScalars(lhs.boolValue, rhs.boolValue);
  case Kind::Int:
    return compareScalars(lhs.intValue, rhs.intValue);
  case Kind::Float:
    return compareFloats(lhs.floatValue, rhs.floatValue);
  case Kind::String:
  case Kind::Bytes:
  case Kind::Path:
    return lhs.stringValue.compare(rhs.stringValue);
  case Kind::File:
    if (lhs.fileKind != rhs.fileKind)
      return lhs.fileKind < rhs.fileKind ? -1 : 1;
    return lhs.stringValue.compare(rhs.stringValue);
  case Kind::List:
  case Kind::Tuple:
  case Kind::Set: {
    if (lhs.elements == rhs.elements)
      return 0;
    const auto& a = *lhs.elements;
    const auto& b = *rhs.elements;
    for (size_t i = 0, e = std::min(a.size(), b.size()); i != e; ++i) {
      if (int result = compare(a[i], b[i]))
        return result;
    }
    return compareScalars(a.size(), b.size());
  }
  case Kind::Dict: {
    if (lhs.entries == rhs.entries)
      return 0;
    const auto& a = *lhs.entries;
    const auto& b = *rhs.entries;
    for (size_t i = 0, e = std::min(a.size(), b.size()); i != e; ++i) {
      if (int result = compare(a[i].first, b[i].first))
        return result;
      if (int result = compare(a[i].second, b[i].second))
        return result;
    }
    return compareScalars(a.size(), b.size());
  }
  case Kind::Atom: {
    bool lhsIsOpaque = lhs.isOpaqueAtom(), rhsIsOpaque = rhs.isOpaqueAtom();
    if (lhsIsOpaque != rhsIsOpaque)
      return lhsIsOpaque ? 1 : -1;
    if (lhsIsOpaque) {
      if (int result = compareScalars(lhs.atom->object.get(),
                                      rhs.atom->object.get()))
        return result;
    } else if (int result = compare(lhs.atom->real, rhs.atom->real)) {
      return result;
    }
    return compare(lhs.atom->memo, rhs.atom->memo);
  }
  }
  llvm_unreachable("unexpected value kind");
}

bool Value::operator==(const Value& rhs) const {
  if (kind != rhs.kind)
    return false;

  switch (kind) {
  case Kind::None:
    return true;
  case Kind::Bool:
    return boolValue == rhs.boolValue;
  case Kind::Int:
    return intValue == rhs.intValue;
  case Kind::Float:
    return floatValue == rhs.floatValue;
  case Kind::String:
  case Kind::Bytes:
  case Kind::Path:
    return stringValue == rhs.stringValue;
  case Kind::File:
    return fileKind == rhs.fileKind && stringValue == rhs.stringValue;
  case Kind::List:
  case Kind::Tuple:
  case Kind::Set:
    return *elements == *rhs.elements;
  case Kind::Dict:
    return *entries == *rhs.entries;
  case Kind::Atom:
    if (isOpaqueAtom() || rhs.isOpaqueAtom()) {
      return (atom->object == rhs.atom->object &&
              atom->memo == rhs.atom->memo);
    }
    return atom->real == rhs.atom->real && atom->memo == rhs.atom->memo;
  }
  llvm_unreachable("unexpected value kind");
}

// MARK: Diagnostics

StringRef Value::getKindName(Kind kind) {
  switch (kind) {
  case Kind::None: return "none";
  case Kind::Bool: return "bool";
  case Kind::Int: return "int";
  case Kind::Float: return "float";
  case Kind::String: return "string";
  case Kind::Bytes: return "bytes";
  case Kind::Path: return "path";
  case Kind::List: return "list";
  case Kind::Tuple: return "tuple";
  case Kind::Dict: return "dict";
  case Kind::Set: return "set";
  case Kind::File: return "file";
  case Kind::Atom: return "atom";
  }
  llvm_unreachable("unexpected value kind");
}

void Value::dump(raw_ostream& os) const {
  switch (kind) {
  case Kind::None:
    os << "None";
    return;
  case Kind::Bool:
    os << (boolValue ? "True" : "False");
    return;
  case Kind::Int:
    os << intValue;
    return;
  case Kind::Float:
    os << llvm::format("%g", floatValue);
    return;
  case Kind::String:
    os << '"';
    os.write_escaped(stringValue);
    os << '"';
    return;
  case Kind::Bytes:
    os << "b'" << basic::toHex(stringValue) << "'";
    return;
  case Kind::Path:
    os << "Path(\"";
    os.write_escaped(stringValue);
    os << "\")";
    return;
  case Kind::File:
    os << (fileKind == FileKind::Value ? "VFile(\"" : "File(\"");
    os.write_escaped(stringValue);
    os << "\")";
    return;
  case Kind::List:
  case Kind::Tuple:
  case Kind::Set: {
    os << (kind == Kind::List ? "[" : kind == Kind::Tuple ? "(" : "{");
    bool first = true;
    for (const auto& element: *elements) {
      if (!first)
        os << ", ";
      first = false;
      element.dump(os);
    }
    os << (kind == Kind::List ? "]" : kind == Kind::Tuple ? ")" : "}");
    return;
  }
  case Kind::Dict: {
    os << "{";
    bool first = true;
    for (const auto& entry: *entries) {
      if (!first)
        os << ", ";
      first = false;
      entry.first.dump(os);
      os << ": ";
      entry.second.dump(os);
    }
    os << "}";
    return;
  }
  case Kind::Atom:
    os << "Atom(";
    if (isOpaqueAtom()) {
      os << "<object>";
    } else {
      atom->real.dump(os);
    }
    os << ", memo=";
    atom->memo.dump(os);
    os << ")";
    return;
  }
}

// MARK: Binary Coding

namespace {

class ValueEncoder {
  basic::BinaryEncoder& coder;

  /// The containers currently being encoded.
  llvm::SmallPtrSet<const void*, 16> active;

public:
  ValueEncoder(basic::BinaryEncoder& coder) : coder(coder) {}

  llvm::Error encode(const Value& value) {
    coder.write(uint8_t(value.getKind()));

    switch (value.getKind()) {
    case Value::Kind::None:
      return llvm::Error::success();
    case Value::Kind::Bool:
      coder.write(uint8_t(value.getBool()));
      return llvm::Error::success();
    case Value::Kind::Int:
      coder.write(uint64_t(value.getInt()));
      return llvm::Error::success();
    case Value::Kind::Float: {
      double number = value.getFloat();
      uint64_t bits;
      memcpy(&bits, &number, sizeof(bits));
      coder.write(bits);
      return llvm::Error::success();
    }
    case Value::Kind::String:
    case Value::Kind::Bytes:
    case Value::Kind::Path:
      coder.writeString(value.getString());
      return llvm::Error::success();
    case Value::Kind::File: {
      auto file = value.getFile();
      coder.write(uint8_t(file.kind));
      coder.writeString(file.path);
      return llvm::Error::success();
    }
    case Value::Kind::List:
    case Value::Kind::Tuple:
    case Value::Kind::Set:
    case Value::Kind::Dict:
    case Value::Kind::Atom:
      return encodeContainer(value);
    }
    llvm_unreachable("unexpected value kind");
  }

private:
  llvm::Error encodeContainer(const Value& value) {
    const void* identity = value.getStorageIdentity();
    if (!active.insert(identity).second) {
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     "cannot encode a cyclic value");
    }

    llvm::Error result = encodeContainerContents(value);
    active.erase(identity);
    return result;
  }

  llvm::Error encodeContainerContents(const Value& value) {
    if (value.isAtom()) {
      if (value.isOpaqueAtom()) {
        return llvm::createStringError(
            llvm::inconvertibleErrorCode(),
            "cannot encode an atom holding an arbitrary object");
      }
      if (auto error = encode(value.getAtomReal()))
        return error;
      return encode(value.getAtomMemo());
    }

    if (value.isDict()) {
      coder.write(uint64_t(value.getEntries().size()));
      for (const auto& entry: value.getEntries()) {
        if (auto error = encode(entry.first))
          return error;
        if (auto error = encode(entry.second))
          return error;
      }
      return llvm::Error::success();
    }

    coder.write(uint64_t(value.getElements().size()));
    for (const auto& element: value.getElements()) {
      if (auto error = encode(element))
        return error;
    }
    return llvm::Error::success();
  }
};

llvm::Error makeDecodeError(const Twine& message) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "malformed encoded value: " + message.str());
}

llvm::Expected<Value> decodeValueImpl(basic::BinaryDecoder& coder,
                                      unsigned depth) {
  if (depth > MaxDecodeDepth)
    return makeDecodeError("nesting too deep");

  uint8_t tag;
  coder.read(tag);
  if (coder.hadError())
    return makeDecodeError("unexpected end of data");
  if (tag > uint8_t(Value::Kind::Atom))
    return makeDecodeError("unknown kind " + Twine(unsigned(tag)));

  auto kind = Value::Kind(tag);
  switch (kind) {
  case Value::Kind::None:
    return Value::makeNone();
  case Value::Kind::Bool: {
    uint8_t byte;
    coder.read(byte);
    if (byte > 1)
      return makeDecodeError("invalid boolean");
    return Value::makeBool(byte != 0);
  }
  case Value::Kind::Int: {
    uint64_t bits;
    coder.read(bits);
    return Value::makeInt(int64_t(bits));
  }
  case Value::Kind::Float: {
    uint64_t bits;
    coder.read(bits);
    double number;
    memcpy(&number, &bits, sizeof(number));
    return Value::makeFloat(number);
  }
  case Value::Kind::String:
  case Value::Kind::Bytes:
  case Value::Kind::Path: {
    std::string contents;
    coder.readString(contents);
    if (kind == Value::Kind::String)
      return Value::makeString(contents);
    if (kind == Value::Kind::Bytes)
      return Value::makeBytes(contents);
    return Value::makePath(contents);
  }
  case Value::Kind::File: {
    uint8_t fileKind;
    coder.read(fileKind);
    if (fileKind > uint8_t(FileKind::Value))
      return makeDecodeError("invalid file kind");
    std::string path;
    coder.readString(path);
    return Value::makeFile(path, FileKind(fileKind));
  }
  case Value::Kind::Atom: {
    auto real = decodeValueImpl(coder, depth + 1);
    if (!real)
      return real.takeError();
    auto memo = decodeValueImpl(coder, depth + 1);
    if (!memo)
      return memo.takeError();
    return Value::makeAtom(std::move(*real), std::move(*memo));
  }
  case Value::Kind::Dict: {
    uint64_t count;
    coder.read(count);
    // Every entry occupies at least two bytes.
    if (coder.hadError() || count > coder.getRemaining() / 2)
      return makeDecodeError("invalid entry count");
    Value::EntryList entries;
    entries.reserve(count);
    for (uint64_t i = 0; i != count; ++i) {
      auto key = decodeValueImpl(coder, depth + 1);
      if (!key)
        return key.takeError();
      auto value = decodeValueImpl(coder, depth + 1);
      if (!value)
        return value.takeError();
      entries.emplace_back(std::move(*key), std::move(*value));
    }
    return Value::makeDict(std::move(entries));
  }
  case Value::Kind::List:
  case Value::Kind::Tuple:
  case Value::Kind::Set: {
    uint64_t count;
    coder.read(count);
    // Every element occupies at least one byte.
    if (coder.hadError() || count > coder.getRemaining())
      return makeDecodeError("invalid element count");
    Value::ElementList elements;
    elements.reserve(count);
    for (uint64_t i = 0; i != count; ++i) {
      auto element = decodeValueImpl(coder, depth + 1);
      if (!element)
        return element.takeError();
      elements.push_back(std::move(*element));
    }
    if (kind == Value::Kind::List)
      return Value::makeList(std::move(elements));
    if (kind == Value::Kind::Tuple)
      return Value::makeTuple(std::move(elements));
    return Value::makeSet(std::move(elements));
  }
  }
  llvm_unreachable("unexpected value kind");
}

}

llvm::Error core::encodeValue(const Value& value, basic::BinaryEncoder& coder) {
  ValueEncoder encoder(coder);
  return encoder.encode(value);
}

llvm::Expected<Value> core::decodeValue(basic::BinaryDecoder& coder) {
  auto result = decodeValueImpl(coder, 0);
  if (result && coder.hadError())
    return makeDecodeError("unexpected end of data");
  return result;
}

llvm::Expected<std::string> core::encodeValue(const Value& value) {
  basic::BinaryEncoder coder;
  if (auto error = encodeValue(value, coder))
    return std::move(error);
  return coder.getBytes().str();
}

llvm::Expected<Value> core::decodeValue(StringRef bytes) {
  basic::BinaryDecoder coder(bytes);
  auto result = decodeValue(coder);
  if (!result)
    return result.takeError();
  if (!coder.finish())
    return makeDecodeError("trailing data");
  return result;
}
