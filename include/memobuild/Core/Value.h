//===- Value.h --------------------------------------------------*- C++ -*-===//
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
// This file defines the Value type, the argument tree bound to a rule's action
// and the input to memoization.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_CORE_VALUE_H
#define MEMOBUILD_CORE_VALUE_H

#include "memobuild/Basic/BinaryCoding.h"
#include "memobuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace memobuild {
namespace core {

/// How the staleness of a file is judged.
enum class FileKind : uint8_t {
  /// The file is compared by modification time only.
  Plain = 0,

  /// The file is compared by modification time and, when that is not decisive,
  /// by the digest of its contents. Touching a value file without changing its
  /// contents does not make its dependents stale.
  Value = 1,
};

/// A reference to a file by path.
struct FileRef {
  std::string path;
  FileKind kind = FileKind::Plain;

  bool isValueFile() const { return kind == FileKind::Value; }

  bool operator==(const FileRef& rhs) const {
    return path == rhs.path && kind == rhs.kind;
  }
  bool operator!=(const FileRef& rhs) const { return !(*this == rhs); }
};

struct AtomStorage;

/// An immutable-by-default node of an argument tree.
///
/// A Value is one of a closed set of kinds: plain scalars (none, booleans,
/// integers, floats, strings, byte strings and paths), containers (lists,
/// tuples, dictionaries and sets), file references, and atoms. An atom pairs
/// the value an action sees with a separate value used for memoization; its
/// real value may be an arbitrary C++ object, which makes it usable only
/// within the current process.
///
/// Containers share their storage between copies, so the same container may be
/// reachable from several places in a tree. Lists are the only mutable kind
/// (see \see append), which makes it possible to construct a cyclic tree;
/// memoization rejects such trees.
///
/// Sets and dictionaries are kept in a canonical order (by \see compare) with
/// unique elements or keys, so structural equality is order insensitive.
class Value {
public:
  enum class Kind : uint8_t {
    None = 0,
    Bool,
    Int,
    Float,
    String,
    Bytes,
    Path,
    List,
    Tuple,
    Dict,
    Set,
    File,
    Atom,
  };

  typedef std::vector<Value> ElementList;
  typedef std::vector<std::pair<Value, Value>> EntryList;

private:
  Kind kind = Kind::None;
  FileKind fileKind = FileKind::Plain;
  bool boolValue = false;
  int64_t intValue = 0;
  double floatValue = 0;

  /// The payload of String, Bytes, Path and File values.
  std::string stringValue;

  /// The payload of List, Tuple and Set values.
  std::shared_ptr<ElementList> elements;

  /// The payload of Dict values.
  std::shared_ptr<EntryList> entries;

  /// The payload of Atom values.
  std::shared_ptr<const AtomStorage> atom;

  explicit Value(Kind kind) : kind(kind) {}

  static Value makeOpaqueAtomImpl(std::shared_ptr<const void> object,
                                  const std::type_info& type, Value memo);

  const void* getOpaqueAtomObject(const std::type_info& type) const;

public:
  /// Construct a None value.
  Value() {}

  /// @name Construction
  /// @{

  static Value makeNone() { return Value(); }
  static Value makeBool(bool value);
  static Value makeInt(int64_t value);
  static Value makeFloat(double value);
  static Value makeString(StringRef value);
  static Value makeBytes(StringRef value);
  static Value makePath(StringRef value);
  static Value makeList(ElementList elements = {});
  static Value makeTuple(ElementList elements = {});

  /// Create a set; duplicate elements are dropped.
  static Value makeSet(ElementList elements = {});

  /// Create a dictionary; for duplicate keys, the last entry wins.
  static Value makeDict(EntryList entries = {});

  static Value makeFile(StringRef path, FileKind kind = FileKind::Plain);
  static Value makeFile(const FileRef& file) {
    return makeFile(file.path, file.kind);
  }

  /// Create an atom whose real value is another Value.
  static Value makeAtom(Value real, Value memo);

  /// Create an atom whose real value is an arbitrary object.
  ///
  /// Such atoms cannot be encoded, and so rules binding them always execute in
  /// the orchestrating process.
  template<typename T>
  static Value makeOpaqueAtom(std::shared_ptr<const T> object, Value memo) {
    return makeOpaqueAtomImpl(std::move(object), typeid(T), std::move(memo));
  }

  /// @}

  /// @name Accessors
  /// @{

  Kind getKind() const { return kind; }

  bool isNone() const { return kind == Kind::None; }
  bool isBool() const { return kind == Kind::Bool; }
  bool isInt() const { return kind == Kind::Int; }
  bool isFloat() const { return kind == Kind::Float; }
  bool isString() const { return kind == Kind::String; }
  bool isBytes() const { return kind == Kind::Bytes; }
  bool isPath() const { return kind == Kind::Path; }
  bool isList() const { return kind == Kind::List; }
  bool isTuple() const { return kind == Kind::Tuple; }
  bool isDict() const { return kind == Kind::Dict; }
  bool isSet() const { return kind == Kind::Set; }
  bool isFile() const { return kind == Kind::File; }
  bool isAtom() const { return kind == Kind::Atom; }

  /// Check if this is a list, tuple or set.
  bool isSequence() const {
    return kind == Kind::List || kind == Kind::Tuple || kind == Kind::Set;
  }

  /// Check if this is any container kind.
  bool isContainer() const { return isSequence() || kind == Kind::Dict; }

  bool getBool() const { assert(isBool()); return boolValue; }
  int64_t getInt() const { assert(isInt()); return intValue; }
  double getFloat() const { assert(isFloat()); return floatValue; }

  /// Get the payload of a String, Bytes or Path value.
  StringRef getString() const {
    assert(isString() || isBytes() || isPath());
    return stringValue;
  }

  const ElementList& getElements() const {
    assert(isSequence());
    return *elements;
  }

  const EntryList& getEntries() const {
    assert(isDict());
    return *entries;
  }

  /// Find the entry for the given key in a dictionary.
  const Value* lookup(const Value& key) const;

  /// Find the entry for the given string key in a dictionary.
  const Value* lookup(StringRef key) const {
    return lookup(makeString(key));
  }

  FileRef getFile() const {
    assert(isFile());
    return FileRef{ stringValue, fileKind };
  }

  /// Check if this atom's real value is an arbitrary object.
  bool isOpaqueAtom() const;

  /// Get the real value of a (non-opaque) atom.
  const Value& getAtomReal() const;

  /// Get the memoization value of an atom.
  const Value& getAtomMemo() const;

  /// Get the real value of an opaque atom, or null if it is not a \arg T.
  template<typename T>
  const T* getOpaqueAtom() const {
    return static_cast<const T*>(getOpaqueAtomObject(typeid(T)));
  }

  /// Get an identity for the storage of a container value, which is shared
  /// between copies of the value.
  const void* getStorageIdentity() const;

  /// @}

  /// Append an element to a list value.
  ///
  /// Every copy of the list observes the change.
  void append(Value element);

  /// Compute a total order over values.
  ///
  /// Values are ordered by kind first, then by contents. Opaque atoms are
  /// ordered by object identity.
  ///
  /// \returns A negative number, zero, or a positive number, if \arg lhs is
  /// respectively less than, equivalent to, or greater than \arg rhs.
  static int compare(const Value& lhs, const Value& rhs);

  /// Structural equality.
  ///
  /// Unlike \see compare, floating point values compare as IEEE numbers, so a
  /// NaN is not equal to itself.
  bool operator==(const Value& rhs) const;
  bool operator!=(const Value& rhs) const { return !(*this == rhs); }

  /// Get the name of a value kind, for use in diagnostics.
  static StringRef getKindName(Kind kind);

  /// Write a human readable rendition of the value, for use in diagnostics.
  void dump(raw_ostream& os) const;
};

/// The storage for atom values.
struct AtomStorage {
  /// The real value, for non-opaque atoms.
  Value real;

  /// The real object, for opaque atoms.
  std::shared_ptr<const void> object;

  /// The type of \see object.
  const std::type_info* objectType = nullptr;

  /// The value used for memoization.
  Value memo;
};

/// Encode a value into \arg coder.
///
/// The encoding is deterministic for a given tree. Opaque atoms and cyclic
/// trees cannot be encoded.
llvm::Error encodeValue(const Value& value, basic::BinaryEncoder& coder);

/// Decode a value previously written by \see encodeValue.
llvm::Expected<Value> decodeValue(basic::BinaryDecoder& coder);

/// Encode a value into a byte string.
llvm::Expected<std::string> encodeValue(const Value& value);

/// Decode a complete byte string written by \see encodeValue.
llvm::Expected<Value> decodeValue(StringRef bytes);

}
}

#endif
