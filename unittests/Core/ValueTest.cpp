//===- unittests/Core/ValueTest.cpp ---------------------------------------===//
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

#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <cmath>

using namespace memobuild;
using namespace memobuild::core;

namespace {

std::string dumpValue(const Value& value) {
  std::string result;
  llvm::raw_string_ostream os(result);
  value.dump(os);
  return os.str();
}

TEST(ValueTest, setsAndDictsAreCanonical) {
  auto set1 = Value::makeSet({ Value::makeInt(2), Value::makeInt(1),
                               Value::makeInt(2) });
  auto set2 = Value::makeSet({ Value::makeInt(1), Value::makeInt(2) });
  EXPECT_EQ(set1.getElements().size(), 2U);
  EXPECT_TRUE(set1 == set2);

  auto dict = Value::makeDict({
      { Value::makeString("b"), Value::makeInt(1) },
      { Value::makeString("a"), Value::makeInt(2) },
      { Value::makeString("b"), Value::makeInt(3) } });
  ASSERT_EQ(dict.getEntries().size(), 2U);
  EXPECT_EQ(dict.getEntries()[0].first.getString(), "a");
  ASSERT_NE(dict.lookup("b"), nullptr);
  EXPECT_EQ(dict.lookup("b")->getInt(), 3);
  EXPECT_EQ(dict.lookup("c"), nullptr);
}

TEST(ValueTest, equalityIsStructural) {
  auto list1 = Value::makeList({ Value::makeInt(1), Value::makeString("x") });
  auto list2 = Value::makeList({ Value::makeInt(1), Value::makeString("x") });
  auto tuple = Value::makeTuple({ Value::makeInt(1), Value::makeString("x") });
  EXPECT_TRUE(list1 == list2);
  EXPECT_FALSE(list1 == tuple);

  // Kinds with the same payload are distinct.
  EXPECT_FALSE(Value::makeString("a") == Value::makeBytes("a"));
  EXPECT_FALSE(Value::makeString("a") == Value::makePath("a"));
  EXPECT_FALSE(Value::makeInt(1) == Value::makeFloat(1));
  EXPECT_FALSE(Value::makeFile("a") == Value::makeFile("a", FileKind::Value));

  // NaN is not equal to itself, but still has a place in the total order.
  auto nan = Value::makeFloat(NAN);
  EXPECT_FALSE(nan == nan);
  EXPECT_EQ(Value::compare(nan, nan), 0);
}

TEST(ValueTest, listsShareStorage) {
  auto list = Value::makeList();
  auto copy = list;
  list.append(Value::makeInt(1));
  EXPECT_EQ(copy.getElements().size(), 1U);
  EXPECT_EQ(list.getStorageIdentity(), copy.getStorageIdentity());
  EXPECT_NE(list.getStorageIdentity(), Value::makeList().getStorageIdentity());
}

TEST(ValueTest, atoms) {
  auto atom = Value::makeAtom(Value::makeString("real"), Value::makeInt(1));
  EXPECT_FALSE(atom.isOpaqueAtom());
  EXPECT_EQ(atom.getAtomReal().getString(), "real");
  EXPECT_EQ(atom.getAtomMemo().getInt(), 1);

  struct Model { int weights; };
  auto model = std::make_shared<const Model>(Model{ 42 });
  auto opaque = Value::makeOpaqueAtom(model, Value::makeString("model-v1"));
  EXPECT_TRUE(opaque.isOpaqueAtom());
  ASSERT_NE(opaque.getOpaqueAtom<Model>(), nullptr);
  EXPECT_EQ(opaque.getOpaqueAtom<Model>()->weights, 42);
  EXPECT_EQ(opaque.getOpaqueAtom<int>(), nullptr);
}

TEST(ValueTest, dump) {
  auto value = Value::makeTuple({
      Value::makeNone(), Value::makeBool(true), Value::makeInt(-3),
      Value::makeString("a\"b"), Value::makeBytes("\x01\xff"),
      Value::makeFile("out/x"), Value::makeList({ Value::makeFloat(0.5) }) });
  EXPECT_EQ(dumpValue(value),
            "(None, True, -3, \"a\\\"b\", b'01ff', File(\"out/x\"), [0.5])");
  EXPECT_EQ(dumpValue(Value::makeDict({ { Value::makeString("k"),
                                          Value::makeFile("v", FileKind::Value)
                                        } })),
            "{\"k\": VFile(\"v\")}");
}

TEST(ValueTest, encoding) {
  auto value = Value::makeTuple({
      Value::makeInt(-1), Value::makeFloat(2.5),
      Value::makeBytes(StringRef("\0x", 2)),
      Value::makeSet({ Value::makeString("b"), Value::makeString("a") }),
      Value::makeDict({ { Value::makeInt(1), Value::makePath("/p") } }),
      Value::makeFile("/f", FileKind::Value),
      Value::makeAtom(Value::makeInt(5), Value::makeString("five")) });

  auto encoded = encodeValue(value);
  ASSERT_TRUE(bool(encoded)) << llvm::toString(encoded.takeError());
  auto decoded = decodeValue(*encoded);
  ASSERT_TRUE(bool(decoded)) << llvm::toString(decoded.takeError());
  EXPECT_TRUE(*decoded == value);

  // The encoding is deterministic.
  auto again = encodeValue(*decoded);
  ASSERT_TRUE(bool(again)) << llvm::toString(again.takeError());
  EXPECT_EQ(*again, *encoded);
}

TEST(ValueTest, encodingErrors) {
  // Opaque atoms cannot leave the process.
  auto opaque = Value::makeOpaqueAtom(std::make_shared<const int>(1),
                                      Value::makeNone());
  auto encoded = encodeValue(Value::makeList({ opaque }));
  ASSERT_FALSE(bool(encoded));
  llvm::consumeError(encoded.takeError());

  // Nor can cyclic lists.
  auto list = Value::makeList();
  list.append(list);
  auto cyclic = encodeValue(list);
  ASSERT_FALSE(bool(cyclic));
  EXPECT_NE(llvm::toString(cyclic.takeError()).find("cyclic"),
            std::string::npos);
  // Break the cycle, so the storage is freed.
  const_cast<Value::ElementList&>(list.getElements()).clear();

  // Shared, acyclic structure is fine.
  auto shared = Value::makeList({ Value::makeInt(1) });
  auto diamond = encodeValue(Value::makeTuple({ shared, shared }));
  ASSERT_TRUE(bool(diamond)) << llvm::toString(diamond.takeError());

  // Truncated and trailing data are rejected.
  auto valid = encodeValue(Value::makeString("hello"));
  ASSERT_TRUE(bool(valid)) << llvm::toString(valid.takeError());
  auto truncated = decodeValue(StringRef(*valid).drop_back());
  ASSERT_FALSE(bool(truncated));
  llvm::consumeError(truncated.takeError());
  auto trailing = decodeValue(*valid + "x");
  ASSERT_FALSE(bool(trailing));
  llvm::consumeError(trailing.takeError());

  auto unknown = decodeValue(StringRef("\xff", 1));
  ASSERT_FALSE(bool(unknown));
  llvm::consumeError(unknown.takeError());
}

}
