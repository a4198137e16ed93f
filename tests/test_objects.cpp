#include "objects.h"
#include <gtest/gtest.h>

TEST(ObjectTable, HandlesAreSequentialFromOne) {
  ObjectTable table;
  EXPECT_EQ(table.size(), 0u);
  EXPECT_FALSE(table.valid(0));
  EXPECT_FALSE(table.valid(1));

  const size_t n = 50;
  for (size_t i = 0; i < n; i++) {
    uint64_t h = table.intern(CfObject::make_opaque(i * 3));
    EXPECT_EQ(h, i + 1);
  }
  EXPECT_EQ(table.size(), n);
  EXPECT_TRUE(table.valid(n));
  EXPECT_FALSE(table.valid(n + 1));
  ASSERT_NE(table.resolve(7), nullptr);
  EXPECT_EQ(table.resolve(7)->raw, 18u);
}

TEST(ObjectTable, FreshTablesAreIndependent) {
  ObjectTable a;
  ObjectTable b;
  a.intern(CfObject::make_string("one"));
  a.intern(CfObject::make_string("two"));
  EXPECT_EQ(b.intern(CfObject::make_string("first")), 1u);
  EXPECT_EQ(b.resolve(1)->string, "first");
  EXPECT_EQ(a.resolve(1)->string, "one");
}

TEST(ObjectTable, ResolveRejectsInvalidHandles) {
  ObjectTable table;
  table.intern(CfObject::make_data({1, 2, 3}));
  EXPECT_EQ(table.resolve(0), nullptr);
  EXPECT_EQ(table.resolve(2), nullptr);
  EXPECT_EQ(table.resolve(0xC3C3C3C3C3C3C3C3ULL), nullptr);
  ASSERT_NE(table.resolve(1), nullptr);
  EXPECT_EQ(table.resolve(1)->type, CfType::Data);
}

TEST(ObjectTable, DictionaryRoundTrip) {
  ObjectTable table;
  uint64_t dict = table.create_dictionary();
  std::vector<CfObject> values = {
      CfObject::make_string("C02TM2ZBHX87"),
      CfObject::make_data({0xde, 0xad, 0xbe, 0xef}),
      CfObject::make_dictionary(),
      CfObject::make_opaque(0xC3C3C3C3C3C3C3C3ULL),
      CfObject::make_string(""),
  };
  std::vector<std::string> keys = {"IOPlatformSerialNumber", "", "nested",
                                   "with:colon", "DADiskDescriptionVolumeUUIDKey"};

  for (size_t i = 0; i < values.size(); i++) {
    uint64_t h = table.intern(values[i]);
    ASSERT_EQ(table.set(dict, keys[i], h), EmuError::None);
    uint64_t got = 0;
    ASSERT_EQ(table.get(dict, keys[i], &got), EmuError::None);
    EXPECT_EQ(got, h);
    EXPECT_EQ(*table.resolve(got), values[i]);
  }
}

TEST(ObjectTable, SetOverwritesExistingKey) {
  ObjectTable table;
  uint64_t dict = table.create_dictionary();
  uint64_t a = table.intern(CfObject::make_string("a"));
  uint64_t b = table.intern(CfObject::make_string("b"));
  ASSERT_EQ(table.set(dict, "k", a), EmuError::None);
  ASSERT_EQ(table.set(dict, "k", b), EmuError::None);
  uint64_t got = 0;
  ASSERT_EQ(table.get(dict, "k", &got), EmuError::None);
  EXPECT_EQ(got, b);
  EXPECT_EQ(table.resolve(dict)->dictionary.size(), 1u);
}

TEST(ObjectTable, DictionaryErrors) {
  ObjectTable table;
  uint64_t dict = table.create_dictionary();
  uint64_t str = table.intern(CfObject::make_string("x"));
  uint64_t got = 0;

  EXPECT_EQ(table.get(dict, "missing", &got), EmuError::KeyNotFound);
  EXPECT_EQ(table.get(str, "k", &got), EmuError::WrongObjectType);
  EXPECT_EQ(table.get(99, "k", &got), EmuError::InvalidHandle);
  EXPECT_EQ(table.set(str, "k", dict), EmuError::WrongObjectType);
  EXPECT_EQ(table.set(dict, "k", 99), EmuError::InvalidHandle);
  EXPECT_EQ(table.set(99, "k", str), EmuError::InvalidHandle);
}

TEST(CfObject, EqualityComparesPayloadOfSameType) {
  EXPECT_EQ(CfObject::make_string("a"), CfObject::make_string("a"));
  EXPECT_NE(CfObject::make_string("a"), CfObject::make_string("b"));
  EXPECT_NE(CfObject::make_opaque(1), CfObject::make_opaque(2));
  EXPECT_NE(CfObject::make_data({}), CfObject::make_dictionary());
  EXPECT_STREQ(cf_type_name(CfType::Data), "CFData");
}
