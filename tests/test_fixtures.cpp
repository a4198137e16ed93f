#include "fixtures.h"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

static std::string temp_path(const std::string &name) {
  return "/tmp/nacsim_" + std::to_string(getpid()) + "_" + name;
}

TEST(FixtureSet, BuiltinCoversQueriedProperties) {
  FixtureSet f = FixtureSet::builtin();
  const char *names[] = {
      "4D1EDE05-38C7-4A6A-9CC6-4BCCA8B38C14:MLB",
      "4D1EDE05-38C7-4A6A-9CC6-4BCCA8B38C14:ROM",
      "Fyp98tpgj",
      "Gq3489ugfi",
      "IOMACAddress",
      "IOPlatformSerialNumber",
      "IOPlatformUUID",
      "abKPld1EcMni",
      "board-id",
      "kbjfrfpoJU",
      "oycqAZloTNDm",
      "product-name",
  };
  for (const char *name : names)
    EXPECT_NE(f.iokit(name), nullptr) << name;
  EXPECT_TRUE(f.iokit("IOPlatformSerialNumber")->is_string);
  EXPECT_TRUE(f.iokit("IOPlatformUUID")->is_string);
  EXPECT_FALSE(f.iokit("IOMACAddress")->is_string);
  EXPECT_EQ(f.iokit("IOMACAddress")->data.size(), 6u);
  EXPECT_EQ(f.root_disk_uuid().size(), 36u);
  EXPECT_EQ(f.iokit("nope"), nullptr);
}

TEST(FixtureSet, ParseLineOverrides) {
  FixtureSet f = FixtureSet::builtin();
  std::string error;
  ASSERT_TRUE(f.parse_line("iokit:IOMACAddress=data:0a0B0c0d0e0f", error))
      << error;
  EXPECT_EQ(f.iokit("IOMACAddress")->data,
            (std::vector<uint8_t>{0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f}));

  ASSERT_TRUE(f.parse_line(
      "iokit:4D1EDE05-38C7-4A6A-9CC6-4BCCA8B38C14:MLB=string:C0000000000000001",
      error));
  EXPECT_EQ(f.iokit("4D1EDE05-38C7-4A6A-9CC6-4BCCA8B38C14:MLB")->string,
            "C0000000000000001");

  ASSERT_TRUE(f.parse_line("iokit:custom=string:a=b", error));
  EXPECT_EQ(f.iokit("custom")->string, "a=b");

  ASSERT_TRUE(f.parse_line("disk:root_uuid=00000000-1111-2222-3333-444444444444",
                           error));
  EXPECT_EQ(f.root_disk_uuid(), "00000000-1111-2222-3333-444444444444");
}

TEST(FixtureSet, ParseLineRejectsMalformed) {
  FixtureSet f;
  std::string error;
  EXPECT_FALSE(f.parse_line("iokit:x", error));
  EXPECT_FALSE(f.parse_line("iokit:x=hex:00", error));
  EXPECT_FALSE(f.parse_line("iokit:x=data:0g", error));
  EXPECT_FALSE(f.parse_line("iokit:=string:x", error));
  EXPECT_FALSE(f.parse_line("disk:other=1", error));
  EXPECT_FALSE(error.empty());
}

TEST(FixtureSet, LoadFile) {
  std::string path = temp_path("fixtures.txt");
  {
    std::ofstream out(path);
    out << "# captured identifiers\n"
        << "\n"
        << "iokit:board-id=data:4d61632d3100\n"
        << "disk:root_uuid=AAAAAAAA-BBBB-CCCC-DDDD-EEEEEEEEEEEE\r\n";
  }
  FixtureSet f = FixtureSet::builtin();
  std::string error;
  ASSERT_TRUE(f.load_file(path, error)) << error;
  EXPECT_EQ(f.iokit("board-id")->data,
            (std::vector<uint8_t>{'M', 'a', 'c', '-', '1', 0}));
  EXPECT_EQ(f.root_disk_uuid(), "AAAAAAAA-BBBB-CCCC-DDDD-EEEEEEEEEEEE");
  EXPECT_NE(f.iokit("IOPlatformUUID"), nullptr);
  std::remove(path.c_str());
}

TEST(FixtureSet, LoadFileReportsLine) {
  std::string path = temp_path("bad_fixtures.txt");
  {
    std::ofstream out(path);
    out << "iokit:a=string:x\n"
        << "garbage\n";
  }
  FixtureSet f;
  std::string error;
  EXPECT_FALSE(f.load_file(path, error));
  EXPECT_NE(error.find(":2:"), std::string::npos) << error;
  std::remove(path.c_str());

  EXPECT_FALSE(f.load_file(temp_path("missing.txt"), error));
}
