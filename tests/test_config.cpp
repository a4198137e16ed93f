#include "config.h"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { ConfigLoader::instance().reset(); }
  void TearDown() override { ConfigLoader::instance().reset(); }
};

TEST_F(ConfigTest, Defaults) {
  const NacConfig &cfg = ConfigLoader::instance().get_config();
  EXPECT_TRUE(cfg.binary_path.empty());
  EXPECT_TRUE(cfg.fixtures_path.empty());
  EXPECT_EQ(cfg.entries.nac_init, 0xB1DB0u);
  EXPECT_EQ(cfg.entries.nac_key_establishment, 0xB1DD0u);
  EXPECT_EQ(cfg.entries.nac_sign, 0xB1DF0u);
  EXPECT_FALSE(cfg.trace_hooks);
}

TEST_F(ConfigTest, ParseLine) {
  ConfigLoader &loader = ConfigLoader::instance();
  EXPECT_TRUE(loader.parse_line("binary=/opt/nac/IMDAppleServices"));
  EXPECT_TRUE(loader.parse_line("entry:nac_sign = 0xB2000"));
  EXPECT_TRUE(loader.parse_line("entry:nac_init=b1000"));
  EXPECT_TRUE(loader.parse_line("trace_hooks=1"));

  const NacConfig &cfg = loader.get_config();
  EXPECT_EQ(cfg.binary_path, "/opt/nac/IMDAppleServices");
  EXPECT_EQ(cfg.entries.nac_sign, 0xB2000u);
  EXPECT_EQ(cfg.entries.nac_init, 0xB1000u);
  EXPECT_TRUE(cfg.trace_hooks);

  EXPECT_FALSE(loader.parse_line("entry:nac_sign=0xZZ"));
  EXPECT_FALSE(loader.parse_line("entry:nac_other=0x10"));
  EXPECT_FALSE(loader.parse_line("trace_hooks=yes"));
  EXPECT_FALSE(loader.parse_line("unknown=1"));
  EXPECT_FALSE(loader.parse_line("no equals sign"));
  EXPECT_EQ(loader.get_config().entries.nac_sign, 0xB2000u);
}

TEST_F(ConfigTest, LoadConfigSkipsMalformedLines) {
  std::string path = "/tmp/nacsim_" + std::to_string(getpid()) + "_cfg.txt";
  {
    std::ofstream out(path);
    out << "# nacsim\n"
        << "binary=/data/IMDAppleServices\n"
        << "fixtures=/data/fixtures.txt\n"
        << "\n"
        << "this line is ignored\n"
        << "entry:nac_key_establishment=0xB1DE0\n";
  }
  ASSERT_TRUE(ConfigLoader::instance().load_config(path));
  const NacConfig &cfg = ConfigLoader::instance().get_config();
  EXPECT_EQ(cfg.binary_path, "/data/IMDAppleServices");
  EXPECT_EQ(cfg.fixtures_path, "/data/fixtures.txt");
  EXPECT_EQ(cfg.entries.nac_key_establishment, 0xB1DE0u);
  EXPECT_EQ(cfg.entries.nac_init, DEFAULT_NAC_INIT);
  std::remove(path.c_str());

  EXPECT_FALSE(ConfigLoader::instance().load_config(path));
}
