#include "macho.h"
#include "test_image.h"
#include <cstring>
#include <gtest/gtest.h>

using namespace test_image;

static uint32_t magic_of(const std::vector<uint8_t> &slice) {
  uint32_t magic = 0;
  memcpy(&magic, slice.data(), 4);
  return magic;
}

TEST(MachOParser, ExtractsX86SliceFromFat) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  std::vector<uint8_t> arm = build_thin(TestImageLayout(), CPU_TYPE_ARM64);
  std::vector<uint8_t> fat =
      build_fat({{CPU_TYPE_ARM64, arm}, {CPU_TYPE_X86_64, x86}});

  std::vector<FatSlice> slices;
  std::string error;
  ASSERT_TRUE(MachOParser::get_fat_slices(fat, slices, error)) << error;
  ASSERT_EQ(slices.size(), 2u);
  EXPECT_EQ(slices[1].cputype, CPU_TYPE_X86_64);
  EXPECT_EQ(slices[1].size, x86.size());

  std::vector<uint8_t> slice;
  ASSERT_TRUE(MachOParser::get_arch_slice(fat, CPU_TYPE_X86_64, slice, error))
      << error;
  EXPECT_EQ(slice.size(), slices[1].size);
  EXPECT_EQ(magic_of(slice), MH_MAGIC_64);
  EXPECT_EQ(slice, x86);
}

TEST(MachOParser, AcceptsWideFatHeaders) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  std::vector<uint8_t> fat = build_fat({{CPU_TYPE_X86_64, x86}}, true);

  std::vector<uint8_t> slice;
  std::string error;
  ASSERT_TRUE(MachOParser::get_arch_slice(fat, CPU_TYPE_X86_64, slice, error))
      << error;
  EXPECT_EQ(slice, x86);
}

TEST(MachOParser, ThinImageOfRequestedArchIsReturnedWhole) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  std::vector<uint8_t> slice;
  std::string error;
  ASSERT_TRUE(MachOParser::get_arch_slice(x86, CPU_TYPE_X86_64, slice, error));
  EXPECT_EQ(slice, x86);

  std::vector<uint8_t> arm = build_thin(TestImageLayout(), CPU_TYPE_ARM64);
  EXPECT_FALSE(MachOParser::get_arch_slice(arm, CPU_TYPE_X86_64, slice, error));
}

TEST(MachOParser, MissingArchitectureFails) {
  std::vector<uint8_t> arm = build_thin(TestImageLayout(), CPU_TYPE_ARM64);
  std::vector<uint8_t> fat = build_fat({{CPU_TYPE_ARM64, arm}});
  std::vector<uint8_t> slice;
  std::string error;
  EXPECT_FALSE(MachOParser::get_arch_slice(fat, CPU_TYPE_X86_64, slice, error));
  EXPECT_NE(error.find("x86_64"), std::string::npos);
}

TEST(MachOParser, TruncatedContainersFail) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  std::vector<uint8_t> fat = build_fat({{CPU_TYPE_X86_64, x86}});
  std::vector<uint8_t> slice;
  std::string error;

  std::vector<uint8_t> cut(fat.begin(), fat.end() - 16);
  EXPECT_FALSE(MachOParser::get_arch_slice(cut, CPU_TYPE_X86_64, slice, error));

  std::vector<uint8_t> header_only(fat.begin(), fat.begin() + 12);
  EXPECT_FALSE(
      MachOParser::get_arch_slice(header_only, CPU_TYPE_X86_64, slice, error));

  std::vector<uint8_t> garbage = {0xDE, 0xAD, 0xBE, 0xEF, 0, 0, 0, 0};
  EXPECT_FALSE(MachOParser::get_arch_slice(garbage, CPU_TYPE_X86_64, slice, error));
  EXPECT_FALSE(MachOParser::get_arch_slice({}, CPU_TYPE_X86_64, slice, error));
}

TEST(MachOParser, ParsesSegmentsAndSections) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  MachOImage image;
  std::string error;
  ASSERT_TRUE(MachOParser::parse_image(x86, image, error)) << error;
  EXPECT_EQ(image.cputype, CPU_TYPE_X86_64);
  ASSERT_EQ(image.segments.size(), 3u);
  EXPECT_EQ(image.segments[0].name, "__PAGEZERO");
  EXPECT_EQ(image.segments[1].name, "__TEXT");
  EXPECT_EQ(image.segments[1].vmaddr, TEXT_ADDR);
  ASSERT_EQ(image.segments[2].sections.size(), 2u);
  EXPECT_EQ(image.segments[2].sections[0].name, "__nl_symbol_ptr");
  EXPECT_EQ(image.segments[2].sections[0].type, S_NON_LAZY_SYMBOL_POINTERS);
  EXPECT_TRUE(image.has_symtab);
  EXPECT_TRUE(image.has_dysymtab);
  EXPECT_TRUE(image.has_dyld_info);
}

TEST(MachOParser, RejectsLoadCommandsPastEnd) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  MachHeader64 hdr;
  memcpy(&hdr, x86.data(), sizeof(hdr));
  hdr.sizeofcmds = 0x100000;
  memcpy(x86.data(), &hdr, sizeof(hdr));

  MachOImage image;
  std::string error;
  EXPECT_FALSE(MachOParser::parse_image(x86, image, error));
}

TEST(MachOParser, RejectsSegmentPastEnd) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  std::vector<uint8_t> cut(x86.begin(), x86.begin() + 0x2800);
  MachOImage image;
  std::string error;
  EXPECT_FALSE(MachOParser::parse_image(cut, image, error));
}

TEST(MachOParser, IndirectImportsNameEachPointer) {
  TestImageLayout layout = validation_routines();
  std::vector<uint8_t> x86 = build_thin(layout);
  MachOImage image;
  std::string error;
  ASSERT_TRUE(MachOParser::parse_image(x86, image, error)) << error;

  std::vector<ImportSlot> slots = MachOParser::get_indirect_imports(x86, image);
  ASSERT_EQ(slots.size(), layout.imports.size());
  for (size_t i = 0; i < slots.size(); i++) {
    EXPECT_EQ(slots[i].address, import_slot(i));
    EXPECT_EQ(slots[i].symbol, layout.imports[i]);
  }
}

TEST(MachOParser, BindOpcodesProduceSlots) {
  TestImageLayout layout = validation_routines();
  std::vector<uint8_t> x86 = build_thin(layout);
  MachOImage image;
  std::string error;
  ASSERT_TRUE(MachOParser::parse_image(x86, image, error)) << error;

  std::vector<ImportSlot> binds;
  ASSERT_TRUE(MachOParser::get_binds(x86, image, binds, error)) << error;
  ASSERT_EQ(binds.size(), layout.binds.size());
  for (size_t i = 0; i < binds.size(); i++) {
    EXPECT_EQ(binds[i].address, bind_slot(i));
    EXPECT_EQ(binds[i].symbol, layout.binds[i]);
  }
}

// Points the image's bind info at `stream`, appended to the slice.
static void replace_binds(std::vector<uint8_t> &slice, MachOImage &image,
                          const std::vector<uint8_t> &stream) {
  image.dyld_info.bind_off = slice.size();
  image.dyld_info.bind_size = stream.size();
  slice.insert(slice.end(), stream.begin(), stream.end());
}

TEST(MachOParser, BindAddendIsCarried) {
  TestImageLayout layout;
  layout.binds = {"_CFRelease", "_free"};
  layout.bind_addend = 16;
  std::vector<uint8_t> x86 = build_thin(layout);
  MachOImage image;
  std::string error;
  ASSERT_TRUE(MachOParser::parse_image(x86, image, error)) << error;

  std::vector<ImportSlot> binds;
  ASSERT_TRUE(MachOParser::get_binds(x86, image, binds, error)) << error;
  ASSERT_EQ(binds.size(), 2u);
  EXPECT_EQ(binds[0].address, bind_slot(0));
  EXPECT_EQ(binds[0].addend, 16);
  EXPECT_EQ(binds[1].addend, 16);

  std::vector<ImportSlot> imports = MachOParser::get_indirect_imports(x86, image);
  for (const auto &slot : imports)
    EXPECT_EQ(slot.addend, 0);
}

TEST(MachOParser, BindOutsideSegmentFails) {
  std::vector<uint8_t> x86 = build_thin(validation_routines());
  MachOImage image;
  std::string error;
  ASSERT_TRUE(MachOParser::parse_image(x86, image, error)) << error;

  // __DATA (segment 2) spans 0x1000 bytes; bind at +0x5000
  std::vector<uint8_t> stream = {BIND_OPCODE_SET_SEGMENT_AND_OFFSET_ULEB | 2,
                                 0x80, 0xA0, 0x01,
                                 BIND_OPCODE_SET_SYMBOL_TRAILING_FLAGS_IMM,
                                 '_', 'x', 0,
                                 BIND_OPCODE_SET_ADDEND_SLEB, 0x10,
                                 BIND_OPCODE_DO_BIND,
                                 BIND_OPCODE_DONE};
  replace_binds(x86, image, stream);
  std::vector<ImportSlot> binds;
  EXPECT_FALSE(MachOParser::get_binds(x86, image, binds, error));
  EXPECT_NE(error.find("outside"), std::string::npos);

  // the last pointer-sized slot of the segment is still valid
  stream = {BIND_OPCODE_SET_SEGMENT_AND_OFFSET_ULEB | 2, 0xF8, 0x1F,
            BIND_OPCODE_SET_SYMBOL_TRAILING_FLAGS_IMM, '_', 'x', 0,
            BIND_OPCODE_DO_BIND, BIND_OPCODE_DONE};
  replace_binds(x86, image, stream);
  ASSERT_TRUE(MachOParser::get_binds(x86, image, binds, error)) << error;
  ASSERT_EQ(binds.size(), 1u);
  EXPECT_EQ(binds[0].address, DATA_ADDR + 0xFF8);
}

TEST(MachOParser, UnknownBindOpcodeFails) {
  TestImageLayout layout;
  layout.binds = {"_free"};
  std::vector<uint8_t> x86 = build_thin(layout);
  MachOImage image;
  std::string error;
  ASSERT_TRUE(MachOParser::parse_image(x86, image, error)) << error;

  // first opcode sets the dylib ordinal; replace it with an undefined one
  x86[image.dyld_info.bind_off] = 0xD0;
  std::vector<ImportSlot> binds;
  EXPECT_FALSE(MachOParser::get_binds(x86, image, binds, error));
}

TEST(MachOParser, Leb128) {
  const uint8_t uleb[] = {0xE5, 0x8E, 0x26};
  const uint8_t *p = uleb;
  uint64_t u = 0;
  ASSERT_TRUE(MachOParser::read_uleb128(p, uleb + sizeof(uleb), &u));
  EXPECT_EQ(u, 624485u);
  EXPECT_EQ(p, uleb + sizeof(uleb));

  const uint8_t sleb[] = {0xC0, 0xBB, 0x78};
  p = sleb;
  int64_t s = 0;
  ASSERT_TRUE(MachOParser::read_sleb128(p, sleb + sizeof(sleb), &s));
  EXPECT_EQ(s, -123456);

  const uint8_t truncated[] = {0x80, 0x80};
  p = truncated;
  EXPECT_FALSE(MachOParser::read_uleb128(p, truncated + sizeof(truncated), &u));
}
