#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

static const uint32_t FAT_MAGIC = 0xCAFEBABE;
static const uint32_t FAT_MAGIC_64 = 0xCAFEBABF;
static const uint32_t MH_MAGIC_64 = 0xFEEDFACF;

static const uint32_t CPU_ARCH_ABI64 = 0x01000000;
static const uint32_t CPU_TYPE_X86 = 7;
static const uint32_t CPU_TYPE_X86_64 = CPU_TYPE_X86 | CPU_ARCH_ABI64;
static const uint32_t CPU_TYPE_ARM = 12;
static const uint32_t CPU_TYPE_ARM64 = CPU_TYPE_ARM | CPU_ARCH_ABI64;

static const uint32_t LC_REQ_DYLD = 0x80000000;
static const uint32_t LC_SYMTAB = 0x2;
static const uint32_t LC_DYSYMTAB = 0xB;
static const uint32_t LC_SEGMENT_64 = 0x19;
static const uint32_t LC_DYLD_INFO = 0x22;
static const uint32_t LC_DYLD_INFO_ONLY = 0x22 | LC_REQ_DYLD;

static const uint32_t SECTION_TYPE = 0x000000FF;
static const uint32_t S_NON_LAZY_SYMBOL_POINTERS = 0x6;
static const uint32_t S_LAZY_SYMBOL_POINTERS = 0x7;

static const uint32_t INDIRECT_SYMBOL_LOCAL = 0x80000000;
static const uint32_t INDIRECT_SYMBOL_ABS = 0x40000000;

static const uint8_t BIND_OPCODE_MASK = 0xF0;
static const uint8_t BIND_IMMEDIATE_MASK = 0x0F;
static const uint8_t BIND_OPCODE_DONE = 0x00;
static const uint8_t BIND_OPCODE_SET_DYLIB_ORDINAL_IMM = 0x10;
static const uint8_t BIND_OPCODE_SET_DYLIB_ORDINAL_ULEB = 0x20;
static const uint8_t BIND_OPCODE_SET_DYLIB_SPECIAL_IMM = 0x30;
static const uint8_t BIND_OPCODE_SET_SYMBOL_TRAILING_FLAGS_IMM = 0x40;
static const uint8_t BIND_OPCODE_SET_TYPE_IMM = 0x50;
static const uint8_t BIND_OPCODE_SET_ADDEND_SLEB = 0x60;
static const uint8_t BIND_OPCODE_SET_SEGMENT_AND_OFFSET_ULEB = 0x70;
static const uint8_t BIND_OPCODE_ADD_ADDR_ULEB = 0x80;
static const uint8_t BIND_OPCODE_DO_BIND = 0x90;
static const uint8_t BIND_OPCODE_DO_BIND_ADD_ADDR_ULEB = 0xA0;
static const uint8_t BIND_OPCODE_DO_BIND_ADD_ADDR_IMM_SCALED = 0xB0;
static const uint8_t BIND_OPCODE_DO_BIND_ULEB_TIMES_SKIPPING_ULEB = 0xC0;

#pragma pack(push, 1)

// fat headers are stored big-endian
struct FatHeader {
  uint32_t magic;
  uint32_t nfat_arch;
};

struct FatArch {
  uint32_t cputype;
  uint32_t cpusubtype;
  uint32_t offset;
  uint32_t size;
  uint32_t align;
};

struct FatArch64 {
  uint32_t cputype;
  uint32_t cpusubtype;
  uint64_t offset;
  uint64_t size;
  uint32_t align;
  uint32_t reserved;
};

struct MachHeader64 {
  uint32_t magic;
  uint32_t cputype;
  uint32_t cpusubtype;
  uint32_t filetype;
  uint32_t ncmds;
  uint32_t sizeofcmds;
  uint32_t flags;
  uint32_t reserved;
};

struct LoadCommand {
  uint32_t cmd;
  uint32_t cmdsize;
};

struct SegmentCommand64 {
  uint32_t cmd;
  uint32_t cmdsize;
  char segname[16];
  uint64_t vmaddr;
  uint64_t vmsize;
  uint64_t fileoff;
  uint64_t filesize;
  uint32_t maxprot;
  uint32_t initprot;
  uint32_t nsects;
  uint32_t flags;
};

struct Section64 {
  char sectname[16];
  char segname[16];
  uint64_t addr;
  uint64_t size;
  uint32_t offset;
  uint32_t align;
  uint32_t reloff;
  uint32_t nreloc;
  uint32_t flags;
  uint32_t reserved1;
  uint32_t reserved2;
  uint32_t reserved3;
};

struct SymtabCommand {
  uint32_t cmd;
  uint32_t cmdsize;
  uint32_t symoff;
  uint32_t nsyms;
  uint32_t stroff;
  uint32_t strsize;
};

struct DysymtabCommand {
  uint32_t cmd;
  uint32_t cmdsize;
  uint32_t ilocalsym;
  uint32_t nlocalsym;
  uint32_t iextdefsym;
  uint32_t nextdefsym;
  uint32_t iundefsym;
  uint32_t nundefsym;
  uint32_t tocoff;
  uint32_t ntoc;
  uint32_t modtaboff;
  uint32_t nmodtab;
  uint32_t extrefsymoff;
  uint32_t nextrefsyms;
  uint32_t indirectsymoff;
  uint32_t nindirectsyms;
  uint32_t extreloff;
  uint32_t nextrel;
  uint32_t locreloff;
  uint32_t nlocrel;
};

struct DyldInfoCommand {
  uint32_t cmd;
  uint32_t cmdsize;
  uint32_t rebase_off;
  uint32_t rebase_size;
  uint32_t bind_off;
  uint32_t bind_size;
  uint32_t weak_bind_off;
  uint32_t weak_bind_size;
  uint32_t lazy_bind_off;
  uint32_t lazy_bind_size;
  uint32_t export_off;
  uint32_t export_size;
};

struct Nlist64 {
  uint32_t n_strx;
  uint8_t n_type;
  uint8_t n_sect;
  uint16_t n_desc;
  uint64_t n_value;
};

#pragma pack(pop)

struct FatSlice {
  uint32_t cputype;
  uint32_t cpusubtype;
  uint64_t offset;
  uint64_t size;
};

struct MachOSection {
  std::string name;
  std::string segment;
  uint64_t addr;
  uint64_t size;
  uint32_t type;
  uint32_t indirect_index;
};

struct MachOSegment {
  std::string name;
  uint64_t vmaddr;
  uint64_t vmsize;
  uint64_t fileoff;
  uint64_t filesize;
  uint32_t initprot;
  std::vector<MachOSection> sections;
};

struct MachOImage {
  uint32_t cputype;
  std::vector<MachOSegment> segments;
  bool has_symtab;
  SymtabCommand symtab;
  bool has_dysymtab;
  DysymtabCommand dysymtab;
  bool has_dyld_info;
  DyldInfoCommand dyld_info;
};

// A pointer-sized slot the binary loads an imported symbol's address from.
struct ImportSlot {
  uint64_t address;
  std::string symbol;
  int64_t addend = 0; // bound value is the symbol's address plus this
};

class MachOParser {
public:
  static bool is_fat(const std::vector<uint8_t> &data);
  static bool is_macho64(const std::vector<uint8_t> &data);
  static std::string cpu_name(uint32_t cputype);

  static bool get_fat_slices(const std::vector<uint8_t> &data,
                             std::vector<FatSlice> &slices,
                             std::string &error);
  static bool get_arch_slice(const std::vector<uint8_t> &data,
                             uint32_t cputype, std::vector<uint8_t> &slice,
                             std::string &error);

  static bool parse_image(const std::vector<uint8_t> &slice, MachOImage &image,
                          std::string &error);
  static std::vector<ImportSlot>
  get_indirect_imports(const std::vector<uint8_t> &slice,
                       const MachOImage &image);
  static bool get_binds(const std::vector<uint8_t> &slice,
                        const MachOImage &image,
                        std::vector<ImportSlot> &binds, std::string &error);

  static bool read_uleb128(const uint8_t *&p, const uint8_t *end,
                           uint64_t *value);
  static bool read_sleb128(const uint8_t *&p, const uint8_t *end,
                           int64_t *value);

private:
  static std::string symbol_name(const std::vector<uint8_t> &slice,
                                 const MachOImage &image, uint32_t index);
};
