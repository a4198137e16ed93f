#include "macho.h"
#include "util.h"
#include <cstring>
#include <endian.h>

static std::string fixed_name(const char *name, size_t max_len) {
  size_t len = strnlen(name, max_len);
  return std::string(name, len);
}

bool MachOParser::is_fat(const std::vector<uint8_t> &data) {
  if (data.size() < sizeof(FatHeader))
    return false;
  uint32_t magic;
  memcpy(&magic, data.data(), 4);
  magic = be32toh(magic);
  return magic == FAT_MAGIC || magic == FAT_MAGIC_64;
}

bool MachOParser::is_macho64(const std::vector<uint8_t> &data) {
  if (data.size() < sizeof(MachHeader64))
    return false;
  uint32_t magic;
  memcpy(&magic, data.data(), 4);
  return le32toh(magic) == MH_MAGIC_64;
}

std::string MachOParser::cpu_name(uint32_t cputype) {
  switch (cputype) {
  case CPU_TYPE_X86:
    return "i386";
  case CPU_TYPE_X86_64:
    return "x86_64";
  case CPU_TYPE_ARM:
    return "arm";
  case CPU_TYPE_ARM64:
    return "arm64";
  default:
    return Utils::hex(cputype);
  }
}

bool MachOParser::get_fat_slices(const std::vector<uint8_t> &data,
                                 std::vector<FatSlice> &slices,
                                 std::string &error) {
  slices.clear();
  if (!is_fat(data)) {
    error = "not a universal binary";
    return false;
  }

  FatHeader hdr;
  memcpy(&hdr, data.data(), sizeof(hdr));
  bool wide = be32toh(hdr.magic) == FAT_MAGIC_64;
  uint32_t count = be32toh(hdr.nfat_arch);
  size_t entry_size = wide ? sizeof(FatArch64) : sizeof(FatArch);

  if (sizeof(FatHeader) + (uint64_t)count * entry_size > data.size()) {
    error = "fat arch table truncated (" + std::to_string(count) + " entries)";
    return false;
  }

  for (uint32_t i = 0; i < count; i++) {
    size_t off = sizeof(FatHeader) + i * entry_size;
    FatSlice s;
    if (wide) {
      FatArch64 arch;
      memcpy(&arch, data.data() + off, sizeof(arch));
      s.cputype = be32toh(arch.cputype);
      s.cpusubtype = be32toh(arch.cpusubtype);
      s.offset = be64toh(arch.offset);
      s.size = be64toh(arch.size);
    } else {
      FatArch arch;
      memcpy(&arch, data.data() + off, sizeof(arch));
      s.cputype = be32toh(arch.cputype);
      s.cpusubtype = be32toh(arch.cpusubtype);
      s.offset = be32toh(arch.offset);
      s.size = be32toh(arch.size);
    }
    if (s.offset > data.size() || s.size > data.size() - s.offset) {
      error = "slice " + cpu_name(s.cputype) + " at " + Utils::hex(s.offset) +
              " size " + Utils::hex(s.size) + " exceeds file";
      return false;
    }
    slices.push_back(s);
  }
  return true;
}

bool MachOParser::get_arch_slice(const std::vector<uint8_t> &data,
                                 uint32_t cputype, std::vector<uint8_t> &slice,
                                 std::string &error) {
  if (is_macho64(data)) {
    MachHeader64 hdr;
    memcpy(&hdr, data.data(), sizeof(hdr));
    if (le32toh(hdr.cputype) != cputype) {
      error = "thin binary is " + cpu_name(le32toh(hdr.cputype)) + ", not " +
              cpu_name(cputype);
      return false;
    }
    slice = data;
    return true;
  }

  std::vector<FatSlice> slices;
  if (!get_fat_slices(data, slices, error))
    return false;

  for (const auto &s : slices) {
    if (s.cputype != cputype)
      continue;
    slice.assign(data.begin() + s.offset, data.begin() + s.offset + s.size);
    return true;
  }
  error = "no " + cpu_name(cputype) + " slice in universal binary";
  return false;
}

bool MachOParser::parse_image(const std::vector<uint8_t> &slice,
                              MachOImage &image, std::string &error) {
  image = MachOImage{};
  if (!is_macho64(slice)) {
    error = "not a 64-bit Mach-O image";
    return false;
  }

  MachHeader64 hdr;
  memcpy(&hdr, slice.data(), sizeof(hdr));
  image.cputype = le32toh(hdr.cputype);

  uint64_t cmd_end = sizeof(MachHeader64) + (uint64_t)hdr.sizeofcmds;
  if (cmd_end > slice.size()) {
    error = "load commands exceed image";
    return false;
  }

  size_t off = sizeof(MachHeader64);
  for (uint32_t i = 0; i < hdr.ncmds; i++) {
    if (off + sizeof(LoadCommand) > cmd_end) {
      error = "load command " + std::to_string(i) + " truncated";
      return false;
    }
    LoadCommand lc;
    memcpy(&lc, slice.data() + off, sizeof(lc));
    if (lc.cmdsize < sizeof(LoadCommand) || off + lc.cmdsize > cmd_end) {
      error = "load command " + std::to_string(i) + " has bad size";
      return false;
    }

    if (lc.cmd == LC_SEGMENT_64) {
      if (lc.cmdsize < sizeof(SegmentCommand64)) {
        error = "segment command truncated";
        return false;
      }
      SegmentCommand64 seg;
      memcpy(&seg, slice.data() + off, sizeof(seg));
      if (sizeof(SegmentCommand64) + (uint64_t)seg.nsects * sizeof(Section64) >
          lc.cmdsize) {
        error = "segment " + fixed_name(seg.segname, 16) +
                " section table truncated";
        return false;
      }
      if (seg.filesize > 0 && (seg.fileoff > slice.size() ||
                               seg.filesize > slice.size() - seg.fileoff)) {
        error = "segment " + fixed_name(seg.segname, 16) + " exceeds image";
        return false;
      }

      MachOSegment s;
      s.name = fixed_name(seg.segname, 16);
      s.vmaddr = seg.vmaddr;
      s.vmsize = seg.vmsize;
      s.fileoff = seg.fileoff;
      s.filesize = seg.filesize;
      s.initprot = seg.initprot;
      for (uint32_t j = 0; j < seg.nsects; j++) {
        Section64 sect;
        memcpy(&sect,
               slice.data() + off + sizeof(SegmentCommand64) +
                   j * sizeof(Section64),
               sizeof(sect));
        MachOSection ms;
        ms.name = fixed_name(sect.sectname, 16);
        ms.segment = fixed_name(sect.segname, 16);
        ms.addr = sect.addr;
        ms.size = sect.size;
        ms.type = sect.flags & SECTION_TYPE;
        ms.indirect_index = sect.reserved1;
        s.sections.push_back(ms);
      }
      image.segments.push_back(s);
    } else if (lc.cmd == LC_SYMTAB) {
      if (lc.cmdsize < sizeof(SymtabCommand)) {
        error = "symtab command truncated";
        return false;
      }
      memcpy(&image.symtab, slice.data() + off, sizeof(SymtabCommand));
      if ((uint64_t)image.symtab.symoff +
                  (uint64_t)image.symtab.nsyms * sizeof(Nlist64) >
              slice.size() ||
          (uint64_t)image.symtab.stroff + image.symtab.strsize >
              slice.size()) {
        error = "symbol table exceeds image";
        return false;
      }
      image.has_symtab = true;
    } else if (lc.cmd == LC_DYSYMTAB) {
      if (lc.cmdsize < sizeof(DysymtabCommand)) {
        error = "dysymtab command truncated";
        return false;
      }
      memcpy(&image.dysymtab, slice.data() + off, sizeof(DysymtabCommand));
      if ((uint64_t)image.dysymtab.indirectsymoff +
              (uint64_t)image.dysymtab.nindirectsyms * 4 >
          slice.size()) {
        error = "indirect symbol table exceeds image";
        return false;
      }
      image.has_dysymtab = true;
    } else if (lc.cmd == LC_DYLD_INFO || lc.cmd == LC_DYLD_INFO_ONLY) {
      if (lc.cmdsize < sizeof(DyldInfoCommand)) {
        error = "dyld info command truncated";
        return false;
      }
      memcpy(&image.dyld_info, slice.data() + off, sizeof(DyldInfoCommand));
      if ((uint64_t)image.dyld_info.bind_off + image.dyld_info.bind_size >
          slice.size()) {
        error = "bind opcodes exceed image";
        return false;
      }
      image.has_dyld_info = true;
    }
    off += lc.cmdsize;
  }

  if (image.segments.empty()) {
    error = "image has no segments";
    return false;
  }
  return true;
}

std::string MachOParser::symbol_name(const std::vector<uint8_t> &slice,
                                     const MachOImage &image, uint32_t index) {
  if (!image.has_symtab || index >= image.symtab.nsyms)
    return "";
  Nlist64 sym;
  memcpy(&sym, slice.data() + image.symtab.symoff + index * sizeof(Nlist64),
         sizeof(sym));
  if (sym.n_strx >= image.symtab.strsize)
    return "";
  const char *base =
      reinterpret_cast<const char *>(slice.data() + image.symtab.stroff);
  return fixed_name(base + sym.n_strx, image.symtab.strsize - sym.n_strx);
}

std::vector<ImportSlot>
MachOParser::get_indirect_imports(const std::vector<uint8_t> &slice,
                                  const MachOImage &image) {
  std::vector<ImportSlot> slots;
  if (!image.has_dysymtab || !image.has_symtab)
    return slots;

  const uint8_t *table = slice.data() + image.dysymtab.indirectsymoff;
  for (const auto &seg : image.segments) {
    for (const auto &sect : seg.sections) {
      if (sect.type != S_NON_LAZY_SYMBOL_POINTERS &&
          sect.type != S_LAZY_SYMBOL_POINTERS)
        continue;
      uint64_t count = sect.size / 8;
      for (uint64_t i = 0; i < count; i++) {
        uint64_t idx = sect.indirect_index + i;
        if (idx >= image.dysymtab.nindirectsyms)
          break;
        uint32_t sym_index;
        memcpy(&sym_index, table + idx * 4, 4);
        if (sym_index & (INDIRECT_SYMBOL_LOCAL | INDIRECT_SYMBOL_ABS))
          continue;
        std::string name = symbol_name(slice, image, sym_index);
        if (name.empty())
          continue;
        slots.push_back({sect.addr + i * 8, name});
      }
    }
  }
  return slots;
}

bool MachOParser::read_uleb128(const uint8_t *&p, const uint8_t *end,
                               uint64_t *value) {
  uint64_t result = 0;
  int shift = 0;
  uint8_t byte;
  do {
    if (p >= end || shift > 63)
      return false;
    byte = *p++;
    result |= (uint64_t)(byte & 0x7F) << shift;
    shift += 7;
  } while (byte & 0x80);
  *value = result;
  return true;
}

bool MachOParser::read_sleb128(const uint8_t *&p, const uint8_t *end,
                               int64_t *value) {
  int64_t result = 0;
  int shift = 0;
  uint8_t byte;
  do {
    if (p >= end || shift > 63)
      return false;
    byte = *p++;
    result |= (int64_t)(byte & 0x7F) << shift;
    shift += 7;
  } while (byte & 0x80);
  if ((shift < 64) && (byte & 0x40))
    result |= -((int64_t)1 << shift);
  *value = result;
  return true;
}

bool MachOParser::get_binds(const std::vector<uint8_t> &slice,
                            const MachOImage &image,
                            std::vector<ImportSlot> &binds,
                            std::string &error) {
  binds.clear();
  if (!image.has_dyld_info || image.dyld_info.bind_size == 0)
    return true;

  const uint8_t *p = slice.data() + image.dyld_info.bind_off;
  const uint8_t *end = p + image.dyld_info.bind_size;
  std::string symbol;
  uint64_t seg_index = 0;
  uint64_t seg_offset = 0;
  bool seg_set = false;
  uint64_t uval = 0;
  int64_t sval = 0;

  auto emit = [&]() -> bool {
    if (!seg_set || seg_index >= image.segments.size()) {
      error = "bind for " + symbol + " has no valid segment";
      return false;
    }
    const MachOSegment &seg = image.segments[seg_index];
    if (seg.vmsize < 8 || seg_offset > seg.vmsize - 8) {
      error = "bind for " + symbol + " at " + seg.name + "+" +
              Utils::hex(seg_offset) + " lies outside the segment";
      return false;
    }
    ImportSlot slot;
    slot.address = seg.vmaddr + seg_offset;
    slot.symbol = symbol;
    slot.addend = sval;
    binds.push_back(slot);
    return true;
  };

  while (p < end) {
    uint8_t immediate = *p & BIND_IMMEDIATE_MASK;
    uint8_t opcode = *p & BIND_OPCODE_MASK;
    p++;
    switch (opcode) {
    case BIND_OPCODE_DONE:
      return true;
    case BIND_OPCODE_SET_DYLIB_ORDINAL_IMM:
    case BIND_OPCODE_SET_DYLIB_SPECIAL_IMM:
    case BIND_OPCODE_SET_TYPE_IMM:
      break;
    case BIND_OPCODE_SET_DYLIB_ORDINAL_ULEB:
      if (!read_uleb128(p, end, &uval)) {
        error = "truncated dylib ordinal";
        return false;
      }
      break;
    case BIND_OPCODE_SET_SYMBOL_TRAILING_FLAGS_IMM: {
      const uint8_t *start = p;
      while (p < end && *p != 0)
        p++;
      if (p >= end) {
        error = "unterminated bind symbol name";
        return false;
      }
      symbol.assign(reinterpret_cast<const char *>(start), p - start);
      p++;
      break;
    }
    case BIND_OPCODE_SET_ADDEND_SLEB:
      if (!read_sleb128(p, end, &sval)) {
        error = "truncated addend";
        return false;
      }
      break;
    case BIND_OPCODE_SET_SEGMENT_AND_OFFSET_ULEB:
      seg_index = immediate;
      if (!read_uleb128(p, end, &seg_offset)) {
        error = "truncated segment offset";
        return false;
      }
      seg_set = true;
      break;
    case BIND_OPCODE_ADD_ADDR_ULEB:
      if (!read_uleb128(p, end, &uval)) {
        error = "truncated address delta";
        return false;
      }
      seg_offset += uval;
      break;
    case BIND_OPCODE_DO_BIND:
      if (!emit())
        return false;
      seg_offset += 8;
      break;
    case BIND_OPCODE_DO_BIND_ADD_ADDR_ULEB:
      if (!emit())
        return false;
      if (!read_uleb128(p, end, &uval)) {
        error = "truncated address delta";
        return false;
      }
      seg_offset += uval + 8;
      break;
    case BIND_OPCODE_DO_BIND_ADD_ADDR_IMM_SCALED:
      if (!emit())
        return false;
      seg_offset += (uint64_t)immediate * 8 + 8;
      break;
    case BIND_OPCODE_DO_BIND_ULEB_TIMES_SKIPPING_ULEB: {
      uint64_t count = 0;
      uint64_t skip = 0;
      if (!read_uleb128(p, end, &count) || !read_uleb128(p, end, &skip)) {
        error = "truncated bind repeat";
        return false;
      }
      for (uint64_t i = 0; i < count; i++) {
        if (!emit())
          return false;
        seg_offset += skip + 8;
      }
      break;
    }
    default:
      error = "bad bind opcode " + Utils::hex(opcode);
      return false;
    }
  }
  return true;
}
