#include "elf_builder.h"

#include <libelf.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstring>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace bpfld {
namespace test {

namespace {

constexpr uint32_t reloc_64_64 = 1;
constexpr uint32_t reloc_64_abs64 = 2;

struct strtab {
  std::vector<unsigned char> buf{0};

  uint32_t add(const std::string &str) {
    uint32_t off = buf.size();
    buf.insert(buf.end(), str.begin(), str.end());
    buf.push_back(0);
    return off;
  }
};

template <typename T>
void append(std::vector<unsigned char> &buf, const T &val) {
  auto p = reinterpret_cast<const unsigned char *>(&val);
  buf.insert(buf.end(), p, p + sizeof(T));
}

struct scn_desc {
  std::string name;
  uint32_t type;
  uint64_t flags;
  uint64_t align;
  uint64_t entsize;
  std::vector<unsigned char> data;
  // section names resolved to indices once all sections are known
  std::string link;
  std::string info;
};

struct elf_del {
  void operator()(Elf *ep) const { elf_end(ep); }
};

} // namespace

std::vector<bpf_insn> pass_program() {
  return {insn_mov64_imm(BPF_REG_0, 2), insn_exit()};
}

std::vector<bpf_insn> counter_program() {
  return {
      insn_st_w(BPF_REG_10, -4, 0),
      insn_mov64_reg(BPF_REG_2, BPF_REG_10),
      insn_add64_imm(BPF_REG_2, -4),
      insn_ld_imm64_lo(BPF_REG_1, 0),
      insn_ld_imm64_hi(),
      insn_call(BPF_FUNC_map_lookup_elem),
      insn_jeq_imm(BPF_REG_0, 0, 2),
      insn_mov64_imm(BPF_REG_1, 1),
      insn_xadd_dw(BPF_REG_0, BPF_REG_1, 0),
      insn_mov64_imm(BPF_REG_0, 2),
      insn_exit(),
  };
}

std::vector<bpf_insn> tail_call_program() {
  return {
      insn_ld_imm64_lo(BPF_REG_2, 0),
      insn_ld_imm64_hi(),
      insn_mov64_imm(BPF_REG_3, 0),
      insn_call(BPF_FUNC_tail_call),
      insn_mov64_imm(BPF_REG_0, 2),
      insn_exit(),
  };
}

elf_builder::elf_builder() : license_("GPL"), machine_(EM_BPF) {}

elf_builder &elf_builder::add_map(map_spec spec) {
  maps_.push_back(std::move(spec));
  return *this;
}

elf_builder &elf_builder::add_program(prog_spec spec) {
  progs_.push_back(std::move(spec));
  return *this;
}

elf_builder &elf_builder::add_raw_reloc(raw_reloc reloc) {
  raw_relocs_.push_back(std::move(reloc));
  return *this;
}

elf_builder &elf_builder::license(std::string lic) {
  license_ = std::move(lic);
  return *this;
}

elf_builder &elf_builder::no_license() {
  license_.reset();
  return *this;
}

elf_builder &elf_builder::version(uint32_t ver) {
  version_ = ver;
  return *this;
}

elf_builder &elf_builder::machine(uint16_t mach) {
  machine_ = mach;
  return *this;
}

std::vector<unsigned char> elf_builder::build() const {
  std::vector<scn_desc> scns;
  std::vector<std::string> prog_scn_names;
  std::map<std::string, std::vector<const prog_spec *>> by_scn;

  for (const auto &p : progs_) {
    if (!by_scn.contains(p.section))
      prog_scn_names.push_back(p.section);
    by_scn[p.section].push_back(&p);
  }

  std::map<std::string, uint32_t> map_off;
  for (size_t i = 0; i < maps_.size(); i++)
    map_off[maps_[i].name] = i * 40;

  std::string pin_data;
  std::map<std::string, uint32_t> pin_off;
  for (const auto &m : maps_) {
    if (!m.pin_path.empty()) {
      pin_off[m.name] = pin_data.size();
      pin_data += m.pin_path;
      pin_data.push_back('\0');
    }
  }

  // Section layout, index 0 is the null section
  scns.push_back({".strtab", SHT_STRTAB, 0, 1, 0, {}, {}, {}});
  for (const auto &name : prog_scn_names) {
    scns.push_back({name, SHT_PROGBITS, SHF_ALLOC | SHF_EXECINSTR, 8, 0, {},
                    {}, {}});
    scns.push_back({".rel" + name, SHT_REL, 0, 8, sizeof(Elf64_Rel), {},
                    ".symtab", name});
  }
  for (const auto &r : raw_relocs_) {
    bool known = false;
    for (const auto &s : scns)
      known |= s.name == ".rel" + r.section;
    if (!known)
      scns.push_back({".rel" + r.section, SHT_REL, 0, 8, sizeof(Elf64_Rel),
                      {}, ".symtab", r.section});
  }
  if (!maps_.empty()) {
    scns.push_back({"maps", SHT_PROGBITS, SHF_ALLOC | SHF_WRITE, 8, 0, {}, {},
                    {}});
    scns.push_back({".relmaps", SHT_REL, 0, 8, sizeof(Elf64_Rel), {},
                    ".symtab", "maps"});
  }
  if (!pin_data.empty())
    scns.push_back({".rodata.str1.1", SHT_PROGBITS, SHF_ALLOC | SHF_MERGE |
                    SHF_STRINGS, 1, 1, {}, {}, {}});
  if (license_)
    scns.push_back({"license", SHT_PROGBITS, SHF_ALLOC | SHF_WRITE, 1, 0, {},
                    {}, {}});
  if (version_)
    scns.push_back({"version", SHT_PROGBITS, SHF_ALLOC | SHF_WRITE, 4, 0, {},
                    {}, {}});
  scns.push_back({".symtab", SHT_SYMTAB, 0, 8, sizeof(Elf64_Sym), {},
                  ".strtab", {}});

  auto index_of = [&](const std::string &name) -> uint32_t {
    for (size_t i = 0; i < scns.size(); i++) {
      if (scns[i].name == name)
        return i + 1;
    }
    return 0;
  };

  auto scn_of = [&](const std::string &name) -> scn_desc & {
    return scns[index_of(name) - 1];
  };

  // Symbols: null, local section symbols, then globals
  strtab strs;
  std::vector<Elf64_Sym> syms(1);
  std::map<std::string, uint32_t> sym_idx;

  if (!pin_data.empty()) {
    Elf64_Sym sym = {};
    sym.st_info = ELF64_ST_INFO(STB_LOCAL, STT_SECTION);
    sym.st_shndx = index_of(".rodata.str1.1");
    sym_idx[".rodata.str1.1"] = syms.size();
    syms.push_back(sym);
  }
  if (!maps_.empty()) {
    Elf64_Sym sym = {};
    sym.st_info = ELF64_ST_INFO(STB_LOCAL, STT_SECTION);
    sym.st_shndx = index_of("maps");
    sym_idx["maps"] = syms.size();
    syms.push_back(sym);
  }
  uint32_t first_global = syms.size();

  for (const auto &m : maps_) {
    Elf64_Sym sym = {};
    sym.st_name = strs.add(m.name);
    sym.st_info = ELF64_ST_INFO(STB_GLOBAL, STT_OBJECT);
    sym.st_shndx = index_of("maps");
    sym.st_value = map_off[m.name];
    sym.st_size = m.sym_size;
    sym_idx[m.name] = syms.size();
    syms.push_back(sym);
  }

  for (const auto &name : prog_scn_names) {
    auto &code = scn_of(name).data;
    auto &rel = scn_of(".rel" + name).data;

    for (const prog_spec *p : by_scn[name]) {
      Elf64_Sym sym = {};
      sym.st_name = strs.add(p->name);
      sym.st_info = ELF64_ST_INFO(STB_GLOBAL, STT_FUNC);
      sym.st_shndx = index_of(name);
      sym.st_value = code.size();
      sym.st_size = p->insns.size() * sizeof(bpf_insn);
      sym_idx[p->name] = syms.size();
      syms.push_back(sym);

      for (const auto &[idx, map_name] : p->map_refs) {
        Elf64_Rel r = {};
        r.r_offset = sym.st_value + idx * sizeof(bpf_insn);
        r.r_info = ELF64_R_INFO(sym_idx.at(map_name), reloc_64_64);
        append(rel, r);
      }

      for (const auto &insn : p->insns)
        append(code, insn);
    }
  }

  for (const auto &r : raw_relocs_) {
    Elf64_Rel rel = {};
    rel.r_offset = r.offset;
    rel.r_info = ELF64_R_INFO(r.sym_index ? *r.sym_index : sym_idx.at(r.symbol),
                              r.type);
    append(scn_of(".rel" + r.section).data, rel);
  }

  if (!maps_.empty()) {
    auto &data = scn_of("maps").data;
    auto &rel = scn_of(".relmaps").data;

    for (const auto &m : maps_) {
      uint32_t base = data.size();
      append(data, m.type);
      append(data, m.key_size);
      append(data, m.value_size);
      append(data, m.max_entries);
      append(data, m.flags);
      append(data, uint32_t(0));
      // inner_map_def, resolved against the inner map symbol
      append(data, uint64_t(0));
      // persistent_path, section symbol plus the offset as addend
      append(data, uint64_t(m.pin_path.empty() ? 0 : pin_off[m.name]));

      if (!m.inner.empty()) {
        Elf64_Rel r = {};
        r.r_offset = base + 24;
        r.r_info = ELF64_R_INFO(sym_idx.at(m.inner), reloc_64_abs64);
        append(rel, r);
      }
      if (!m.pin_path.empty()) {
        Elf64_Rel r = {};
        r.r_offset = base + 32;
        r.r_info = ELF64_R_INFO(sym_idx.at(".rodata.str1.1"), reloc_64_abs64);
        append(rel, r);
      }
    }
  }

  if (!pin_data.empty())
    scn_of(".rodata.str1.1").data.assign(pin_data.begin(), pin_data.end());

  if (license_) {
    auto &data = scn_of("license").data;
    data.assign(license_->begin(), license_->end());
    data.push_back(0);
  }

  if (version_)
    append(scn_of("version").data, *version_);

  for (const auto &s : syms)
    append(scn_of(".symtab").data, s);

  // Section names share .strtab with the symbol names
  std::vector<uint32_t> name_off;
  for (const auto &s : scns)
    name_off.push_back(strs.add(s.name));
  scns[0].data = strs.buf;

  if (elf_version(EV_CURRENT) == EV_NONE)
    throw std::runtime_error("failed to init libelf");

  int fd = memfd_create("bpfld-test-elf", 0);
  if (fd < 0)
    throw std::system_error(errno, std::system_category(), "memfd_create");

  {
    std::unique_ptr<Elf, elf_del> elf(elf_begin(fd, ELF_C_WRITE, nullptr));
    if (!elf)
      throw std::runtime_error(elf_errmsg(-1));

    Elf64_Ehdr *eh = elf64_newehdr(elf.get());
    eh->e_ident[EI_DATA] = ELFDATA2LSB;
    eh->e_machine = machine_;
    eh->e_type = ET_REL;
    eh->e_version = EV_CURRENT;
    eh->e_shstrndx = index_of(".strtab");

    for (size_t i = 0; i < scns.size(); i++) {
      const auto &s = scns[i];
      Elf_Scn *scn = elf_newscn(elf.get());
      Elf_Data *data = elf_newdata(scn);
      data->d_buf = const_cast<unsigned char *>(s.data.data());
      data->d_size = s.data.size();
      data->d_type = ELF_T_BYTE;
      data->d_align = s.align;
      data->d_version = EV_CURRENT;

      Elf64_Shdr *sh = elf64_getshdr(scn);
      sh->sh_name = name_off[i];
      sh->sh_type = s.type;
      sh->sh_flags = s.flags;
      sh->sh_addralign = s.align;
      sh->sh_entsize = s.entsize;
      if (!s.link.empty())
        sh->sh_link = index_of(s.link);
      if (!s.info.empty())
        sh->sh_info = index_of(s.info);
      if (s.type == SHT_SYMTAB)
        sh->sh_info = first_global;
    }

    if (elf_update(elf.get(), ELF_C_WRITE) < 0) {
      close(fd);
      throw std::runtime_error(elf_errmsg(-1));
    }
  }

  struct stat st;
  if (fstat(fd, &st) < 0) {
    close(fd);
    throw std::system_error(errno, std::system_category(), "fstat");
  }

  std::vector<unsigned char> out(st.st_size);
  if (pread(fd, out.data(), out.size(), 0) != st.st_size) {
    close(fd);
    throw std::runtime_error("short read of generated object");
  }

  close(fd);
  return out;
}

void elf_builder::write(const std::string &path) const {
  auto bytes = build();
  std::ofstream out(path, std::ios::out | std::ios::binary);
  out.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  if (!out)
    throw std::runtime_error("failed to write " + path);
}

elf_builder xdp_fixture(const std::string &pin_dir) {
  elf_builder b;

  b.license("GPLv2");
  b.add_map({"txcnt", BPF_MAP_TYPE_PERCPU_ARRAY, 4, 8, 100, 0, {},
             pin_dir + "/txcnt"});
  b.add_map({"rxcnt", BPF_MAP_TYPE_HASH, 8, 4, 50});
  b.add_map({"match_maps_tx", BPF_MAP_TYPE_ARRAY_OF_MAPS, 4, 4, 10, 0,
             "array_map"});
  b.add_map({"match_maps_rx", BPF_MAP_TYPE_HASH_OF_MAPS, 4, 4, 20, 0,
             "array_map", pin_dir + "/match_maps_rx"});
  b.add_map({"programs", BPF_MAP_TYPE_PROG_ARRAY, 4, 4, 2});
  b.add_map({"array_map", BPF_MAP_TYPE_ARRAY, 4, 8, 10});

  b.add_program({"xdp0", "xdp", counter_program(), {{3, "array_map"}}});
  b.add_program({"xdp1", "xdp", counter_program(), {{3, "txcnt"}}});
  b.add_program({"xdp_head_meta2", "xdp/head", pass_program(), {}});
  b.add_program({"xdp_root3", "xdp/root", tail_call_program(),
                 {{0, "programs"}}});

  return b;
}

} // namespace test
} // namespace bpfld
