#include <libelf.h>
#include <linux/bpf.h>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal.h"
#include "libbpfld.h"
#include "sec_defs.h"

using namespace std::literals::string_literals;

namespace bpfld {

namespace { // begin anonymous namespace

// Relocation types of the BPF backend
constexpr uint32_t reloc_64_64 = 1;
constexpr uint32_t reloc_64_abs64 = 2;

// This struct is POD, meaning the C++ standard guarantees the same memory
// layout as that of the equivalent C struct emitted into "maps"
struct raw_map_def {
  uint32_t map_type;
  uint32_t key_size;
  uint32_t value_size;
  uint32_t max_entries;
  uint32_t map_flags;
  uint32_t pad;
  uint64_t inner_map_def;
  uint64_t persistent_path;
};

static_assert(sizeof(raw_map_def) == 40);
static_assert(offsetof(raw_map_def, inner_map_def) == 24);
static_assert(offsetof(raw_map_def, persistent_path) == 32);

struct map_entry {
  std::string name;
  raw_map_def raw;
  std::optional<Elf64_Addr> inner_off;
  std::string pin_path;
};

std::string hex(uint64_t val) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%#llx", static_cast<unsigned long long>(val));
  return buf;
}

class elf_parser {
  struct elf_del {
    [[gnu::always_inline]] void operator()(Elf *ep) const { elf_end(ep); }
  };

  // libelf reads straight out of this buffer, it must outlive elf
  std::vector<unsigned char> buf;
  std::unique_ptr<Elf, elf_del> elf;

  size_t shstrndx;
  Elf_Scn *symtab_scn;
  Elf_Scn *maps_scn;
  Elf_Scn *license_scn;
  Elf_Scn *version_scn;
  std::vector<Elf_Scn *> prog_scns;
  std::vector<Elf_Scn *> rel_scns;

  const Elf64_Sym *syms;
  size_t nr_syms;
  size_t strtabidx;

  // keyed by offset into "maps", which is also the file order
  std::map<Elf64_Addr, map_entry> map_entries;
  elf_object obj;

  result<void> parse_ehdr();
  result<void> parse_scns();
  result<void> parse_symtab();
  result<void> parse_license();
  result<void> parse_maps();
  result<void> parse_map_relocs();
  result<void> build_maps();
  result<void> parse_progs();
  result<void> parse_prog_relocs(Elf_Scn *scn, const Elf64_Shdr *sh,
                                 const char *scn_name,
                                 std::vector<prog_def> &progs,
                                 std::vector<Elf64_Off> &starts);

  const char *scn_name(Elf_Scn *scn) const {
    Elf64_Shdr *sh = elf64_getshdr(scn);
    return sh ? elf_strptr(elf.get(), shstrndx, sh->sh_name) : nullptr;
  }

  const char *sym_name(const Elf64_Sym &sym) const {
    return elf_strptr(elf.get(), strtabidx, sym.st_name);
  }

  size_t maps_shndx() const { return maps_scn ? elf_ndxscn(maps_scn) : 0; }

public:
  elf_parser() = delete;
  explicit elf_parser(std::span<const unsigned char> data)
      : buf(data.begin(), data.end()), shstrndx(0), symtab_scn(nullptr),
        maps_scn(nullptr), license_scn(nullptr), version_scn(nullptr),
        syms(nullptr), nr_syms(0), strtabidx(0) {}

  elf_parser(const elf_parser &) = delete;
  elf_parser &operator=(const elf_parser &) = delete;

  result<elf_object> parse();
};

result<void> elf_parser::parse_ehdr() {
  if (elf_version(EV_CURRENT) == EV_NONE)
    return fail(errc::format_error, "elf: failed to init libelf");

  elf.reset(elf_memory(reinterpret_cast<char *>(buf.data()), buf.size()));
  if (!elf)
    return fail(errc::format_error, "elf: "s + elf_errmsg(-1));

  if (elf_kind(elf.get()) != ELF_K_ELF)
    return fail(errc::format_error, "elf: not an ELF object");

  Elf64_Ehdr *eh = elf64_getehdr(elf.get());
  if (!eh)
    return fail(errc::format_error,
                "elf: not a 64-bit object: "s + elf_errmsg(-1));

  unsigned char native = std::endian::native == std::endian::little
                             ? ELFDATA2LSB
                             : ELFDATA2MSB;
  if (eh->e_ident[EI_DATA] != native)
    return fail(errc::format_error, "elf: foreign byte order");

  if (eh->e_machine != EM_BPF)
    return fail(errc::format_error,
                "elf: unexpected machine " + std::to_string(eh->e_machine));

  if (eh->e_type != ET_REL)
    return fail(errc::format_error, "elf: not a relocatable object");

  return {};
}

result<void> elf_parser::parse_scns() {
  if (elf_getshdrstrndx(elf.get(), &shstrndx))
    return fail(errc::format_error,
                "elf: failed to get section names section index");

  for (auto scn = elf_nextscn(elf.get(), NULL); scn;
       scn = elf_nextscn(elf.get(), scn)) {
    size_t idx = elf_ndxscn(scn);
    Elf64_Shdr *sh = elf64_getshdr(scn);
    if (!sh)
      return fail(errc::format_error,
                  "elf: failed to get section header, idx=" +
                      std::to_string(idx));

    const char *name = elf_strptr(elf.get(), shstrndx, sh->sh_name);
    if (!name)
      return fail(errc::format_error,
                  "elf: failed to get section name, idx=" +
                      std::to_string(idx));

    if (sh->sh_type != SHT_NOBITS &&
        (sh->sh_offset > buf.size() || sh->sh_size > buf.size() - sh->sh_offset))
      return fail(errc::format_error,
                  "elf: section "s + name + " exceeds the file");

    if (debug)
      std::clog << "section " << name << ", idx=" << idx << std::endl;

    if (sh->sh_type == SHT_SYMTAB) {
      if (symtab_scn)
        return fail(errc::format_error, "elf: multiple symbol tables");
      symtab_scn = scn;
    } else if (!strcmp(name, "maps")) {
      maps_scn = scn;
    } else if (!strcmp(name, "license")) {
      license_scn = scn;
    } else if (!strcmp(name, "version")) {
      version_scn = scn;
    } else if (sh->sh_type == SHT_REL) {
      rel_scns.push_back(scn);
    } else if (sh->sh_type == SHT_PROGBITS && (sh->sh_flags & SHF_EXECINSTR)) {
      if (find_sec_def(name))
        prog_scns.push_back(scn);
      else if (debug)
        std::clog << "skipping code section " << name << std::endl;
    }
  }

  if (!symtab_scn)
    return fail(errc::format_error, "elf: symbol table not found");

  if (!maps_scn && debug)
    std::clog << "section maps not found" << std::endl;

  return {};
}

result<void> elf_parser::parse_symtab() {
  Elf64_Shdr *sh = elf64_getshdr(symtab_scn);
  Elf_Data *data = elf_getdata(symtab_scn, 0);

  if (!data)
    return fail(errc::format_error, "elf: failed to get symbol definitions");

  if (data->d_size % sizeof(Elf64_Sym))
    return fail(errc::format_error, "elf: ill-formed symbol table");

  syms = reinterpret_cast<const Elf64_Sym *>(data->d_buf);
  nr_syms = data->d_size / sizeof(Elf64_Sym);
  strtabidx = sh->sh_link;

  if (debug)
    std::clog << "# of symbols: " << nr_syms << std::endl;

  return {};
}

result<void> elf_parser::parse_license() {
  if (license_scn) {
    Elf_Data *data = elf_getdata(license_scn, 0);
    if (!data || !data->d_buf)
      return fail(errc::format_error, "elf: failed to read license");

    auto str = reinterpret_cast<const char *>(data->d_buf);
    obj.license.assign(str, strnlen(str, data->d_size));
  }

  if (version_scn) {
    Elf_Data *data = elf_getdata(version_scn, 0);
    if (!data || data->d_size != sizeof(uint32_t))
      return fail(errc::format_error, "elf: ill-formed version section");

    memcpy(&obj.kern_version, data->d_buf, sizeof(uint32_t));
  }

  if (debug)
    std::clog << "license=\"" << obj.license
              << "\", kern_version=" << obj.kern_version << std::endl;

  return {};
}

result<void> elf_parser::parse_maps() {
  if (!maps_scn)
    return {};

  Elf_Data *maps = elf_getdata(maps_scn, 0);
  if (!maps)
    return fail(errc::format_error, "elf: failed to get map definitions");

  std::set<std::string> names;
  size_t shndx = maps_shndx();

  for (size_t i = 0; i < nr_syms; i++) {
    const Elf64_Sym &sym = syms[i];

    if (sym.st_shndx != shndx || ELF64_ST_TYPE(sym.st_info) != STT_OBJECT)
      continue;

    const char *name = sym_name(sym);
    if (!name)
      return fail(errc::format_error, "elf: failed to get map symbol name");

    if (debug) {
      std::clog << "symbol: " << name << ", st_value=0x" << std::hex
                << sym.st_value << ", st_size=" << std::dec << sym.st_size
                << std::endl;
    }

    if (sym.st_size != sizeof(raw_map_def))
      return fail(errc::format_error,
                  "map "s + name + ": definition size " +
                      std::to_string(sym.st_size) + ", expected " +
                      std::to_string(sizeof(raw_map_def)));

    if (sym.st_value > maps->d_size ||
        maps->d_size - sym.st_value < sizeof(raw_map_def))
      return fail(errc::format_error,
                  "map "s + name + ": definition outside of maps section");

    if (!names.insert(name).second)
      return fail(errc::format_error, "map "s + name + ": duplicate name");

    map_entry entry{name, {}, std::nullopt, {}};
    memcpy(&entry.raw, static_cast<unsigned char *>(maps->d_buf) + sym.st_value,
           sizeof(raw_map_def));

    if (!map_type_from_raw(entry.raw.map_type))
      return fail(errc::format_error,
                  "map "s + name + ": unsupported map type " +
                      std::to_string(entry.raw.map_type));

    if (debug) {
      std::clog << "map_type=" << entry.raw.map_type << std::endl;
      std::clog << "key_size=" << entry.raw.key_size << std::endl;
      std::clog << "val_size=" << entry.raw.value_size << std::endl;
      std::clog << "max_size=" << entry.raw.max_entries << std::endl;
      std::clog << "map_flag=" << entry.raw.map_flags << std::endl;
    }

    if (!map_entries.try_emplace(sym.st_value, std::move(entry)).second)
      return fail(errc::format_error,
                  "map "s + name + ": overlaps another definition");
  }

  if (debug)
    std::clog << "# of maps in \"maps\": " << map_entries.size() << std::endl;

  return {};
}

// Resolves the inner_map_def and persistent_path pointers through .relmaps
result<void> elf_parser::parse_map_relocs() {
  if (!maps_scn)
    return {};

  size_t shndx = maps_shndx();
  std::set<std::pair<Elf64_Addr, size_t>> resolved;

  for (Elf_Scn *scn : rel_scns) {
    Elf64_Shdr *sh = elf64_getshdr(scn);
    if (sh->sh_info != shndx || !sh->sh_size)
      continue;

    Elf_Data *data = elf_getdata(scn, 0);
    if (!data || data->d_size % sizeof(Elf64_Rel))
      return fail(errc::format_error, "elf: ill-formed map relocations");

    auto rels = reinterpret_cast<const Elf64_Rel *>(data->d_buf);
    size_t nr_rels = data->d_size / sizeof(Elf64_Rel);

    for (size_t i = 0; i < nr_rels; i++) {
      const Elf64_Rel &rel = rels[i];
      auto it = map_entries.upper_bound(rel.r_offset);
      if (it == map_entries.begin())
        return fail(errc::format_error,
                    "elf: map relocation at " + hex(rel.r_offset) +
                        " outside of any map definition");
      --it;

      auto &[def_off, entry] = *it;
      size_t field = rel.r_offset - def_off;
      if (field != offsetof(raw_map_def, inner_map_def) &&
          field != offsetof(raw_map_def, persistent_path))
        return fail(errc::format_error,
                    "map " + entry.name + ": unexpected relocation at +" +
                        std::to_string(field));

      uint32_t type = ELF64_R_TYPE(rel.r_info);
      if (type != reloc_64_abs64 && type != reloc_64_64)
        return fail(errc::format_error,
                    "map " + entry.name + ": unsupported relocation type " +
                        std::to_string(type));

      size_t symidx = ELF64_R_SYM(rel.r_info);
      if (symidx == 0 || symidx >= nr_syms)
        return fail(errc::format_error,
                    "map " + entry.name +
                        ": relocation references unknown symbol " +
                        std::to_string(symidx));

      const Elf64_Sym &sym = syms[symidx];
      uint64_t addend = field == offsetof(raw_map_def, inner_map_def)
                            ? entry.raw.inner_map_def
                            : entry.raw.persistent_path;
      Elf64_Addr target = sym.st_value + addend;

      if (field == offsetof(raw_map_def, inner_map_def)) {
        if (sym.st_shndx != shndx || !map_entries.contains(target))
          return fail(errc::format_error,
                      "map " + entry.name +
                          ": inner map definition not found");
        if (target == def_off)
          return fail(errc::format_error,
                      "map " + entry.name + ": map is its own inner map");
        entry.inner_off = target;
      } else {
        Elf_Scn *tscn = sym.st_shndx != SHN_UNDEF && sym.st_shndx < SHN_LORESERVE
                            ? elf_getscn(elf.get(), sym.st_shndx)
                            : nullptr;
        Elf_Data *tdata = tscn ? elf_getdata(tscn, 0) : nullptr;
        if (!tdata || !tdata->d_buf || target >= tdata->d_size)
          return fail(errc::format_error,
                      "map " + entry.name + ": persistent path not found");

        auto str = static_cast<const char *>(tdata->d_buf) + target;
        size_t len = strnlen(str, tdata->d_size - target);
        if (len == tdata->d_size - target)
          return fail(errc::format_error,
                      "map " + entry.name + ": unterminated persistent path");
        entry.pin_path.assign(str, len);
      }

      resolved.emplace(def_off, field);
    }
  }

  for (const auto &[def_off, entry] : map_entries) {
    if (entry.raw.inner_map_def &&
        !resolved.contains({def_off, offsetof(raw_map_def, inner_map_def)}))
      return fail(errc::format_error,
                  "map " + entry.name + ": unresolved inner map pointer");
    if (entry.raw.persistent_path &&
        !resolved.contains({def_off, offsetof(raw_map_def, persistent_path)}))
      return fail(errc::format_error,
                  "map " + entry.name + ": unresolved persistent path pointer");
  }

  return {};
}

result<void> elf_parser::build_maps() {
  std::map<Elf64_Addr, std::shared_ptr<map_def>> defs;

  for (const auto &[off, entry] : map_entries) {
    auto def = std::make_shared<map_def>();
    def->name = entry.name;
    def->type = static_cast<map_type>(entry.raw.map_type);
    def->key_size = entry.raw.key_size;
    def->value_size = entry.raw.value_size;
    def->max_entries = entry.raw.max_entries;
    def->flags = entry.raw.map_flags;
    def->pin_path = entry.pin_path;
    defs.emplace(off, std::move(def));
  }

  for (const auto &[off, entry] : map_entries) {
    auto &def = defs.at(off);
    if (entry.inner_off)
      def->inner = defs.at(*entry.inner_off);

    if (is_map_in_map(def->type) && !def->inner)
      return fail(errc::format_error,
                  "map " + def->name +
                      ": map-in-map without inner map definition");

    if (debug && def->inner)
      std::clog << "map " << def->name << ": inner template "
                << def->inner->name << std::endl;

    obj.maps.push_back(def);
  }

  return {};
}

result<void> elf_parser::parse_prog_relocs(Elf_Scn *scn, const Elf64_Shdr *sh,
                                           const char *name,
                                           std::vector<prog_def> &progs,
                                           std::vector<Elf64_Off> &starts) {
  size_t shndx = elf_ndxscn(scn);

  for (Elf_Scn *rscn : rel_scns) {
    Elf64_Shdr *rsh = elf64_getshdr(rscn);
    if (rsh->sh_info != shndx || !rsh->sh_size)
      continue;

    Elf_Data *data = elf_getdata(rscn, 0);
    if (!data || data->d_size % sizeof(Elf64_Rel))
      return fail(errc::format_error,
                  "elf: ill-formed relocations for "s + name);

    auto rels = reinterpret_cast<const Elf64_Rel *>(data->d_buf);
    size_t nr_rels = data->d_size / sizeof(Elf64_Rel);

    for (size_t i = 0; i < nr_rels; i++) {
      const Elf64_Rel &rel = rels[i];
      std::string where = name + "+"s + hex(rel.r_offset);

      if (rel.r_offset % sizeof(bpf_insn) || rel.r_offset >= sh->sh_size)
        return fail(errc::format_error, "elf: bad relocation offset " + where);

      auto it = std::upper_bound(starts.begin(), starts.end(), rel.r_offset);
      if (it == starts.begin())
        return fail(errc::format_error,
                    "elf: relocation " + where + " outside of any program");
      size_t pidx = std::distance(starts.begin(), it) - 1;
      prog_def &prog = progs[pidx];
      size_t insn_idx = (rel.r_offset - starts[pidx]) / sizeof(bpf_insn);
      if (insn_idx >= prog.insns.size())
        return fail(errc::format_error,
                    "elf: relocation " + where + " outside of any program");

      uint32_t type = ELF64_R_TYPE(rel.r_info);
      if (type != reloc_64_64)
        return fail(errc::format_error,
                    "elf: unsupported relocation type " +
                        std::to_string(type) + " at " + where);

      size_t symidx = ELF64_R_SYM(rel.r_info);
      if (symidx == 0 || symidx >= nr_syms)
        return fail(errc::format_error,
                    "elf: relocation at " + where +
                        " references unknown symbol " + std::to_string(symidx));

      const Elf64_Sym &sym = syms[symidx];
      const char *sname = sym_name(sym);
      if (!maps_scn || sym.st_shndx != maps_shndx())
        return fail(errc::format_error,
                    "elf: relocation at " + where + " against " +
                        (sname ? sname : "?") + " which is not a map");

      bpf_insn &insn = prog.insns[insn_idx];
      if (insn.code != BPFLD_INSN_LD_IMM64 || insn_idx + 1 >= prog.insns.size())
        return fail(errc::format_error,
                    "elf: relocation at " + where +
                        " does not target a 64-bit immediate load");

      Elf64_Addr moff = sym.st_value;
      if (ELF64_ST_TYPE(sym.st_info) == STT_SECTION)
        moff += static_cast<uint32_t>(insn.imm);

      auto mit = map_entries.find(moff);
      if (mit == map_entries.end())
        return fail(errc::format_error,
                    "elf: relocation at " + where +
                        " references unknown map at offset " + hex(moff));

      if (debug)
        std::clog << "reloc " << prog.name << "[" << insn_idx << "] -> "
                  << mit->second.name << std::endl;

      prog.relocs.push_back(
          {static_cast<uint32_t>(insn_idx), mit->second.name});
    }
  }

  for (auto &prog : progs) {
    std::stable_sort(prog.relocs.begin(), prog.relocs.end(),
                     [](const reloc_entry &a, const reloc_entry &b) {
                       return a.insn_idx < b.insn_idx;
                     });
  }

  return {};
}

// get sec name
// get function symbols
result<void> elf_parser::parse_progs() {
  std::set<std::string> names;

  for (Elf_Scn *scn : prog_scns) {
    Elf64_Shdr *sh = elf64_getshdr(scn);
    const char *name = scn_name(scn);
    const sec_def *def = find_sec_def(name);
    size_t shndx = elf_ndxscn(scn);

    Elf_Data *data = elf_getdata(scn, 0);
    if (!data || !data->d_buf)
      return fail(errc::format_error, "elf: failed to read section "s + name);

    std::vector<const Elf64_Sym *> funcs;
    for (size_t i = 0; i < nr_syms; i++) {
      const Elf64_Sym &sym = syms[i];
      if (sym.st_shndx != shndx || ELF64_ST_TYPE(sym.st_info) != STT_FUNC ||
          ELF64_ST_BIND(sym.st_info) == STB_LOCAL)
        continue;
      funcs.push_back(&sym);
    }

    std::stable_sort(funcs.begin(), funcs.end(),
                     [](const Elf64_Sym *a, const Elf64_Sym *b) {
                       return a->st_value < b->st_value;
                     });

    std::vector<prog_def> progs;
    std::vector<Elf64_Off> starts;

    for (size_t i = 0; i < funcs.size(); i++) {
      const Elf64_Sym &sym = *funcs[i];
      const char *sym_nm = sym_name(sym);
      if (!sym_nm)
        return fail(errc::format_error, "elf: failed to get program name");

      Elf64_Off start = sym.st_value;
      Elf64_Off end = sym.st_size ? start + sym.st_size
                      : i + 1 < funcs.size() ? funcs[i + 1]->st_value
                                             : data->d_size;

      if (start % sizeof(bpf_insn) || end <= start ||
          (end - start) % sizeof(bpf_insn) || end > data->d_size)
        return fail(errc::format_error,
                    "program "s + sym_nm + ": bad bytecode bounds in " + name);

      if (!names.insert(sym_nm).second)
        return fail(errc::format_error,
                    "program "s + sym_nm + ": duplicate name");

      if (debug) {
        std::clog << "section: \"" << name << "\"" << std::endl;
        std::clog << "symbol: \"" << sym_nm << "\", insns="
                  << (end - start) / sizeof(bpf_insn) << std::endl;
      }

      prog_def prog;
      prog.name = sym_nm;
      prog.section = name;
      prog.type = def->type;
      prog.license = obj.license;
      prog.kern_version = obj.kern_version;
      auto first = reinterpret_cast<const bpf_insn *>(
          static_cast<const unsigned char *>(data->d_buf) + start);
      prog.insns.assign(first, first + (end - start) / sizeof(bpf_insn));

      progs.push_back(std::move(prog));
      starts.push_back(start);
    }

    auto ret = parse_prog_relocs(scn, sh, name, progs, starts);
    if (!ret)
      return ret;

    for (auto &prog : progs)
      obj.programs.push_back(std::make_shared<const prog_def>(std::move(prog)));
  }

  if (!obj.programs.empty() && !license_scn)
    return fail(errc::format_error, "elf: license section not found");

  return {};
}

result<elf_object> elf_parser::parse() {
  return parse_ehdr()
      .and_then([this] { return parse_scns(); })
      .and_then([this] { return parse_symtab(); })
      .and_then([this] { return parse_license(); })
      .and_then([this] { return parse_maps(); })
      .and_then([this] { return parse_map_relocs(); })
      .and_then([this] { return build_maps(); })
      .and_then([this] { return parse_progs(); })
      .transform([this] { return std::move(obj); });
}

} // namespace

result<elf_object> parse_elf(std::span<const unsigned char> data) {
  elf_parser parser(data);
  return parser.parse();
}

result<elf_object> read_elf_file(const std::string &path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in)
    return sys_error(errc::io_error, "elf: failed to open file " + path, errno);

  std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
  if (in.bad())
    return fail(errc::io_error, "elf: failed to read file " + path);

  if (debug)
    std::clog << "read " << bytes.size() << " bytes from " << path
              << std::endl;

  return parse_elf(bytes);
}

} // namespace bpfld
