#include <linux/bpf.h>

#include <iostream>
#include <string>
#include <vector>

#include "internal.h"
#include "libbpfld.h"

namespace bpfld {

static result<void> apply_relo(std::vector<bpf_insn> &insns,
                               const reloc_entry &relo, int fd) {
  if (relo.insn_idx + 1 >= insns.size())
    return fail(errc::format_error,
                "relocation for instruction " +
                    std::to_string(relo.insn_idx) + " out of bounds");

  bpf_insn &insn = insns[relo.insn_idx];

  if (insn.code != BPFLD_INSN_LD_IMM64)
    return fail(errc::format_error,
                "invalid relocation for instruction " +
                    std::to_string(relo.insn_idx) + ": code " +
                    std::to_string(insn.code));

  insn.imm = fd;
  insn.src_reg = BPF_PSEUDO_MAP_FD;
  return {};
}

result<std::vector<bpf_insn>> relocate(const prog_def &prog,
                                       const map_table &maps) {
  std::vector<bpf_insn> insns = prog.insns;

  for (const auto &relo : prog.relocs) {
    auto it = maps.find(relo.map_name);
    if (it == maps.end())
      return fail(errc::unresolved_reference,
                  "program " + prog.name + ": map " + relo.map_name +
                      " not found");

    const map &m = it->second;
    if (!m.is_open())
      return fail(errc::unresolved_reference,
                  "program " + prog.name + ": map " + relo.map_name +
                      " has no kernel object");

    auto ret = apply_relo(insns, relo, m.fd());
    if (!ret)
      return std::unexpected(ret.error());

    if (debug) {
      std::clog << "program " << prog.name << ": insn " << relo.insn_idx
                << " -> map " << relo.map_name << ", fd=" << m.fd()
                << std::endl;
    }
  }

  return insns;
}

} // namespace bpfld
