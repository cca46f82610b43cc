#ifndef LIBBPFLD_INTERNAL_H
#define LIBBPFLD_INTERNAL_H

#include <linux/bpf.h>

#include <cerrno>
#include <cstring>
#include <expected>
#include <memory>
#include <string>

#include "libbpfld.h"

#define BPFLD_INSN_LD_IMM64 (BPF_LD | BPF_IMM | BPF_DW)

namespace bpfld {

extern int debug;

// Kernel object names are limited to BPF_OBJ_NAME_LEN - 1 characters
inline std::string kernel_obj_name(const std::string &name) {
  return name.substr(0, BPF_OBJ_NAME_LEN - 1);
}

// libbpf's low-level API sets errno on failure (and returns -errno on 1.x)
inline std::unexpected<error> sys_error(errc code, const std::string &what,
                                        int err) {
  return std::unexpected(
      error(code, what + ": " + std::strerror(err), err));
}

inline std::unexpected<error> fail(errc code, std::string what) {
  return std::unexpected(error(code, std::move(what)));
}

result<bpf_map_info> get_map_info(int fd);

// Definition as reported by the kernel for a map created elsewhere
result<std::shared_ptr<const map_def>> def_from_info(const bpf_map_info &info);

} // namespace bpfld

#endif // LIBBPFLD_INTERNAL_H
