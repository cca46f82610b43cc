#ifndef LIBBPFLD_SEC_DEFS_H
#define LIBBPFLD_SEC_DEFS_H

#include <cstring>

#include "libbpfld.h"

namespace bpfld {

struct sec_def {
  const char *sec;
  prog_type type;
};

/*
 * "type/" requires the SEC("type/extras") form, "type+" accepts either the
 * exact SEC("type") or SEC("type/extras").
 */
static const sec_def section_defs[] = {
    {"xdp+", prog_type::xdp},
    {"socket+", prog_type::socket_filter},
    {"kprobe/", prog_type::kprobe},
    {"kretprobe/", prog_type::kprobe},
    {"tracepoint/", prog_type::tracepoint},
    {"tp/", prog_type::tracepoint},
};

#define str_has_pfx(str, pfx) (strncmp(str, pfx, strlen(pfx)) == 0)

static inline bool sec_def_matches(const sec_def *def, const char *sec_name) {
  size_t len = strlen(def->sec);

  if (def->sec[len - 1] == '/')
    return str_has_pfx(sec_name, def->sec);

  if (def->sec[len - 1] == '+') {
    len--;
    /* not even a prefix */
    if (strncmp(sec_name, def->sec, len) != 0)
      return false;
    /* exact match or has '/' separator */
    return sec_name[len] == '\0' || sec_name[len] == '/';
  }

  return strcmp(sec_name, def->sec) == 0;
}

static inline const sec_def *find_sec_def(const char *sec_name) {
  for (const auto &def : section_defs) {
    if (sec_def_matches(&def, sec_name))
      return &def;
  }

  return nullptr;
}

} // namespace bpfld

#endif // LIBBPFLD_SEC_DEFS_H
