#include <bpf/bpf.h>
#include <linux/bpf.h>
#include <time.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "internal.h"
#include "libbpfld.h"

namespace bpfld {

static inline uint64_t ptr_to_u64(const void *ptr) {
  return reinterpret_cast<uint64_t>(ptr);
}

// bpf_prog_info::load_time counts nanoseconds since boot
static result<std::chrono::system_clock::time_point>
boot_to_wall(uint64_t boot_ns) {
  struct timespec ts;

  if (clock_gettime(CLOCK_BOOTTIME, &ts) < 0)
    return sys_error(errc::io_error, "clock_gettime(CLOCK_BOOTTIME)", errno);

  auto since_boot = std::chrono::seconds(ts.tv_sec) +
                    std::chrono::nanoseconds(ts.tv_nsec);
  auto age = since_boot - std::chrono::nanoseconds(boot_ns);

  return std::chrono::system_clock::now() -
         std::chrono::duration_cast<std::chrono::system_clock::duration>(age);
}

result<program_info> get_program_info(int fd) {
  bpf_prog_info info = {};
  uint32_t len = sizeof(info);

  if (bpf_obj_get_info_by_fd(fd, &info, &len))
    return sys_error(errc::kernel_rejected, "bpf_obj_get_info_by_fd", errno);

  std::vector<uint32_t> map_ids(info.nr_map_ids);
  if (!map_ids.empty()) {
    // Second pass fetches the ids of the maps the program references
    bpf_prog_info ids = {};
    ids.nr_map_ids = map_ids.size();
    ids.map_ids = ptr_to_u64(map_ids.data());
    len = sizeof(ids);

    if (bpf_obj_get_info_by_fd(fd, &ids, &len))
      return sys_error(errc::kernel_rejected, "bpf_obj_get_info_by_fd",
                       errno);

    map_ids.resize(std::min<size_t>(map_ids.size(), ids.nr_map_ids));
  }

  auto load_time = boot_to_wall(info.load_time);
  if (!load_time)
    return std::unexpected(load_time.error());

  program_info pi;
  pi.name = info.name;
  pi.fd = fd;
  pi.id = info.id;
  pi.type = static_cast<prog_type>(info.type);
  memcpy(pi.tag.data(), info.tag, pi.tag.size());
  pi.jited_prog_len = info.jited_prog_len;
  pi.xlated_prog_len = info.xlated_prog_len;
  pi.load_time = *load_time;
  pi.created_by_uid = info.created_by_uid;

  for (uint32_t id : map_ids) {
    auto m = map::open_by_id(id);
    if (!m)
      return std::unexpected(m.error());

    // Kernel names are truncated and need not be unique
    std::string key = m->name();
    if (pi.maps.contains(key))
      key += "#" + std::to_string(id);

    if (debug)
      std::clog << "program " << pi.name << " uses map " << key
                << ", id=" << id << std::endl;

    pi.maps.emplace(std::move(key), std::move(*m));
  }

  return pi;
}

result<handle> open_program_by_id(uint32_t id) {
  int fd = bpf_prog_get_fd_by_id(id);
  if (fd < 0) {
    int err = errno;
    return sys_error(err == ENOENT ? errc::not_found : errc::kernel_rejected,
                     "bpf_prog_get_fd_by_id(" + std::to_string(id) + ")",
                     err);
  }

  return handle(fd);
}

} // namespace bpfld
