#ifndef LIBBPFLD_H
#define LIBBPFLD_H

#include <linux/bpf.h>
#include <linux/if_link.h>

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#define BPFLD_API [[gnu::visibility("default")]]

namespace bpfld {

enum class errc {
  format_error = 1,
  unresolved_reference,
  kernel_rejected,
  verifier_rejected,
  already_closed,
  already_loaded,
  already_created,
  not_attached,
  not_loaded,
  not_created,
  not_pinned,
  not_found,
  key_out_of_range,
  size_mismatch,
  not_supported,
  interface_not_found,
  attach_failed,
  io_error,
};

BPFLD_API const std::error_category &category() noexcept;

inline std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), category()};
}

} // namespace bpfld

template <> struct std::is_error_code_enum<bpfld::errc> : std::true_type {};

namespace bpfld {

/**
 * @brief Error value returned by every fallible operation
 *
 * code() is one of bpfld::errc, detail() carries the context (object name,
 * kernel verifier log, ...), sys_errno() is the errno reported by the kernel
 * or 0 when the failure was detected in user space.
 */
class BPFLD_API error {
  std::error_code code_;
  std::string detail_;
  int sys_errno_;

public:
  error(errc code, std::string detail, int sys_errno = 0);

  const std::error_code &code() const noexcept { return code_; }
  const std::string &detail() const noexcept { return detail_; }
  int sys_errno() const noexcept { return sys_errno_; }
  std::string message() const;

  friend bool operator==(const error &e, errc c) noexcept {
    return e.code_ == c;
  }
};

template <typename T> using result = std::expected<T, error>;

// Debug traces go to std::clog when val != 0. Initialised from BPFLD_DEBUG.
BPFLD_API void set_debug(int val);

enum class map_type : uint32_t {
  hash = BPF_MAP_TYPE_HASH,
  array = BPF_MAP_TYPE_ARRAY,
  prog_array = BPF_MAP_TYPE_PROG_ARRAY,
  percpu_hash = BPF_MAP_TYPE_PERCPU_HASH,
  percpu_array = BPF_MAP_TYPE_PERCPU_ARRAY,
  lru_hash = BPF_MAP_TYPE_LRU_HASH,
  lru_percpu_hash = BPF_MAP_TYPE_LRU_PERCPU_HASH,
  array_of_maps = BPF_MAP_TYPE_ARRAY_OF_MAPS,
  hash_of_maps = BPF_MAP_TYPE_HASH_OF_MAPS,
};

BPFLD_API std::optional<map_type> map_type_from_raw(uint32_t raw) noexcept;
BPFLD_API const char *to_string(map_type type) noexcept;

constexpr bool is_array_kind(map_type type) noexcept {
  return type == map_type::array || type == map_type::percpu_array ||
         type == map_type::prog_array || type == map_type::array_of_maps;
}

constexpr bool is_percpu(map_type type) noexcept {
  return type == map_type::percpu_array || type == map_type::percpu_hash ||
         type == map_type::lru_percpu_hash;
}

constexpr bool is_map_in_map(map_type type) noexcept {
  return type == map_type::array_of_maps || type == map_type::hash_of_maps;
}

enum class prog_type : uint32_t {
  socket_filter = BPF_PROG_TYPE_SOCKET_FILTER,
  kprobe = BPF_PROG_TYPE_KPROBE,
  tracepoint = BPF_PROG_TYPE_TRACEPOINT,
  xdp = BPF_PROG_TYPE_XDP,
};

BPFLD_API const char *to_string(prog_type type) noexcept;

enum class prog_state { unloaded, loaded, attached, closed };

enum class xdp_mode : uint32_t {
  none = 0,
  skb = XDP_FLAGS_SKB_MODE,
  drv = XDP_FLAGS_DRV_MODE,
  hw = XDP_FLAGS_HW_MODE,
};

enum class update_flag : uint64_t {
  any = BPF_ANY,
  noexist = BPF_NOEXIST,
  exist = BPF_EXIST,
};

struct load_options {
  // Reuse a map already pinned at its persistent path instead of creating it
  bool reuse_pinned_maps = true;
  // Verifier log level and buffer size used when a program load is rejected
  uint32_t log_level = 1;
  size_t log_size = 1 << 20;
};

/**
 * @brief Single-owner kernel file descriptor
 *
 * Unlike a plain RAII wrapper, releasing the descriptor twice through close()
 * is reported as errc::already_closed.
 */
class BPFLD_API handle {
  int fd_;
  bool closed_;

public:
  handle() noexcept : fd_(-1), closed_(false) {}
  explicit handle(int fd) noexcept : fd_(fd), closed_(false) {}

  handle(const handle &) = delete;
  handle(handle &&other) noexcept;
  ~handle();

  handle &operator=(const handle &) = delete;
  handle &operator=(handle &&other) noexcept;

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }
  bool closed() const noexcept { return closed_; }

  [[nodiscard]] result<void> close();
};

// Parsed map definition. inner is a size/kind template for map-in-map kinds,
// never a live kernel object.
struct map_def {
  std::string name;
  map_type type = map_type::hash;
  uint32_t key_size = 0;
  uint32_t value_size = 0;
  uint32_t max_entries = 0;
  uint32_t flags = 0;
  std::shared_ptr<const map_def> inner;
  std::string pin_path;
};

class object;

class BPFLD_API map {
  std::shared_ptr<const map_def> def_;
  handle fd_;
  uint32_t id_;
  std::string pinned_path_;

  result<void> check_open(const char *op) const;
  result<void> check_key(std::span<const unsigned char> key) const;
  result<std::vector<unsigned char>> encode(uint64_t bits, bool negative,
                                            uint32_t width) const;
  result<std::vector<unsigned char>> encode_value(uint64_t bits,
                                                  bool negative) const;

  template <std::integral T>
  result<std::vector<unsigned char>> encode_key(T key) const {
    return encode(static_cast<uint64_t>(key), key < 0, def_->key_size);
  }

public:
  explicit map(std::shared_ptr<const map_def> def);
  map(std::shared_ptr<const map_def> def, handle fd, uint32_t id);

  map(const map &) = delete;
  map(map &&) noexcept = default;
  ~map() = default;

  map &operator=(const map &) = delete;
  map &operator=(map &&) noexcept = default;

  // Reconstruct from kernel metadata with a freshly opened descriptor
  static result<map> open_by_id(uint32_t id);
  static result<map> open_pinned(const std::string &path);

  const std::string &name() const noexcept { return def_->name; }
  map_type type() const noexcept { return def_->type; }
  uint32_t key_size() const noexcept { return def_->key_size; }
  uint32_t value_size() const noexcept { return def_->value_size; }
  uint32_t max_entries() const noexcept { return def_->max_entries; }
  uint32_t flags() const noexcept { return def_->flags; }
  const std::string &persistent_path() const noexcept {
    return def_->pin_path;
  }
  const map_def &definition() const noexcept { return *def_; }
  const map_def *inner_template() const noexcept { return def_->inner.get(); }

  int fd() const noexcept { return fd_.get(); }
  uint32_t id() const noexcept { return id_; }
  bool is_open() const noexcept { return fd_.valid(); }
  const std::string &pinned_path() const noexcept { return pinned_path_; }

  // Size of the buffer exchanged with the kernel for one value. For per-CPU
  // kinds this is round_up(value_size, 8) * possible CPUs.
  result<size_t> value_buffer_size() const;

  result<void> create();

  result<void> update(std::span<const unsigned char> key,
                      std::span<const unsigned char> value,
                      update_flag flag = update_flag::any);
  result<std::vector<unsigned char>>
  lookup(std::span<const unsigned char> key) const;
  result<void> erase(std::span<const unsigned char> key);
  result<std::optional<std::vector<unsigned char>>>
  next_key(std::span<const unsigned char> key) const;
  result<std::optional<std::vector<unsigned char>>> first_key() const;

  template <std::integral K, std::integral V>
  result<void> update(K key, V value, update_flag flag = update_flag::any) {
    auto k = encode_key(key);
    if (!k)
      return std::unexpected(k.error());
    auto v = encode_value(static_cast<uint64_t>(value), value < 0);
    if (!v)
      return std::unexpected(v.error());
    return update(*k, *v, flag);
  }

  // Decodes a 1, 2, 4 or 8 byte value. Per-CPU kinds yield CPU 0's slot.
  template <std::integral K> result<uint64_t> lookup_int(K key) const {
    auto k = encode_key(key);
    if (!k)
      return std::unexpected(k.error());
    return lookup_int(*k);
  }
  result<uint64_t> lookup_int(std::span<const unsigned char> key) const;

  template <std::integral K> result<void> erase(K key) {
    return encode_key(key).and_then(
        [this](const std::vector<unsigned char> &k) { return erase(k); });
  }

  result<void> pin(const std::string &path);
  result<void> unpin();
  result<void> close();

  friend class object;
};

using map_table = std::map<std::string, map, std::less<>>;

struct reloc_entry {
  uint32_t insn_idx;
  std::string map_name;
};

struct prog_def {
  std::string name;
  std::string section;
  prog_type type = prog_type::xdp;
  std::string license;
  uint32_t kern_version = 0;
  std::vector<bpf_insn> insns;
  std::vector<reloc_entry> relocs;
};

struct elf_object {
  std::vector<std::shared_ptr<const map_def>> maps;
  std::vector<std::shared_ptr<const prog_def>> programs;
  std::string license;
  uint32_t kern_version = 0;
};

// Binary layout reader. Never touches the kernel.
BPFLD_API result<elf_object> parse_elf(std::span<const unsigned char> data);
BPFLD_API result<elf_object> read_elf_file(const std::string &path);

// Patches every map reference of prog with the live fd of the named map.
BPFLD_API result<std::vector<bpf_insn>> relocate(const prog_def &prog,
                                                 const map_table &maps);

class BPFLD_API program {
  std::shared_ptr<const prog_def> def_;
  std::vector<bpf_insn> insns_;
  load_options opts_;
  handle fd_;
  prog_state state_;
  std::string pinned_path_;
  std::string ifname_;
  unsigned int ifindex_;
  xdp_mode mode_;
  std::string log_;
  // Maps patched into insns_, rechecked on load. Owned by the object.
  std::vector<std::pair<uint32_t, const map *>> map_refs_;

  result<void> check_not_closed(const char *op) const;
  result<void> check_map_refs();
  void release() noexcept;

public:
  program(std::shared_ptr<const prog_def> def, std::vector<bpf_insn> insns,
          load_options opts = {});

  // An XDP hook outlives the fd, so a program still attached on destruction
  // is detached first
  program(const program &) = delete;
  program(program &&other) noexcept;
  ~program();

  program &operator=(const program &) = delete;
  program &operator=(program &&other) noexcept;

  const std::string &name() const noexcept { return def_->name; }
  const std::string &section() const noexcept { return def_->section; }
  prog_type type() const noexcept { return def_->type; }
  const std::string &license() const noexcept { return def_->license; }
  const std::vector<bpf_insn> &instructions() const noexcept { return insns_; }

  int fd() const noexcept { return fd_.get(); }
  prog_state state() const noexcept { return state_; }
  const std::string &pinned_path() const noexcept { return pinned_path_; }
  const std::string &interface() const noexcept { return ifname_; }
  const std::string &verifier_log() const noexcept { return log_; }

  result<void> load();
  result<void> attach(const std::string &ifname,
                      xdp_mode mode = xdp_mode::none);
  result<void> detach();
  result<void> pin(const std::string &path);
  result<void> unpin();
  result<void> close();

  friend class object;
};

using program_table = std::map<std::string, program, std::less<>>;

struct program_info {
  std::string name;
  int fd = -1;
  uint32_t id = 0;
  prog_type type = prog_type::xdp;
  std::array<unsigned char, BPF_TAG_SIZE> tag{};
  uint32_t jited_prog_len = 0;
  uint32_t xlated_prog_len = 0;
  std::chrono::system_clock::time_point load_time;
  uint32_t created_by_uid = 0;
  map_table maps;
};

// Introspection works on any live program fd, ours or obtained by id.
BPFLD_API result<program_info> get_program_info(int fd);
BPFLD_API result<handle> open_program_by_id(uint32_t id);

template <typename T>
using optional_ref = std::optional<std::reference_wrapper<T>>;

/**
 * @brief All maps and programs of one object file
 *
 * load_elf() parses the object, creates every map in file order and relocates
 * every program. Programs are left unloaded; callers load the ones they need.
 */
class BPFLD_API object {
  load_options opts_;
  map_table maps_;
  program_table progs_;
  std::string license_;
  bool loaded_;

  result<map> create_map(const std::shared_ptr<const map_def> &def,
                         bool &reused) const;
  result<void> load(const elf_object &obj);

public:
  explicit object(load_options opts = {});

  object(const object &) = delete;
  object(object &&) noexcept = default;
  ~object() = default;

  object &operator=(const object &) = delete;
  object &operator=(object &&) noexcept = default;

  result<void> load_elf(const std::string &path);
  result<void> load_elf(std::span<const unsigned char> data);

  // Membership is fixed once loaded; use get_map/get_program to operate
  const map_table &maps() const noexcept { return maps_; }
  const program_table &programs() const noexcept { return progs_; }
  const std::string &license() const noexcept { return license_; }

  optional_ref<map> get_map(std::string_view name);
  optional_ref<program> get_program(std::string_view name);
};

} // namespace bpfld

#endif // LIBBPFLD_H
