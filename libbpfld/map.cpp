#include <bpf/bpf.h>
#include <bpf/libbpf.h>
#include <linux/bpf.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal.h"
#include "libbpfld.h"

using namespace std::literals::string_literals;

namespace bpfld {

template <std::integral T>
static inline void val_to_buf(unsigned char *buf, const T val) {
  memcpy(buf, &val, sizeof(T));
}

template <std::integral T>
static inline T val_from_buf(const unsigned char *buf) {
  T val;
  memcpy(&val, buf, sizeof(T));
  return val;
}

static inline size_t round_up(size_t val, size_t align) {
  return (val + align - 1) / align * align;
}

std::optional<map_type> map_type_from_raw(uint32_t raw) noexcept {
  switch (raw) {
  case BPF_MAP_TYPE_HASH:
  case BPF_MAP_TYPE_ARRAY:
  case BPF_MAP_TYPE_PROG_ARRAY:
  case BPF_MAP_TYPE_PERCPU_HASH:
  case BPF_MAP_TYPE_PERCPU_ARRAY:
  case BPF_MAP_TYPE_LRU_HASH:
  case BPF_MAP_TYPE_LRU_PERCPU_HASH:
  case BPF_MAP_TYPE_ARRAY_OF_MAPS:
  case BPF_MAP_TYPE_HASH_OF_MAPS:
    return static_cast<map_type>(raw);
  default:
    return std::nullopt;
  }
}

const char *to_string(map_type type) noexcept {
  switch (type) {
  case map_type::hash:
    return "hash";
  case map_type::array:
    return "array";
  case map_type::prog_array:
    return "prog_array";
  case map_type::percpu_hash:
    return "percpu_hash";
  case map_type::percpu_array:
    return "percpu_array";
  case map_type::lru_hash:
    return "lru_hash";
  case map_type::lru_percpu_hash:
    return "lru_percpu_hash";
  case map_type::array_of_maps:
    return "array_of_maps";
  case map_type::hash_of_maps:
    return "hash_of_maps";
  }
  return "unknown";
}

result<bpf_map_info> get_map_info(int fd) {
  bpf_map_info info = {};
  uint32_t len = sizeof(info);

  if (bpf_obj_get_info_by_fd(fd, &info, &len))
    return sys_error(errc::kernel_rejected, "bpf_obj_get_info_by_fd", errno);

  return info;
}

result<std::shared_ptr<const map_def>> def_from_info(const bpf_map_info &info) {
  auto type = map_type_from_raw(info.type);
  if (!type)
    return fail(errc::not_supported,
                "map "s + info.name + ": unsupported map type " +
                    std::to_string(info.type));

  auto def = std::make_shared<map_def>();
  def->name = info.name;
  def->type = *type;
  def->key_size = info.key_size;
  def->value_size = info.value_size;
  def->max_entries = info.max_entries;
  def->flags = info.map_flags;
  return def;
}

map::map(std::shared_ptr<const map_def> def) : def_(std::move(def)), id_(0) {}

map::map(std::shared_ptr<const map_def> def, handle fd, uint32_t id)
    : def_(std::move(def)), fd_(std::move(fd)), id_(id) {}

static result<map> adopt(handle fd) {
  auto info = get_map_info(fd.get());
  if (!info)
    return std::unexpected(info.error());

  return def_from_info(*info).transform(
      [&](std::shared_ptr<const map_def> def) {
        return map(std::move(def), std::move(fd), info->id);
      });
}

result<map> map::open_by_id(uint32_t id) {
  int fd = bpf_map_get_fd_by_id(id);
  if (fd < 0) {
    int err = errno;
    return sys_error(err == ENOENT ? errc::not_found : errc::kernel_rejected,
                     "bpf_map_get_fd_by_id(" + std::to_string(id) + ")", err);
  }

  return adopt(handle(fd));
}

result<map> map::open_pinned(const std::string &path) {
  int fd = bpf_obj_get(path.c_str());
  if (fd < 0) {
    int err = errno;
    return sys_error(err == ENOENT ? errc::not_found : errc::kernel_rejected,
                     "bpf_obj_get(" + path + ")", err);
  }

  auto ret = adopt(handle(fd));
  if (ret)
    ret->pinned_path_ = path;
  return ret;
}

result<void> map::check_open(const char *op) const {
  if (fd_.closed())
    return fail(errc::already_closed, "map " + name() + ": " + op);
  if (!fd_.valid())
    return fail(errc::not_created, "map " + name() + ": " + op);
  return {};
}

result<void> map::check_key(std::span<const unsigned char> key) const {
  if (key.size() != def_->key_size)
    return fail(errc::size_mismatch,
                "map " + name() + ": key is " + std::to_string(key.size()) +
                    " bytes, expected " + std::to_string(def_->key_size));

  if (is_array_kind(def_->type) && key.size() == sizeof(uint32_t)) {
    uint32_t idx = val_from_buf<uint32_t>(key.data());
    if (idx >= def_->max_entries)
      return fail(errc::key_out_of_range,
                  "map " + name() + ": index " + std::to_string(idx) +
                      " >= max_entries " + std::to_string(def_->max_entries));
  }

  return {};
}

result<size_t> map::value_buffer_size() const {
  if (!is_percpu(def_->type))
    return def_->value_size;

  int cpus = libbpf_num_possible_cpus();
  if (cpus < 0)
    return sys_error(errc::io_error, "libbpf_num_possible_cpus", -cpus);

  return round_up(def_->value_size, 8) * cpus;
}

result<std::vector<unsigned char>> map::encode(uint64_t bits, bool negative,
                                               uint32_t width) const {
  if (width != 1 && width != 2 && width != 4 && width != 8)
    return fail(errc::size_mismatch, "map " + name() + ": cannot encode " +
                                         std::to_string(width) +
                                         "-byte integer");

  if (width < 8) {
    unsigned bits_wide = width * 8;
    bool fits = negative ? static_cast<int64_t>(bits) >=
                               -(static_cast<int64_t>(1) << (bits_wide - 1))
                         : bits < (static_cast<uint64_t>(1) << bits_wide);
    if (!fits)
      return fail(errc::size_mismatch, "map " + name() +
                                           ": value does not fit in " +
                                           std::to_string(width) + " bytes");
  }

  std::vector<unsigned char> buf(width);
  switch (width) {
  case 1:
    val_to_buf<uint8_t>(buf.data(), static_cast<uint8_t>(bits));
    break;
  case 2:
    val_to_buf<uint16_t>(buf.data(), static_cast<uint16_t>(bits));
    break;
  case 4:
    val_to_buf<uint32_t>(buf.data(), static_cast<uint32_t>(bits));
    break;
  default:
    val_to_buf<uint64_t>(buf.data(), bits);
    break;
  }

  return buf;
}

result<std::vector<unsigned char>> map::encode_value(uint64_t bits,
                                                     bool negative) const {
  auto one = encode(bits, negative, def_->value_size);
  if (!one || !is_percpu(def_->type))
    return one;

  auto size = value_buffer_size();
  if (!size)
    return std::unexpected(size.error());

  size_t stride = round_up(def_->value_size, 8);
  std::vector<unsigned char> buf(*size);
  for (size_t off = 0; off < buf.size(); off += stride)
    std::copy(one->begin(), one->end(), buf.begin() + off);

  return buf;
}

result<void> map::create() {
  LIBBPF_OPTS(bpf_map_create_opts, opts, .map_flags = def_->flags);
  std::optional<map> tmpl;

  if (fd_.closed())
    return fail(errc::already_closed, "map " + name() + ": create");
  if (fd_.valid())
    return fail(errc::already_created, "map " + name());

  if (is_map_in_map(def_->type)) {
    if (!def_->inner || is_map_in_map(def_->inner->type))
      return fail(errc::not_supported,
                  "map " + name() + ": no usable inner map template");

    // The template only lives long enough to describe the inner kind
    tmpl.emplace(def_->inner);
    auto ret = tmpl->create();
    if (!ret)
      return ret;

    opts.inner_map_fd = tmpl->fd();
  }

  if (debug) {
    std::clog << "creating map \"" << name() << "\", type=" << to_string(type())
              << std::endl;
  }

  int fd = bpf_map_create(static_cast<bpf_map_type>(def_->type),
                          kernel_obj_name(name()).c_str(), def_->key_size,
                          def_->value_size, def_->max_entries, &opts);
  if (fd < 0) {
    int err = errno;
    std::cerr << "bpf_map_create(" << name() << "): " << strerror(err)
              << std::endl;
    return sys_error(errc::kernel_rejected,
                     "map " + name() + ": bpf_map_create", err);
  }

  handle hd(fd);
  auto info = get_map_info(fd);
  if (!info)
    return std::unexpected(info.error());

  if (info->key_size != def_->key_size ||
      info->value_size != def_->value_size ||
      info->max_entries != def_->max_entries)
    return fail(errc::kernel_rejected,
                "map " + name() + ": kernel reports key_size=" +
                    std::to_string(info->key_size) +
                    ", value_size=" + std::to_string(info->value_size) +
                    ", max_entries=" + std::to_string(info->max_entries));

  if (tmpl) {
    auto ret = tmpl->close();
    if (!ret)
      return ret;
  }

  fd_ = std::move(hd);
  id_ = info->id;

  if (debug)
    std::clog << "map_fd=" << fd_.get() << ", id=" << id_ << std::endl;

  return {};
}

result<void> map::update(std::span<const unsigned char> key,
                         std::span<const unsigned char> value,
                         update_flag flag) {
  auto ret = check_open("update").and_then([&] { return check_key(key); });
  if (!ret)
    return ret;

  auto size = value_buffer_size();
  if (!size)
    return std::unexpected(size.error());

  if (value.size() != *size)
    return fail(errc::size_mismatch,
                "map " + name() + ": value is " +
                    std::to_string(value.size()) + " bytes, expected " +
                    std::to_string(*size));

  if (bpf_map_update_elem(fd_.get(), key.data(), value.data(),
                          static_cast<uint64_t>(flag))) {
    int err = errno;
    return sys_error(err == ENOENT ? errc::not_found : errc::kernel_rejected,
                     "map " + name() + ": update", err);
  }

  return {};
}

result<std::vector<unsigned char>>
map::lookup(std::span<const unsigned char> key) const {
  auto ret = check_open("lookup").and_then([&] { return check_key(key); });
  if (!ret)
    return std::unexpected(ret.error());

  auto size = value_buffer_size();
  if (!size)
    return std::unexpected(size.error());

  std::vector<unsigned char> value(*size);
  if (bpf_map_lookup_elem(fd_.get(), key.data(), value.data())) {
    int err = errno;
    return sys_error(err == ENOENT ? errc::not_found : errc::kernel_rejected,
                     "map " + name() + ": lookup", err);
  }

  return value;
}

result<uint64_t> map::lookup_int(std::span<const unsigned char> key) const {
  return lookup(key).and_then(
      [this](const std::vector<unsigned char> &buf) -> result<uint64_t> {
        switch (def_->value_size) {
        case 1:
          return val_from_buf<uint8_t>(buf.data());
        case 2:
          return val_from_buf<uint16_t>(buf.data());
        case 4:
          return val_from_buf<uint32_t>(buf.data());
        case 8:
          return val_from_buf<uint64_t>(buf.data());
        default:
          return fail(errc::size_mismatch,
                      "map " + name() + ": cannot decode " +
                          std::to_string(def_->value_size) +
                          "-byte value as integer");
        }
      });
}

result<void> map::erase(std::span<const unsigned char> key) {
  auto ret = check_open("erase").and_then([&] { return check_key(key); });
  if (!ret)
    return ret;

  if (def_->type == map_type::array || def_->type == map_type::percpu_array)
    return fail(errc::not_supported,
                "map " + name() + ": elements of " + to_string(type()) +
                    " cannot be deleted");

  if (bpf_map_delete_elem(fd_.get(), key.data())) {
    int err = errno;
    return sys_error(err == ENOENT ? errc::not_found : errc::kernel_rejected,
                     "map " + name() + ": erase", err);
  }

  return {};
}

result<std::optional<std::vector<unsigned char>>>
map::next_key(std::span<const unsigned char> key) const {
  auto ret = check_open("next_key");
  if (!ret)
    return std::unexpected(ret.error());

  if (key.size() != def_->key_size)
    return fail(errc::size_mismatch, "map " + name() + ": next_key");

  std::vector<unsigned char> next(def_->key_size);
  if (bpf_map_get_next_key(fd_.get(), key.data(), next.data())) {
    int err = errno;
    if (err == ENOENT)
      return std::nullopt;
    return sys_error(errc::kernel_rejected, "map " + name() + ": next_key",
                     err);
  }

  return next;
}

result<std::optional<std::vector<unsigned char>>> map::first_key() const {
  auto ret = check_open("first_key");
  if (!ret)
    return std::unexpected(ret.error());

  std::vector<unsigned char> next(def_->key_size);
  if (bpf_map_get_next_key(fd_.get(), nullptr, next.data())) {
    int err = errno;
    if (err == ENOENT)
      return std::nullopt;
    return sys_error(errc::kernel_rejected, "map " + name() + ": first_key",
                     err);
  }

  return next;
}

result<void> map::pin(const std::string &path) {
  auto ret = check_open("pin");
  if (!ret)
    return ret;

  if (bpf_obj_pin(fd_.get(), path.c_str()))
    return sys_error(errc::kernel_rejected,
                     "map " + name() + ": bpf_obj_pin(" + path + ")", errno);

  if (debug)
    std::clog << "map " << name() << " pinned at " << path << std::endl;

  pinned_path_ = path;
  return {};
}

result<void> map::unpin() {
  if (pinned_path_.empty())
    return fail(errc::not_pinned, "map " + name());

  if (unlink(pinned_path_.c_str()) < 0)
    return sys_error(errc::io_error, "unlink(" + pinned_path_ + ")", errno);

  pinned_path_.clear();
  return {};
}

result<void> map::close() {
  if (!fd_.valid() && !fd_.closed())
    return fail(errc::not_created, "map " + name() + ": close");

  return fd_.close();
}

} // namespace bpfld
