#include <bpf/bpf.h>
#include <bpf/libbpf.h>
#include <linux/bpf.h>
#include <linux/if_link.h>
#include <net/if.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal.h"
#include "libbpfld.h"

namespace bpfld {

const char *to_string(prog_type type) noexcept {
  switch (type) {
  case prog_type::socket_filter:
    return "socket_filter";
  case prog_type::kprobe:
    return "kprobe";
  case prog_type::tracepoint:
    return "tracepoint";
  case prog_type::xdp:
    return "xdp";
  }
  return "unknown";
}

program::program(std::shared_ptr<const prog_def> def,
                 std::vector<bpf_insn> insns, load_options opts)
    : def_(std::move(def)), insns_(std::move(insns)), opts_(opts),
      state_(prog_state::unloaded), ifindex_(0), mode_(xdp_mode::none) {}

program::program(program &&other) noexcept
    : def_(std::move(other.def_)), insns_(std::move(other.insns_)),
      opts_(other.opts_), fd_(std::move(other.fd_)),
      state_(std::exchange(other.state_, prog_state::closed)),
      pinned_path_(std::move(other.pinned_path_)),
      ifname_(std::move(other.ifname_)),
      ifindex_(std::exchange(other.ifindex_, 0)), mode_(other.mode_),
      log_(std::move(other.log_)), map_refs_(std::move(other.map_refs_)) {}

program &program::operator=(program &&other) noexcept {
  if (this != &other) {
    release();
    def_ = std::move(other.def_);
    insns_ = std::move(other.insns_);
    opts_ = other.opts_;
    fd_ = std::move(other.fd_);
    state_ = std::exchange(other.state_, prog_state::closed);
    pinned_path_ = std::move(other.pinned_path_);
    ifname_ = std::move(other.ifname_);
    ifindex_ = std::exchange(other.ifindex_, 0);
    mode_ = other.mode_;
    log_ = std::move(other.log_);
    map_refs_ = std::move(other.map_refs_);
  }
  return *this;
}

program::~program() { release(); }

void program::release() noexcept {
  if (state_ != prog_state::attached)
    return;

  auto ret = detach();
  if (!ret)
    std::cerr << "program " << def_->name << ": " << ret.error().message()
              << std::endl;
}

result<void> program::check_not_closed(const char *op) const {
  if (state_ == prog_state::closed)
    return fail(errc::already_closed, "program " + name() + ": " + op);
  return {};
}

// A map closed since relocation may have its fd number reused by now
result<void> program::check_map_refs() {
  for (const auto &[idx, m] : map_refs_) {
    if (!m->is_open())
      return fail(errc::unresolved_reference,
                  "program " + name() + ": map " + m->name() + " is closed");
    if (insns_[idx].imm != m->fd())
      return fail(errc::unresolved_reference,
                  "program " + name() + ": map " + m->name() +
                      " no longer matches instruction " +
                      std::to_string(idx));
  }
  return {};
}

result<void> program::load() {
  auto ret = check_not_closed("load");
  if (!ret)
    return ret;

  if (state_ != prog_state::unloaded)
    return fail(errc::already_loaded, "program " + name());

  ret = check_map_refs();
  if (!ret)
    return ret;

  LIBBPF_OPTS(bpf_prog_load_opts, opts, .kern_version = def_->kern_version);
  std::string prog_name = kernel_obj_name(name());
  auto type = static_cast<bpf_prog_type>(def_->type);

  int fd = bpf_prog_load(type, prog_name.c_str(), def_->license.c_str(),
                         insns_.data(), insns_.size(), &opts);
  int err = fd < 0 ? errno : 0;

  // Retry once with a log buffer to capture what the verifier said
  if (fd < 0 && err != EPERM && opts_.log_size) {
    std::vector<char> log_buf(opts_.log_size, '\0');
    LIBBPF_OPTS(bpf_prog_load_opts, log_opts,
                .kern_version = def_->kern_version,
                .log_level = opts_.log_level,
                .log_size = static_cast<uint32_t>(log_buf.size()),
                .log_buf = log_buf.data());

    fd = bpf_prog_load(type, prog_name.c_str(), def_->license.c_str(),
                       insns_.data(), insns_.size(), &log_opts);
    err = fd < 0 ? errno : 0;
    log_.assign(log_buf.data(), strnlen(log_buf.data(), log_buf.size()));
  }

  if (fd < 0) {
    std::cerr << "bpf_prog_load(" << name() << "): " << strerror(err)
              << std::endl;
    if (!log_.empty())
      std::cerr << log_ << std::endl;

    std::string detail =
        "program " + name() + ": bpf_prog_load: " + strerror(err);
    if (!log_.empty())
      detail += "\n" + log_;

    return std::unexpected(error(
        err == EPERM ? errc::kernel_rejected : errc::verifier_rejected,
        std::move(detail), err));
  }

  fd_ = handle(fd);
  state_ = prog_state::loaded;

  if (debug)
    std::clog << "Program " << name() << " loaded, fd = " << fd << std::endl;

  return {};
}

result<void> program::attach(const std::string &ifname, xdp_mode mode) {
  auto ret = check_not_closed("attach");
  if (!ret)
    return ret;

  if (def_->type != prog_type::xdp)
    return fail(errc::not_supported,
                "program " + name() + ": cannot attach " +
                    to_string(def_->type) + " program to an interface");

  if (state_ == prog_state::unloaded)
    return fail(errc::not_loaded, "program " + name());

  if (state_ == prog_state::attached)
    return fail(errc::attach_failed,
                "program " + name() + ": already attached to " + ifname_);

  unsigned int ifindex = if_nametoindex(ifname.c_str());
  if (!ifindex)
    return sys_error(errc::interface_not_found,
                     "program " + name() + ": " + ifname, errno);

  int err = bpf_xdp_attach(ifindex, fd_.get(), static_cast<uint32_t>(mode),
                           nullptr);
  if (err < 0)
    return sys_error(errc::attach_failed,
                     "program " + name() + ": bpf_xdp_attach(" + ifname + ")",
                     -err);

  ifname_ = ifname;
  ifindex_ = ifindex;
  mode_ = mode;
  state_ = prog_state::attached;

  if (debug)
    std::clog << "Program " << name() << " attached to " << ifname
              << ", ifindex = " << ifindex << std::endl;

  return {};
}

result<void> program::detach() {
  auto ret = check_not_closed("detach");
  if (!ret)
    return ret;

  if (state_ != prog_state::attached)
    return fail(errc::not_attached, "program " + name());

  // Only detach if the hook still runs this program
  LIBBPF_OPTS(bpf_xdp_attach_opts, opts, .old_prog_fd = fd_.get());
  int err = bpf_xdp_detach(ifindex_, static_cast<uint32_t>(mode_), &opts);
  if (err < 0)
    return sys_error(errc::attach_failed,
                     "program " + name() + ": bpf_xdp_detach(" + ifname_ +
                         ")",
                     -err);

  if (debug)
    std::clog << "Program " << name() << " detached from " << ifname_
              << std::endl;

  ifname_.clear();
  ifindex_ = 0;
  mode_ = xdp_mode::none;
  state_ = prog_state::loaded;
  return {};
}

result<void> program::pin(const std::string &path) {
  auto ret = check_not_closed("pin");
  if (!ret)
    return ret;

  if (!fd_.valid())
    return fail(errc::not_loaded, "program " + name() + ": pin");

  if (bpf_obj_pin(fd_.get(), path.c_str()))
    return sys_error(errc::kernel_rejected,
                     "program " + name() + ": bpf_obj_pin(" + path + ")",
                     errno);

  pinned_path_ = path;
  return {};
}

result<void> program::unpin() {
  if (pinned_path_.empty())
    return fail(errc::not_pinned, "program " + name());

  if (unlink(pinned_path_.c_str()) < 0)
    return sys_error(errc::io_error, "unlink(" + pinned_path_ + ")", errno);

  pinned_path_.clear();
  return {};
}

result<void> program::close() {
  if (state_ == prog_state::closed)
    return fail(errc::already_closed, "program " + name());

  if (state_ == prog_state::attached) {
    auto ret = detach();
    if (!ret)
      return ret;
  }

  state_ = prog_state::closed;
  if (!fd_.valid())
    return {};

  return fd_.close();
}

} // namespace bpfld
