#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>

#include "internal.h"
#include "libbpfld.h"

namespace bpfld {

static int debug_from_env() {
  const char *val = std::getenv("BPFLD_DEBUG");
  return val ? std::atoi(val) : 0;
}

int debug = debug_from_env();

void set_debug(int val) { debug = val; }

namespace {

class bpfld_category : public std::error_category {
public:
  const char *name() const noexcept override { return "bpfld"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::format_error:
      return "malformed object file";
    case errc::unresolved_reference:
      return "unresolved map reference";
    case errc::kernel_rejected:
      return "rejected by kernel";
    case errc::verifier_rejected:
      return "rejected by verifier";
    case errc::already_closed:
      return "already closed";
    case errc::already_loaded:
      return "already loaded";
    case errc::already_created:
      return "already created";
    case errc::not_attached:
      return "not attached";
    case errc::not_loaded:
      return "not loaded";
    case errc::not_created:
      return "not created";
    case errc::not_pinned:
      return "not pinned";
    case errc::not_found:
      return "not found";
    case errc::key_out_of_range:
      return "key out of range";
    case errc::size_mismatch:
      return "size mismatch";
    case errc::not_supported:
      return "operation not supported";
    case errc::interface_not_found:
      return "interface not found";
    case errc::attach_failed:
      return "attach failed";
    case errc::io_error:
      return "i/o error";
    }
    return "unknown error";
  }
};

} // namespace

const std::error_category &category() noexcept {
  static const bpfld_category cat;
  return cat;
}

error::error(errc code, std::string detail, int sys_errno)
    : code_(make_error_code(code)), detail_(std::move(detail)),
      sys_errno_(sys_errno) {}

std::string error::message() const {
  if (detail_.empty())
    return code_.message();
  return code_.message() + ": " + detail_;
}

handle::handle(handle &&other) noexcept
    : fd_(other.fd_), closed_(other.closed_) {
  other.fd_ = -1;
  other.closed_ = false;
}

handle &handle::operator=(handle &&other) noexcept {
  if (this != &other) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = std::exchange(other.fd_, -1);
    closed_ = std::exchange(other.closed_, false);
  }
  return *this;
}

handle::~handle() {
  if (fd_ >= 0)
    ::close(fd_);
}

result<void> handle::close() {
  if (closed_)
    return fail(errc::already_closed, "fd already released");

  if (fd_ >= 0 && ::close(fd_) < 0) {
    int err = errno;
    fd_ = -1;
    closed_ = true;
    return sys_error(errc::io_error, "close", err);
  }

  if (debug && fd_ >= 0)
    std::clog << "closed fd " << fd_ << std::endl;

  fd_ = -1;
  closed_ = true;
  return {};
}

} // namespace bpfld
