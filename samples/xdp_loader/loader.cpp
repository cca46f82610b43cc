#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

#include "libbpfld.h"

namespace { // begin anynomous namespace

void usage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " [-d] [-s] [-i ifname] [-p pin_dir] object.o" << std::endl;
}

void dump_info(const bpfld::program_info &info) {
  std::cout << "  id=" << info.id << " type=" << bpfld::to_string(info.type)
            << " jited=" << info.jited_prog_len
            << " xlated=" << info.xlated_prog_len << " tag=";
  for (unsigned char c : info.tag)
    std::cout << std::hex << std::setw(2) << std::setfill('0') << unsigned(c);
  std::cout << std::dec << std::setfill(' ') << std::endl;

  for (const auto &[name, m] : info.maps)
    std::cout << "  uses map " << name << " id=" << m.id() << std::endl;
}

} // end anynomous namespace

int main(int argc, char *argv[]) {
  std::string ifname, pin_dir;
  bpfld::xdp_mode mode = bpfld::xdp_mode::none;
  int opt;

  while ((opt = getopt(argc, argv, "dsi:p:")) != -1) {
    switch (opt) {
    case 'd':
      bpfld::set_debug(1);
      break;
    case 's':
      mode = bpfld::xdp_mode::skb;
      break;
    case 'i':
      ifname = optarg;
      break;
    case 'p':
      pin_dir = optarg;
      break;
    default:
      usage(argv[0]);
      return 1;
    }
  }

  if (optind != argc - 1) {
    usage(argv[0]);
    return 1;
  }

  bpfld::object obj;
  if (auto ret = obj.load_elf(argv[optind]); !ret) {
    std::cerr << argv[optind] << ": " << ret.error().message() << std::endl;
    return 1;
  }

  std::cout << "license: " << obj.license() << std::endl;
  for (const auto &[name, m] : obj.maps()) {
    std::cout << "map " << name << ": " << bpfld::to_string(m.type())
              << " key=" << m.key_size() << " value=" << m.value_size()
              << " max=" << m.max_entries() << " fd=" << m.fd() << std::endl;
  }

  std::vector<std::string> names;
  for (const auto &[name, prog] : obj.programs())
    names.push_back(name);

  for (const auto &name : names) {
    bpfld::program &prog = obj.get_program(name)->get();
    if (auto ret = prog.load(); !ret) {
      std::cerr << ret.error().message() << std::endl;
      return 1;
    }

    std::cout << "program " << name << " (" << prog.section()
              << "): fd=" << prog.fd() << std::endl;

    auto info = bpfld::get_program_info(prog.fd());
    if (!info) {
      std::cerr << info.error().message() << std::endl;
      return 1;
    }
    dump_info(*info);

    if (!pin_dir.empty()) {
      if (auto ret = prog.pin(pin_dir + "/" + name); !ret) {
        std::cerr << ret.error().message() << std::endl;
        return 1;
      }
    }
  }

  if (ifname.empty())
    return 0;

  bpfld::program *xdp = nullptr;
  for (const auto &name : names) {
    bpfld::program &prog = obj.get_program(name)->get();
    if (prog.type() == bpfld::prog_type::xdp) {
      xdp = &prog;
      break;
    }
  }

  if (!xdp) {
    std::cerr << "no XDP program in " << argv[optind] << std::endl;
    return 1;
  }

  // Blocked before attaching so a signal cannot leave the hook behind
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  if (sigprocmask(SIG_BLOCK, &set, nullptr) < 0) {
    perror("sigprocmask");
    return 1;
  }

  if (auto ret = xdp->attach(ifname, mode); !ret) {
    std::cerr << ret.error().message() << std::endl;
    return 1;
  }

  std::cout << xdp->name() << " attached to " << ifname
            << ", press Ctrl-C to detach" << std::endl;

  int sig, status = 0;
  if (sigwait(&set, &sig)) {
    std::cerr << "sigwait failed" << std::endl;
    status = 1;
  }

  for (const auto &name : names) {
    bpfld::program &prog = obj.get_program(name)->get();
    if (!prog.pinned_path().empty()) {
      if (auto ret = prog.unpin(); !ret) {
        std::cerr << ret.error().message() << std::endl;
        status = 1;
      }
    }
    if (auto ret = prog.close(); !ret) {
      std::cerr << ret.error().message() << std::endl;
      status = 1;
    }
  }

  return status;
}
