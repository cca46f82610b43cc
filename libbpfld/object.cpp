#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "internal.h"
#include "libbpfld.h"

namespace bpfld {

object::object(load_options opts) : opts_(opts), loaded_(false) {}

result<map> object::create_map(const std::shared_ptr<const map_def> &def,
                               bool &reused) const {
  reused = false;
  if (!def->pin_path.empty() && opts_.reuse_pinned_maps) {
    auto pinned = map::open_pinned(def->pin_path);

    if (pinned) {
      const map_def &kdef = pinned->definition();
      if (kdef.type != def->type || kdef.key_size != def->key_size ||
          kdef.value_size != def->value_size ||
          kdef.max_entries != def->max_entries)
        return fail(errc::kernel_rejected,
                    "map " + def->name + ": map pinned at " + def->pin_path +
                        " does not match its definition");

      if (debug)
        std::clog << "map " << def->name << ": reusing " << def->pin_path
                  << ", id=" << pinned->id() << std::endl;

      // Keep the declared definition, it carries the inner template
      pinned->def_ = def;
      reused = true;
      return pinned;
    }

    if (pinned.error() != errc::not_found)
      return pinned;
  }

  map m(def);
  auto ret = m.create();
  if (!ret)
    return std::unexpected(ret.error());

  if (!def->pin_path.empty()) {
    ret = m.pin(def->pin_path);
    if (!ret)
      return std::unexpected(ret.error());
  }

  return m;
}

result<void> object::load(const elf_object &obj) {
  map_table maps;
  program_table progs;
  // Maps pinned by this load, unpinned again if it fails
  std::vector<std::string> new_pins;

  auto undo = [&](const error &err) -> result<void> {
    for (const auto &name : new_pins) {
      auto ret = maps.at(name).unpin();
      if (!ret)
        std::cerr << ret.error().message() << std::endl;
    }
    return std::unexpected(err);
  };

  for (const auto &def : obj.maps) {
    bool reused;
    auto m = create_map(def, reused);
    if (!m)
      return undo(m.error());

    if (!def->pin_path.empty() && !reused)
      new_pins.push_back(def->name);

    maps.emplace(def->name, std::move(*m));
  }

  for (const auto &def : obj.programs) {
    auto insns = relocate(*def, maps);
    if (!insns)
      return undo(insns.error());

    auto it = progs
                  .emplace(std::piecewise_construct,
                           std::forward_as_tuple(def->name),
                           std::forward_as_tuple(def, std::move(*insns), opts_))
                  .first;

    // Map nodes keep their address when the table moves into maps_
    for (const auto &relo : def->relocs)
      it->second.map_refs_.emplace_back(relo.insn_idx,
                                        &maps.at(relo.map_name));
  }

  if (debug) {
    std::clog << "object: " << maps.size() << " maps, " << progs.size()
              << " programs, license \"" << obj.license << "\"" << std::endl;
  }

  maps_ = std::move(maps);
  progs_ = std::move(progs);
  license_ = obj.license;
  loaded_ = true;
  return {};
}

result<void> object::load_elf(const std::string &path) {
  if (loaded_)
    return fail(errc::already_loaded, "object: " + path);

  return read_elf_file(path).and_then(
      [this](const elf_object &obj) { return load(obj); });
}

result<void> object::load_elf(std::span<const unsigned char> data) {
  if (loaded_)
    return fail(errc::already_loaded, "object");

  return parse_elf(data).and_then(
      [this](const elf_object &obj) { return load(obj); });
}

optional_ref<map> object::get_map(std::string_view name) {
  auto it = maps_.find(name);
  if (it == maps_.end())
    return std::nullopt;
  return std::ref(it->second);
}

optional_ref<program> object::get_program(std::string_view name) {
  auto it = progs_.find(name);
  if (it == progs_.end())
    return std::nullopt;
  return std::ref(it->second);
}

} // namespace bpfld
