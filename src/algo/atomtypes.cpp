//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/algo/atomtypes.h"

#include <queue>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/log/absl_log.h>

#include "fftrim/core/forcefield.h"

namespace fftrim {
int AtomTypeTable::add_type(std::string_view name, bool from_override) {
  auto [it, inserted] =
      index_.try_emplace(std::string(name), static_cast<int>(entries_.size()));
  if (!inserted)
    return it->second;

  Entry &entry = entries_.emplace_back();
  entry.name = it->first;
  entry.from_override = from_override;
  return it->second;
}

const AtomTypeTable::Entry *AtomTypeTable::find(std::string_view name) const {
  auto it = index_.find(name);
  if (it == index_.end())
    return nullptr;
  return &entries_[it->second];
}

const std::string *AtomTypeTable::class_of(std::string_view name) const {
  const Entry *entry = find(name);
  if (entry == nullptr || !entry->resolved())
    return nullptr;
  return &entry->type_class;
}

std::vector<std::string> AtomTypeTable::notes() const {
  std::vector<std::string> ret;
  for (const Entry &entry: entries_) {
    if (entry.from_override)
      ret.push_back(entry.name);
  }
  return ret;
}

std::vector<std::string> AtomTypeTable::unresolved() const {
  std::vector<std::string> ret;
  for (const Entry &entry: entries_) {
    if (!entry.resolved())
      ret.push_back(entry.name);
  }
  return ret;
}

AtomTypeTable resolve_atom_types(const std::vector<std::string> &present,
                                 const std::vector<AtomTypeDefinition> &defs) {
  absl::flat_hash_map<std::string_view, std::vector<int>> defs_of_type;
  for (int i = 0; i < defs.size(); ++i)
    defs_of_type[defs[i].name].push_back(i);

  AtomTypeTable table;
  std::queue<int> queue;

  for (const std::string &type: present) {
    const int prev = table.size();
    const int idx = table.add_type(type);
    if (idx == prev)
      queue.push(idx);
  }

  while (!queue.empty()) {
    const int idx = queue.front();
    queue.pop();

    auto it = defs_of_type.find(table[idx].name);
    if (it == defs_of_type.end()) {
      ABSL_LOG(INFO) << "No definition found for atom type " << table[idx].name;
      continue;
    }

    table[idx].defined = true;
    table[idx].type_class = defs[it->second.back()].type_class;

    // Overrides of every definition sharing the name are followed.
    for (int def: it->second) {
      for (const std::string &target: defs[def].overrides) {
        if (table.contains(target))
          continue;

        ABSL_LOG(INFO) << "Note: atom type " << target
                       << " is referenced in an overrides statement, but does "
                          "not appear in the system";
        queue.push(table.add_type(target, true));
      }
    }
  }

  return table;
}
}  // namespace fftrim
