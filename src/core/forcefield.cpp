//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/core/forcefield.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/base/optimization.h>
#include <absl/log/absl_log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>

namespace fftrim {
ForceFieldSection *ForceField::find_section(std::string_view name) {
  auto it = absl::c_find_if(sections_, [name](const ForceFieldSection &sec) {
    return sec.name() == name;
  });
  return it == sections_.end() ? nullptr : &*it;
}

const ForceFieldSection *
ForceField::find_section(std::string_view name) const {
  auto it = absl::c_find_if(sections_, [name](const ForceFieldSection &sec) {
    return sec.name() == name;
  });
  return it == sections_.end() ? nullptr : &*it;
}

ForceFieldSection &ForceField::section(std::string_view name) {
  ForceFieldSection *sec = find_section(name);
  if (sec != nullptr)
    return *sec;

  return add_section(ForceFieldSection(std::string(name)));
}

std::vector<const ForceFieldRecord *>
ForceField::find_records(std::string_view tag) const {
  std::vector<const ForceFieldRecord *> ret;

  for (const ForceFieldSection &sec: sections_) {
    for (const ForceFieldRecord &record: sec.records()) {
      if (record.tag() == tag)
        ret.push_back(&record);
    }
  }

  return ret;
}

std::vector<const ForceFieldRecord *>
ForceField::find_records(std::string_view section, std::string_view tag) const {
  std::vector<const ForceFieldRecord *> ret;

  for (const ForceFieldSection &sec: sections_) {
    if (sec.name() != section)
      continue;

    for (const ForceFieldRecord &record: sec.records()) {
      if (record.tag() == tag)
        ret.push_back(&record);
    }
  }

  return ret;
}

int ForceField::num_records() const {
  int count = 0;
  for (const ForceFieldSection &sec: sections_)
    count += sec.size();
  return count;
}

void ForceField::clear() {
  root_tag_ = std::string(constants::kForceFieldTag);
  attrs_.clear();
  sections_.clear();
}

std::pair<std::vector<AtomTypeDefinition>, bool>
atom_type_definitions(const ForceField &ff, int *bad_record) {
  std::pair<std::vector<AtomTypeDefinition>, bool> ret { {}, true };
  std::vector<AtomTypeDefinition> &defs = ret.first;

  std::vector<const ForceFieldRecord *> records = ff.find_records(
      constants::kAtomTypesSection, constants::kAtomTypeTag);
  defs.reserve(records.size());

  for (int i = 0; i < records.size(); ++i) {
    const ForceFieldRecord &record = *records[i];

    const std::string *name = record.find("name");
    if (ABSL_PREDICT_FALSE(name == nullptr)) {
      ABSL_LOG(WARNING) << "Atom type record #" << i << " has no name";
      if (bad_record != nullptr)
        *bad_record = i;
      ret.second = false;
      return ret;
    }

    AtomTypeDefinition &def = defs.emplace_back();
    def.name = *name;
    def.type_class = std::string(record.get("class"));
    ABSL_LOG_IF(INFO, def.type_class.empty())
        << "Atom type " << def.name << " does not define a class";

    const std::string *overrides = record.find("overrides");
    if (overrides == nullptr)
      continue;

    for (std::string_view item:
         absl::StrSplit(*overrides, ',', absl::SkipWhitespace())) {
      def.overrides.emplace_back(absl::StripAsciiWhitespace(item));
    }
  }

  return ret;
}
}  // namespace fftrim
