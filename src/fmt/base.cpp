//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/fmt/base.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/log/absl_log.h>

namespace fftrim {
namespace {
absl::flat_hash_map<std::string, const StructureReaderFactory *> &
reader_factory_registry() {
  static absl::flat_hash_map<std::string, const StructureReaderFactory *> ret;
  return ret;
}
}  // namespace

const StructureReaderFactory *
StructureReaderFactory::find_factory(std::string_view name) {
  const absl::flat_hash_map<std::string, const StructureReaderFactory *> &reg =
      reader_factory_registry();

  auto it = reg.find(name);
  if (it == reg.end()) {
    return nullptr;
  }
  return it->second;
}

bool StructureReaderFactory::register_factory(
    std::unique_ptr<StructureReaderFactory> factory,
    const std::vector<std::string> &names) {
  static std::vector<std::unique_ptr<StructureReaderFactory>> factories;

  StructureReaderFactory *f = factories.emplace_back(std::move(factory)).get();
  // GCOV_EXCL_START
  ABSL_LOG_IF(WARNING, names.empty()) << "Empty name list for factory";
  // GCOV_EXCL_STOP

  for (const auto &name: names) {
    register_for_name(f, name);
  }

  return true;
}

void StructureReaderFactory::register_for_name(
    const StructureReaderFactory *factory, std::string_view name) {
  auto [_, inserted] =
      reader_factory_registry().insert_or_assign(name, factory);
  // GCOV_EXCL_START
  ABSL_LOG_IF(WARNING, !inserted)
      << "Duplicate factory name: " << name
      << ". Overwriting existing factory (is this intended?).";
  // GCOV_EXCL_STOP
}
}  // namespace fftrim
