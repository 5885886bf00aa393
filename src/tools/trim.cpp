//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/tools/trim.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/base/optimization.h>
#include <absl/log/absl_log.h>
#include <absl/strings/str_cat.h>

#include "fftrim/algo/atomtypes.h"
#include "fftrim/algo/matcher.h"
#include "fftrim/algo/schema.h"
#include "fftrim/algo/topology.h"
#include "fftrim/core/forcefield.h"
#include "fftrim/core/interaction.h"
#include "fftrim/core/structure.h"

namespace fftrim {
std::ostream &operator<<(std::ostream &os, TrimErrorCode code) {
  switch (code) {
  case TrimErrorCode::kUntypedStructure:
    return os << "untyped structure";
  case TrimErrorCode::kMalformedRecord:
    return os << "malformed record";
  }

  ABSL_UNREACHABLE();
}

std::ostream &operator<<(std::ostream &os, const TrimError &err) {
  os << err.code;
  if (err.kind)
    os << " (" << *err.kind << ")";
  if (!err.section.empty())
    os << " in " << err.section;
  if (err.index >= 0)
    os << " #" << err.index;
  if (!err.detail.empty())
    os << ": " << err.detail;
  return os;
}

namespace {
void copy_attrs(AttributeList &dst, const AttributeList &src) {
  for (const auto &[key, value]: src)
    internal::set_key(dst, key, value);
}

void ensure_section(ForceField &out, const ForceField &source,
                    std::string_view name) {
  ForceFieldSection &sec = out.section(name);

  const ForceFieldSection *src = source.find_section(name);
  if (src != nullptr)
    copy_attrs(sec.attrs(), src->attrs());
}

std::optional<TrimError> check_structure(const TypedStructure &structure) {
  if (ABSL_PREDICT_FALSE(structure.empty())) {
    return TrimError { TrimErrorCode::kUntypedStructure, std::nullopt, "", -1,
                       "structure has no atoms" };
  }

  for (int i = 0; i < structure.num_atoms(); ++i) {
    const TypedAtom &atom = structure.atom(i);
    if (ABSL_PREDICT_FALSE(!atom.is_typed())) {
      return TrimError { TrimErrorCode::kUntypedStructure, std::nullopt, "", i,
                         absl::StrCat("atom ", atom.name(),
                                      " has no atom type") };
    }
  }

  return std::nullopt;
}

void copy_atom_types(ForceField &out, const ForceField &ff,
                     const AtomTypeTable &table) {
  ForceFieldSection &dst = out.section(constants::kAtomTypesSection);

  std::vector<const ForceFieldRecord *> records =
      ff.find_records(constants::kAtomTypesSection, constants::kAtomTypeTag);
  for (const ForceFieldRecord *record: records) {
    if (table.contains(record->get("name")))
      dst.add_record(*record);
  }

  ABSL_LOG(INFO) << dst.size() << " atom type definitions selected";
}

std::optional<TrimError> copy_nonbonded(ForceField &out, const ForceField &ff,
                                        const AtomTypeTable &table) {
  ForceFieldSection &dst = out.section(constants::kNonbondedSection);

  std::vector<const ForceFieldRecord *> records =
      ff.find_records(constants::kNonbondedSection, constants::kNonbondedTag);
  for (int i = 0; i < records.size(); ++i) {
    const std::string *type = records[i]->find("type");
    if (ABSL_PREDICT_FALSE(type == nullptr)) {
      ABSL_LOG(WARNING) << "Nonbonded record #" << i << " has no atom type";
      return TrimError { TrimErrorCode::kMalformedRecord, std::nullopt,
                         std::string(constants::kNonbondedSection), i,
                         "missing attribute type" };
    }

    if (table.contains(*type))
      dst.add_record(*records[i]);
  }

  ABSL_LOG(INFO) << dst.size() << " nonbonded records selected";
  return std::nullopt;
}

std::optional<TrimError>
trim_interactions(ForceField &out, KindReport &report,
                  const TypedStructure &structure, const ForceField &ff,
                  const AtomTypeTable &table, InteractionKind kind,
                  const TrimOptions &options) {
  report.kind = kind;

  std::vector<const ForceFieldRecord *> records =
      ff.find_records(options.tag(kind));

  SchemaError serr;
  auto [candidates, ok] = prioritize_candidates(records, kind, &serr);
  if (ABSL_PREDICT_FALSE(!ok)) {
    return TrimError { TrimErrorCode::kMalformedRecord, kind,
                       options.tag(kind), serr.record,
                       absl::StrCat("missing attribute ", serr.key) };
  }

  std::vector<TypeTuple> tuples = structure.type_tuples(kind);
  std::vector<TypeTuple> unique = unique_interactions(tuples, kind);
  MatchResult result = match_parameters(candidates, table, unique, kind);

  ForceFieldSection &dst = out.section(options.section(kind));
  for (int idx: result.matched)
    dst.add_record(*candidates[idx].record);

  report.num_interactions = static_cast<int>(tuples.size());
  report.num_unique = static_cast<int>(unique.size());
  report.num_candidates = static_cast<int>(candidates.size());
  report.num_matched = static_cast<int>(result.matched.size());
  report.unmatched = std::move(result.unmatched);

  ABSL_LOG_IF(INFO, !report.unmatched.empty())
      << report.unmatched.size() << " of " << report.num_unique << " unique "
      << kind << " interactions have no parameters";
  return std::nullopt;
}

void fail(TrimResult &result, TrimError err) {
  ABSL_LOG(ERROR) << "Failed to trim force field: " << err;
  result.forcefield.clear();
  result.error = std::move(err);
}
}  // namespace

ForceField make_template(const ForceField &source, const TrimOptions &options) {
  ForceField out;
  if (options.templ != nullptr)
    out = *options.templ;

  copy_attrs(out.attrs(), source.attrs());

  ensure_section(out, source, constants::kAtomTypesSection);
  for (InteractionKind kind: kInteractionKinds)
    ensure_section(out, source, options.section(kind));
  ensure_section(out, source, constants::kNonbondedSection);

  return out;
}

TrimResult trim_forcefield(const TypedStructure &structure,
                           const ForceField &ff, const TrimOptions &options) {
  TrimResult result;

  std::optional<TrimError> err = check_structure(structure);
  if (err) {
    fail(result, std::move(*err));
    return result;
  }

  int bad_record = -1;
  auto [defs, ok] = atom_type_definitions(ff, &bad_record);
  if (ABSL_PREDICT_FALSE(!ok)) {
    fail(result, { TrimErrorCode::kMalformedRecord, std::nullopt,
                   std::string(constants::kAtomTypesSection), bad_record,
                   "missing attribute name" });
    return result;
  }

  const TypedStructure *src = &structure;
  TypedStructure derived;
  if (options.derive_topology) {
    derived = structure;
    derived.derive_interactions();
    src = &derived;
  }

  result.atom_types = resolve_atom_types(src->atom_types(), defs);
  result.forcefield = make_template(ff, options);

  copy_atom_types(result.forcefield, ff, result.atom_types);
  err = copy_nonbonded(result.forcefield, ff, result.atom_types);

  for (InteractionKind kind: kInteractionKinds) {
    if (err)
      break;

    err = trim_interactions(result.forcefield, result.reports[kind_index(kind)],
                            *src, ff, result.atom_types, kind, options);
  }

  if (err)
    fail(result, std::move(*err));

  return result;
}
}  // namespace fftrim
