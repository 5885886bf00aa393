//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_TOOLS_TRIM_H_
#define FFTRIM_TOOLS_TRIM_H_

//! @cond
#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
//! @endcond

#include "fftrim/algo/atomtypes.h"
#include "fftrim/core/forcefield.h"
#include "fftrim/core/interaction.h"
#include "fftrim/core/structure.h"

namespace fftrim {
struct TrimOptions {
  // Output section of the records of each interaction kind.
  std::array<std::string, kNumInteractionKinds> sections = {
    "HarmonicBondForce",
    "HarmonicAngleForce",
    "RBTorsionForce",
    "PeriodicTorsionForce",
  };

  // Element tag of the parameter records of each interaction kind.
  std::array<std::string, kNumInteractionKinds> tags = {
    "Bond",
    "Angle",
    "Proper",
    "Improper",
  };

  // Derive angles, proper torsions and impropers from the bonds for the
  // kinds that the structure does not provide.
  bool derive_topology = true;

  // If not null, used instead of the built-in output skeleton. Must outlive
  // the call to trim_forcefield().
  const ForceField *templ = nullptr;

  const std::string &section(InteractionKind kind) const {
    return sections[kind_index(kind)];
  }

  const std::string &tag(InteractionKind kind) const {
    return tags[kind_index(kind)];
  }
};

enum class TrimErrorCode {
  kUntypedStructure,
  kMalformedRecord,
};

std::ostream &operator<<(std::ostream &os, TrimErrorCode code);

struct TrimError {
  TrimErrorCode code;
  // The interaction kind of the malformed record, if any.
  std::optional<InteractionKind> kind;
  // Section or element tag of the malformed record.
  std::string section;
  // Index of the malformed record (or the untyped atom), -1 if not applicable.
  int index = -1;
  std::string detail;
};

std::ostream &operator<<(std::ostream &os, const TrimError &err);

struct KindReport {
  InteractionKind kind = InteractionKind::kBond;
  int num_interactions = 0;
  int num_unique = 0;
  int num_candidates = 0;
  int num_matched = 0;
  std::vector<TypeTuple> unmatched;
};

struct TrimResult {
  ForceField forcefield;
  AtomTypeTable atom_types;
  std::array<KindReport, kNumInteractionKinds> reports;
  std::optional<TrimError> error;

  bool ok() const { return !error.has_value(); }

  const KindReport &report(InteractionKind kind) const {
    return reports[kind_index(kind)];
  }
};

/**
 * @brief Create the empty output document.
 * @param source The source force field.
 * @param options Trimming options.
 * @return A document with the atom types section, one section per
 *         interaction kind and the nonbonded section, in that order. If
 *         `options.templ` is set, it is copied instead and only the missing
 *         sections are appended. The attributes of the root element and of
 *         each section are taken from \p source where it provides them.
 */
extern ForceField make_template(const ForceField &source,
                                const TrimOptions &options = {});

/**
 * @brief Trim a force field to the parameters used by a structure.
 * @param structure A typed structure.
 * @param ff The source force field.
 * @param options Trimming options.
 * @return The trim result. On failure, `error` is set and the output document
 *         is empty.
 *
 * The output contains the atom type definitions of the types used by the
 * structure (including the types reachable through overrides), their
 * nonbonded parameters, and the highest priority parameter record of each
 * unique interaction. Atom type and nonbonded records keep the document order,
 * and the bonded records are ordered by the first match.
 */
extern TrimResult trim_forcefield(const TypedStructure &structure,
                                  const ForceField &ff,
                                  const TrimOptions &options = {});
}  // namespace fftrim

#endif /* FFTRIM_TOOLS_TRIM_H_ */
