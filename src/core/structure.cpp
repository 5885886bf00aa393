//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/core/structure.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/base/optimization.h>
#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/types/span.h>

#include "fftrim/core/interaction.h"

namespace fftrim {
namespace {
using AdjList = std::vector<std::vector<int>>;

void derive_angles(std::vector<AtomTuple> &angles, const AdjList &adj) {
  for (int j = 0; j < adj.size(); ++j) {
    const std::vector<int> &nei = adj[j];
    for (int a = 0; a < nei.size(); ++a)
      for (int b = a + 1; b < nei.size(); ++b)
        angles.push_back({ nei[a], j, nei[b], -1 });
  }
}

void derive_propers(std::vector<AtomTuple> &propers,
                    const std::vector<AtomTuple> &bonds, const AdjList &adj) {
  for (const AtomTuple &bond: bonds) {
    const int j = bond[0], k = bond[1];

    for (int i: adj[j]) {
      if (i == k)
        continue;

      for (int l: adj[k]) {
        // l == i for three-membered rings
        if (l == j || l == i)
          continue;

        propers.push_back({ i, j, k, l });
      }
    }
  }
}

void derive_impropers(std::vector<AtomTuple> &impropers, const AdjList &adj) {
  for (int c = 0; c < adj.size(); ++c) {
    const std::vector<int> &nei = adj[c];
    if (nei.size() != 3)
      continue;

    impropers.push_back({ c, nei[0], nei[1], nei[2] });
  }
}

template <int N>
std::vector<TypeTuple> types_of(const std::vector<TypedAtom> &atoms,
                                const std::vector<AtomTuple> &tuples) {
  std::vector<TypeTuple> ret;
  ret.reserve(tuples.size());

  for (const AtomTuple &tuple: tuples) {
    TypeTuple &types = ret.emplace_back();
    for (int i = 0; i < N; ++i)
      types.push_back(atoms[tuple[i]].type());
  }

  return ret;
}
}  // namespace

int TypedStructure::add_atom(std::string name, std::string type) {
  atoms_.emplace_back(std::move(name), std::move(type));
  adj_.emplace_back();
  return num_atoms() - 1;
}

bool TypedStructure::add_bond(int src, int dst) {
  if (ABSL_PREDICT_FALSE(!valid_atom(src) || !valid_atom(dst))) {
    ABSL_LOG(WARNING) << "Bond " << src << " - " << dst
                      << " references an atom out of range";
    return false;
  }

  if (ABSL_PREDICT_FALSE(src == dst)) {
    ABSL_LOG(WARNING) << "Self-bond of atom " << src << " is not allowed";
    return false;
  }

  if (absl::c_linear_search(adj_[src], dst)) {
    ABSL_LOG(WARNING) << "Duplicate bond " << src << " - " << dst;
    return false;
  }

  adj_[src].push_back(dst);
  adj_[dst].push_back(src);
  interactions_of(InteractionKind::kBond).push_back({ src, dst, -1, -1 });
  return true;
}

bool TypedStructure::add_interaction(InteractionKind kind,
                                     absl::Span<const int> atoms) {
  if (kind == InteractionKind::kBond) {
    if (atoms.size() != 2) {
      ABSL_LOG(WARNING) << "A bond must have exactly 2 atoms";
      return false;
    }
    return add_bond(atoms[0], atoms[1]);
  }

  if (ABSL_PREDICT_FALSE(atoms.size() != interaction_arity(kind))) {
    ABSL_LOG(WARNING) << "Expected " << interaction_arity(kind)
                      << " atoms for " << kind << ", got " << atoms.size();
    return false;
  }

  AtomTuple tuple = { -1, -1, -1, -1 };
  absl::flat_hash_set<int> seen;
  for (int i = 0; i < atoms.size(); ++i) {
    if (ABSL_PREDICT_FALSE(!valid_atom(atoms[i]))) {
      ABSL_LOG(WARNING) << "Atom index " << atoms[i] << " out of range in "
                        << kind;
      return false;
    }

    if (ABSL_PREDICT_FALSE(!seen.insert(atoms[i]).second)) {
      ABSL_LOG(WARNING) << "Atom " << atoms[i] << " appears twice in " << kind;
      return false;
    }

    tuple[i] = atoms[i];
  }

  interactions_of(kind).push_back(tuple);
  return true;
}

void TypedStructure::derive_interactions() {
  if (interactions(InteractionKind::kAngle).empty())
    derive_angles(interactions_of(InteractionKind::kAngle), adj_);

  if (interactions(InteractionKind::kProper).empty())
    derive_propers(interactions_of(InteractionKind::kProper),
                   interactions(InteractionKind::kBond), adj_);

  if (interactions(InteractionKind::kImproper).empty())
    derive_impropers(interactions_of(InteractionKind::kImproper), adj_);
}

void TypedStructure::clear() {
  name_.clear();
  atoms_.clear();
  adj_.clear();
  for (std::vector<AtomTuple> &tuples: interactions_)
    tuples.clear();
}

std::vector<TypeTuple> TypedStructure::type_tuples(InteractionKind kind) const {
  switch (kind) {
  case InteractionKind::kBond:
    return types_of<2>(atoms_, interactions(kind));
  case InteractionKind::kAngle:
    return types_of<3>(atoms_, interactions(kind));
  case InteractionKind::kProper:
    return types_of<4>(atoms_, interactions(kind));
  case InteractionKind::kImproper:
    return types_of<4>(atoms_, interactions(kind));
  }

  ABSL_UNREACHABLE();
}

std::vector<std::string> TypedStructure::atom_types() const {
  std::vector<std::string> types;
  absl::flat_hash_set<std::string_view> seen;

  for (const TypedAtom &atom: atoms_) {
    if (!atom.is_typed())
      continue;

    if (seen.insert(atom.type()).second)
      types.push_back(atom.type());
  }

  return types;
}

bool TypedStructure::is_typed() const {
  return !empty() && absl::c_all_of(atoms_, [](const TypedAtom &atom) {
    return atom.is_typed();
  });
}
}  // namespace fftrim
