//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_CORE_STRUCTURE_H_
#define FFTRIM_CORE_STRUCTURE_H_

//! @cond
#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/base/attributes.h>
#include <absl/log/absl_check.h>
#include <absl/types/span.h>
//! @endcond

#include "fftrim/core/interaction.h"

namespace fftrim {
class TypedAtom {
public:
  TypedAtom(std::string name, std::string type)
      : name_(std::move(name)), type_(std::move(type)) { }

  const std::string &name() const { return name_; }

  /**
   * @brief The force field atom type assigned to this atom. Empty if the atom
   *        is not typed.
   */
  const std::string &type() const { return type_; }

  void set_type(std::string type) { type_ = std::move(type); }

  bool is_typed() const { return !type_.empty(); }

private:
  std::string name_;
  std::string type_;
};

/**
 * @brief Atom indices of one interaction. Entries after interaction_arity()
 *        of the kind are -1.
 */
using AtomTuple = std::array<int, 4>;

/**
 * @brief A molecular structure whose atoms carry force field atom types.
 *
 * Bonds are stored as two-body interactions. Angles, proper torsions and
 * impropers may be added explicitly or derived from the bond graph with
 * derive_interactions().
 */
class TypedStructure {
public:
  TypedStructure() = default;

  /**
   * @brief Add an atom to the structure.
   * @return The index of the new atom.
   */
  int add_atom(std::string name, std::string type);

  /**
   * @brief Add a bond between two atoms.
   * @return false if any of the indices is out of range, if src == dst, or if
   *         the bond already exists. The structure is not modified in that
   *         case.
   */
  ABSL_MUST_USE_RESULT bool add_bond(int src, int dst);

  /**
   * @brief Add an interaction of the given kind.
   * @param kind The interaction kind. Bonds must be added with add_bond().
   * @param atoms Atom indices; the size must match the arity of the kind.
   * @return false if the interaction is invalid. The structure is not
   *         modified in that case.
   */
  ABSL_MUST_USE_RESULT bool add_interaction(InteractionKind kind,
                                            absl::Span<const int> atoms);

  /**
   * @brief Derive angles, proper torsions and impropers from the bonds.
   *
   * Only kinds without any interactions are derived. Angles are all i-j-k
   * paths, proper torsions all i-j-k-l paths with distinct terminal atoms
   * enumerated per j-k bond, and impropers are formed by each atom with
   * exactly three neighbors (center first, neighbors in bond order).
   */
  void derive_interactions();

  void clear();

  int num_atoms() const { return static_cast<int>(atoms_.size()); }

  int size() const { return num_atoms(); }

  bool empty() const { return atoms_.empty(); }

  const TypedAtom &atom(int idx) const {
    ABSL_DCHECK(0 <= idx && idx < num_atoms());
    return atoms_[idx];
  }

  TypedAtom &atom(int idx) {
    ABSL_DCHECK(0 <= idx && idx < num_atoms());
    return atoms_[idx];
  }

  const std::vector<TypedAtom> &atoms() const { return atoms_; }

  const std::vector<int> &neighbors(int idx) const {
    ABSL_DCHECK(0 <= idx && idx < num_atoms());
    return adj_[idx];
  }

  int num_bonds() const { return num_interactions(InteractionKind::kBond); }

  int num_interactions(InteractionKind kind) const {
    return static_cast<int>(interactions(kind).size());
  }

  const std::vector<AtomTuple> &interactions(InteractionKind kind) const {
    return interactions_[kind_index(kind)];
  }

  /**
   * @brief Atom types of each interaction of the given kind, in the order the
   *        interactions are stored.
   */
  std::vector<TypeTuple> type_tuples(InteractionKind kind) const;

  /**
   * @brief Distinct atom types of the structure, in order of first
   *        occurrence.
   */
  std::vector<std::string> atom_types() const;

  /**
   * @brief Test whether the structure is a typed structure, i.e., it has at
   *        least one atom and every atom carries an atom type.
   */
  bool is_typed() const;

  std::string &name() { return name_; }
  const std::string &name() const { return name_; }

private:
  bool valid_atom(int idx) const { return 0 <= idx && idx < num_atoms(); }

  std::vector<AtomTuple> &interactions_of(InteractionKind kind) {
    return interactions_[kind_index(kind)];
  }

  std::string name_;
  std::vector<TypedAtom> atoms_;
  std::vector<std::vector<int>> adj_;
  std::array<std::vector<AtomTuple>, kNumInteractionKinds> interactions_;
};
}  // namespace fftrim

#endif /* FFTRIM_CORE_STRUCTURE_H_ */
