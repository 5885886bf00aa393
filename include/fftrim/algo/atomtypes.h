//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef FFTRIM_ALGO_ATOMTYPES_H_
#define FFTRIM_ALGO_ATOMTYPES_H_

//! @cond
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/log/absl_check.h>
//! @endcond

#include "fftrim/core/forcefield.h"

namespace fftrim {
/**
 * @brief Atom type to atom class mapping for the atom types used by a
 *        structure, including the types reachable through overrides.
 *
 * Entries are stored in discovery order: the types present in the structure
 * first (in the given order), then the override targets in the order they were
 * discovered.
 */
class AtomTypeTable {
public:
  struct Entry {
    std::string name;
    // Empty if no definition record provides a class for this type.
    std::string type_class;
    // Whether a definition record for this type was found.
    bool defined = false;
    // Whether this type is known only as the target of an override.
    bool from_override = false;

    bool resolved() const { return !type_class.empty(); }
  };

  using const_iterator = std::vector<Entry>::const_iterator;

  AtomTypeTable() = default;

  /**
   * @brief Add an atom type with unresolved class.
   * @return The index of the entry. If the type is already in the table, the
   *         index of the existing entry.
   */
  int add_type(std::string_view name, bool from_override = false);

  Entry &operator[](int idx) {
    ABSL_DCHECK(0 <= idx && idx < size());
    return entries_[idx];
  }

  const Entry &operator[](int idx) const {
    ABSL_DCHECK(0 <= idx && idx < size());
    return entries_[idx];
  }

  /**
   * @brief Find the entry of an atom type.
   * @return Pointer to the entry, or nullptr if the type is not in the table.
   */
  const Entry *find(std::string_view name) const;

  bool contains(std::string_view name) const {
    return index_.find(name) != index_.end();
  }

  /**
   * @brief Get the resolved class of an atom type.
   * @return Pointer to the class, or nullptr if the type is not in the table or
   *         its class is unresolved.
   */
  const std::string *class_of(std::string_view name) const;

  /**
   * @brief Atom types known only through overrides, in discovery order.
   */
  std::vector<std::string> notes() const;

  /**
   * @brief Atom types whose class could not be resolved, in discovery order.
   */
  std::vector<std::string> unresolved() const;

  int size() const { return static_cast<int>(entries_.size()); }

  bool empty() const { return entries_.empty(); }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

private:
  std::vector<Entry> entries_;
  absl::flat_hash_map<std::string, int> index_;
};

/**
 * @brief Resolve the atom classes of the given atom types.
 * @param present The atom types present in the structure.
 * @param defs The atom type definitions of the force field.
 * @return The resolved atom type table.
 *
 * The table is the closure of \p present under the override relation. Each
 * known type is looked up in \p defs (the last definition of a name provides
 * the class), and the types overridden by any of its definitions that are not
 * yet known are enqueued. Processing stops
 * when the queue is empty, so each type is processed exactly once. Override
 * targets are reported with an informational log message. Types without a
 * definition are kept in the table with an unresolved class.
 */
extern AtomTypeTable
resolve_atom_types(const std::vector<std::string> &present,
                   const std::vector<AtomTypeDefinition> &defs);
}  // namespace fftrim

#endif /* FFTRIM_ALGO_ATOMTYPES_H_ */
