//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_CORE_FORCEFIELD_H_
#define FFTRIM_CORE_FORCEFIELD_H_

//! @cond
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//! @endcond

#include "fftrim/core/attributes.h"

namespace fftrim {
namespace constants {
  constexpr std::string_view kForceFieldTag = "ForceField";
  constexpr std::string_view kAtomTypesSection = "AtomTypes";
  constexpr std::string_view kAtomTypeTag = "Type";
  constexpr std::string_view kNonbondedSection = "NonbondedForce";
  constexpr std::string_view kNonbondedTag = "Atom";
}  // namespace constants

/**
 * @brief A single parameter record of a force field document, e.g.
 *        `<Bond class1="CT" class2="HC" length="0.109" k="284512.0"/>`.
 *
 * The attribute payload is opaque and kept in document order.
 */
class ForceFieldRecord {
public:
  explicit ForceFieldRecord(std::string tag, AttributeList attrs = {})
      : tag_(std::move(tag)), attrs_(std::move(attrs)) { }

  const std::string &tag() const { return tag_; }

  AttributeList &attrs() { return attrs_; }
  const AttributeList &attrs() const { return attrs_; }

  const std::string *find(std::string_view key) const {
    return internal::find_value(attrs_, key);
  }

  std::string_view get(std::string_view key) const {
    return internal::get_key(attrs_, key);
  }

  bool has(std::string_view key) const {
    return internal::has_key(attrs_, key);
  }

private:
  std::string tag_;
  AttributeList attrs_;
};

/**
 * @brief A top-level section of a force field document, e.g.
 *        `<HarmonicBondForce>`.
 */
class ForceFieldSection {
public:
  explicit ForceFieldSection(std::string name, AttributeList attrs = {})
      : name_(std::move(name)), attrs_(std::move(attrs)) { }

  const std::string &name() const { return name_; }

  AttributeList &attrs() { return attrs_; }
  const AttributeList &attrs() const { return attrs_; }

  std::vector<ForceFieldRecord> &records() { return records_; }
  const std::vector<ForceFieldRecord> &records() const { return records_; }

  ForceFieldRecord &add_record(ForceFieldRecord record) {
    return records_.emplace_back(std::move(record));
  }

  int size() const { return static_cast<int>(records_.size()); }

  bool empty() const { return records_.empty(); }

private:
  std::string name_;
  AttributeList attrs_;
  std::vector<ForceFieldRecord> records_;
};

/**
 * @brief An in-memory force field document.
 *
 * The document is modeled as a root element holding an ordered list of
 * sections, each of which holds an ordered list of records. This is the shape
 * of the OpenMM/Foyer force field XML format.
 */
class ForceField {
public:
  ForceField() = default;

  std::string &root_tag() { return root_tag_; }
  const std::string &root_tag() const { return root_tag_; }

  AttributeList &attrs() { return attrs_; }
  const AttributeList &attrs() const { return attrs_; }

  std::vector<ForceFieldSection> &sections() { return sections_; }
  const std::vector<ForceFieldSection> &sections() const { return sections_; }

  /**
   * @brief Find the first section with the given name.
   * @return Pointer to the section, or nullptr if not found.
   */
  ForceFieldSection *find_section(std::string_view name);

  const ForceFieldSection *find_section(std::string_view name) const;

  /**
   * @brief Find the first section with the given name, appending an empty one
   *        if there is none.
   */
  ForceFieldSection &section(std::string_view name);

  ForceFieldSection &add_section(ForceFieldSection section) {
    return sections_.emplace_back(std::move(section));
  }

  /**
   * @brief Find all records with the given tag in any section, in document
   *        order.
   */
  std::vector<const ForceFieldRecord *>
  find_records(std::string_view tag) const;

  /**
   * @brief Find all records with the given tag in the sections of the given
   *        name, in document order.
   */
  std::vector<const ForceFieldRecord *>
  find_records(std::string_view section, std::string_view tag) const;

  int num_records() const;

  bool empty() const { return sections_.empty() && attrs_.empty(); }

  void clear();

private:
  std::string root_tag_ = std::string(constants::kForceFieldTag);
  AttributeList attrs_;
  std::vector<ForceFieldSection> sections_;
};

/**
 * @brief An atom type definition (`<Type>` record) of a force field document.
 */
struct AtomTypeDefinition {
  std::string name;
  // Empty if the record does not define a class.
  std::string type_class;
  std::vector<std::string> overrides;
};

/**
 * @brief Collect the atom type definitions of a force field document.
 * @param ff The force field document.
 * @param bad_record If not null and the collection fails, set to the index of
 *        the offending record within the atom type records.
 * @return A pair of (definitions in document order, success). This fails if
 *         any atom type record has no name attribute.
 *
 * The comma-separated `overrides` attribute is split into its items; blank
 * items are ignored and surrounding whitespace is stripped.
 */
extern std::pair<std::vector<AtomTypeDefinition>, bool>
atom_type_definitions(const ForceField &ff, int *bad_record = nullptr);
}  // namespace fftrim

#endif /* FFTRIM_CORE_FORCEFIELD_H_ */
