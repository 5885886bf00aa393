//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef FFTRIM_ALGO_SCHEMA_H_
#define FFTRIM_ALGO_SCHEMA_H_

//! @cond
#include <string>
#include <utility>
#include <vector>

#include <absl/container/inlined_vector.h>
#include <absl/log/absl_check.h>
//! @endcond

#include "fftrim/core/attributes.h"
#include "fftrim/core/forcefield.h"
#include "fftrim/core/interaction.h"

namespace fftrim {
/**
 * @brief How an atom position of a parameter record is constrained.
 */
enum class Constraint {
  kType,
  kClass,
};

/**
 * @brief Per-position constraints of a parameter record.
 *
 * The weight is the number of class-constrained positions; records with lower
 * weight are more specific.
 */
class RecordSchema {
public:
  RecordSchema() = default;

  int arity() const { return static_cast<int>(constraints_.size()); }

  int weight() const { return weight_; }

  Constraint constraint(int pos) const {
    ABSL_DCHECK(0 <= pos && pos < arity());
    return constraints_[pos];
  }

  /**
   * @brief The atom type or atom class the position is constrained to.
   */
  const std::string &value(int pos) const {
    ABSL_DCHECK(0 <= pos && pos < arity());
    return values_[pos];
  }

  /**
   * @brief Name of the attribute constraining the position, e.g. "class1" or
   *        "type2". Note that the attribute names are 1-indexed.
   */
  std::string key(int pos) const;

  void add(Constraint constraint, std::string value) {
    constraints_.push_back(constraint);
    values_.push_back(std::move(value));
    weight_ += static_cast<int>(constraint == Constraint::kClass);
  }

  void clear() {
    constraints_.clear();
    values_.clear();
    weight_ = 0;
  }

private:
  absl::InlinedVector<Constraint, 4> constraints_;
  absl::InlinedVector<std::string, 4> values_;
  int weight_ = 0;
};

/**
 * @brief Details of a record that could not be classified.
 */
struct SchemaError {
  // Index of the record within the candidate records.
  int record = -1;
  // Zero-based atom position.
  int position = -1;
  // The attribute expected at the position.
  std::string key;
};

/**
 * @brief Infer the schema of a parameter record.
 * @param attrs The attributes of the record.
 * @param arity Number of atoms of the interaction kind.
 * @param err If not null and the classification fails, set to the offending
 *        position and the expected attribute.
 * @return A pair of (schema, success). Position `i` is class-constrained if
 *         the record has a `class<i+1>` attribute, otherwise it is
 *         type-constrained and the record must have a `type<i+1>` attribute.
 *         If the latter is missing, the classification fails.
 */
extern std::pair<RecordSchema, bool>
classify_record(const AttributeList &attrs, int arity,
                SchemaError *err = nullptr);

/**
 * @brief A classified parameter record.
 */
struct CandidateRecord {
  // Index of the record in document order.
  int index;
  const ForceFieldRecord *record;
  RecordSchema schema;
};

/**
 * @brief Classify and order the candidate parameter records of an interaction
 *        kind.
 * @param records The parameter records, in document order.
 * @param kind The interaction kind.
 * @param err If not null and the classification fails, set to the details of
 *        the first malformed record.
 * @return A pair of (candidates, success). Candidates are sorted by ascending
 *         weight, and records with the same weight keep the document order. If
 *         success is `false`, the vector is in an unspecified state.
 */
extern std::pair<std::vector<CandidateRecord>, bool>
prioritize_candidates(const std::vector<const ForceFieldRecord *> &records,
                      InteractionKind kind, SchemaError *err = nullptr);
}  // namespace fftrim

#endif /* FFTRIM_ALGO_SCHEMA_H_ */
