//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/algo/schema.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <absl/base/optimization.h>
#include <absl/log/absl_log.h>
#include <absl/strings/str_cat.h>

#include "fftrim/core/attributes.h"
#include "fftrim/core/forcefield.h"
#include "fftrim/core/interaction.h"

namespace fftrim {
namespace {
std::string class_key(int pos) {
  return absl::StrCat("class", pos + 1);
}

std::string type_key(int pos) {
  return absl::StrCat("type", pos + 1);
}
}  // namespace

std::string RecordSchema::key(int pos) const {
  return constraint(pos) == Constraint::kClass ? class_key(pos) : type_key(pos);
}

std::pair<RecordSchema, bool>
classify_record(const AttributeList &attrs, int arity, SchemaError *err) {
  std::pair<RecordSchema, bool> ret { {}, true };
  RecordSchema &schema = ret.first;

  for (int i = 0; i < arity; ++i) {
    const std::string *value = internal::find_value(attrs, class_key(i));
    if (value != nullptr) {
      schema.add(Constraint::kClass, *value);
      continue;
    }

    std::string key = type_key(i);
    value = internal::find_value(attrs, key);
    if (ABSL_PREDICT_FALSE(value == nullptr)) {
      if (err != nullptr) {
        err->position = i;
        err->key = std::move(key);
      }
      ret.second = false;
      return ret;
    }

    schema.add(Constraint::kType, *value);
  }

  return ret;
}

std::pair<std::vector<CandidateRecord>, bool>
prioritize_candidates(const std::vector<const ForceFieldRecord *> &records,
                      InteractionKind kind, SchemaError *err) {
  std::pair<std::vector<CandidateRecord>, bool> ret { {}, true };
  std::vector<CandidateRecord> &candidates = ret.first;
  candidates.reserve(records.size());

  const int arity = interaction_arity(kind);
  for (int i = 0; i < records.size(); ++i) {
    auto [schema, ok] = classify_record(records[i]->attrs(), arity, err);
    if (ABSL_PREDICT_FALSE(!ok)) {
      ABSL_LOG(WARNING) << kind << " record #" << i
                        << " does not constrain every atom position";
      if (err != nullptr)
        err->record = i;
      ret.second = false;
      return ret;
    }

    candidates.push_back({ i, records[i], std::move(schema) });
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const CandidateRecord &lhs, const CandidateRecord &rhs) {
                     return lhs.schema.weight() < rhs.schema.weight();
                   });

  return ret;
}
}  // namespace fftrim
