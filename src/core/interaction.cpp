//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/core/interaction.h"

#include <ostream>
#include <string_view>

#include <absl/base/optimization.h>
#include <absl/strings/str_join.h>
#include <absl/types/span.h>

namespace fftrim {
namespace {
constexpr Ordering kTwoBodyOrders[] = {
  { 0, 1, -1, -1 },
  { 1, 0, -1, -1 },
};

constexpr Ordering kThreeBodyOrders[] = {
  { 0, 1, 2, -1 },
  { 2, 1, 0, -1 },
};

constexpr Ordering kChainOrders[] = {
  { 0, 1, 2, 3 },
  { 3, 2, 1, 0 },
};

// Central atom first, all permutations of the peripheral atoms
constexpr Ordering kStarOrders[] = {
  { 0, 1, 2, 3 }, { 0, 1, 3, 2 }, { 0, 2, 1, 3 },
  { 0, 2, 3, 1 }, { 0, 3, 1, 2 }, { 0, 3, 2, 1 },
};
}  // namespace

absl::Span<const Ordering> equivalent_orderings(InteractionKind kind) {
  switch (kind) {
  case InteractionKind::kBond:
    return kTwoBodyOrders;
  case InteractionKind::kAngle:
    return kThreeBodyOrders;
  case InteractionKind::kProper:
    return kChainOrders;
  case InteractionKind::kImproper:
    return kStarOrders;
  }

  ABSL_UNREACHABLE();
}

std::string_view interaction_tag(InteractionKind kind) {
  switch (kind) {
  case InteractionKind::kBond:
    return "Bond";
  case InteractionKind::kAngle:
    return "Angle";
  case InteractionKind::kProper:
    return "Proper";
  case InteractionKind::kImproper:
    return "Improper";
  }

  ABSL_UNREACHABLE();
}

std::ostream &operator<<(std::ostream &os, InteractionKind kind) {
  switch (kind) {
  case InteractionKind::kBond:
    return os << "bond";
  case InteractionKind::kAngle:
    return os << "angle";
  case InteractionKind::kProper:
    return os << "proper torsion";
  case InteractionKind::kImproper:
    return os << "improper torsion";
  }

  return os << "unknown";
}

std::ostream &operator<<(std::ostream &os, const TypeTuple &tuple) {
  return os << '(' << absl::StrJoin(tuple, ", ") << ')';
}
}  // namespace fftrim
