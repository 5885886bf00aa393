//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/core/structure.h"

#include <string>
#include <vector>

#include <absl/algorithm/container.h>

#include <gtest/gtest.h>

#include "test_utils.h"
#include "fftrim/core/interaction.h"

namespace fftrim {
namespace {
// Propane-like chain with a branching center:
//
//   0 - 1 - 2
//       |
//       3
class BranchedStructureTest: public ::testing::Test {
protected:
  void SetUp() override {
    structure_.add_atom("C1", "CT3");
    structure_.add_atom("C2", "CT1");
    structure_.add_atom("C3", "CT3");
    structure_.add_atom("H1", "HC");

    ASSERT_TRUE(structure_.add_bond(0, 1));
    ASSERT_TRUE(structure_.add_bond(1, 2));
    ASSERT_TRUE(structure_.add_bond(1, 3));
  }

  TypedStructure structure_;
};

TEST_F(BranchedStructureTest, Basics) {
  EXPECT_EQ(structure_.num_atoms(), 4);
  EXPECT_EQ(structure_.num_bonds(), 3);
  EXPECT_TRUE(structure_.is_typed());

  EXPECT_EQ(structure_.neighbors(1), (std::vector<int> { 0, 2, 3 }));
  EXPECT_EQ(structure_.atom_types(),
            (std::vector<std::string> { "CT3", "CT1", "HC" }));
}

TEST_F(BranchedStructureTest, InvalidBonds) {
  EXPECT_FALSE(structure_.add_bond(0, 0));
  EXPECT_FALSE(structure_.add_bond(0, 4));
  EXPECT_FALSE(structure_.add_bond(-1, 2));
  EXPECT_FALSE(structure_.add_bond(1, 0));
  EXPECT_EQ(structure_.num_bonds(), 3);
}

TEST_F(BranchedStructureTest, InvalidInteractions) {
  EXPECT_FALSE(
      structure_.add_interaction(InteractionKind::kAngle, { 0, 1 }));
  EXPECT_FALSE(
      structure_.add_interaction(InteractionKind::kAngle, { 0, 1, 0 }));
  EXPECT_FALSE(
      structure_.add_interaction(InteractionKind::kProper, { 0, 1, 2, 7 }));
  EXPECT_EQ(structure_.num_interactions(InteractionKind::kAngle), 0);
  EXPECT_EQ(structure_.num_interactions(InteractionKind::kProper), 0);

  EXPECT_TRUE(structure_.add_interaction(InteractionKind::kBond, { 0, 2 }));
  EXPECT_EQ(structure_.num_bonds(), 4);
}

TEST_F(BranchedStructureTest, DeriveInteractions) {
  structure_.derive_interactions();

  // Three pairs of neighbors around the center
  EXPECT_EQ(structure_.num_interactions(InteractionKind::kAngle), 3);
  for (const AtomTuple &angle: structure_.interactions(InteractionKind::kAngle))
    EXPECT_EQ(angle[1], 1);

  // No atom has a neighbor on both sides of a bond
  EXPECT_EQ(structure_.num_interactions(InteractionKind::kProper), 0);

  ASSERT_EQ(structure_.num_interactions(InteractionKind::kImproper), 1);
  EXPECT_EQ(structure_.interactions(InteractionKind::kImproper)[0],
            (AtomTuple { 1, 0, 2, 3 }));
}

TEST_F(BranchedStructureTest, TypeTuples) {
  structure_.derive_interactions();

  std::vector<TypeTuple> bonds =
      structure_.type_tuples(InteractionKind::kBond);
  ASSERT_EQ(bonds.size(), 3);
  EXPECT_EQ(bonds[0], (TypeTuple { "CT3", "CT1" }));
  EXPECT_EQ(bonds[1], (TypeTuple { "CT1", "CT3" }));
  EXPECT_EQ(bonds[2], (TypeTuple { "CT1", "HC" }));

  std::vector<TypeTuple> impropers =
      structure_.type_tuples(InteractionKind::kImproper);
  ASSERT_EQ(impropers.size(), 1);
  EXPECT_EQ(impropers[0], (TypeTuple { "CT1", "CT3", "CT3", "HC" }));
}

TEST(StructureTest, DeriveProperTorsions) {
  TypedStructure structure;
  internal::add_chain(structure, { "HC", "CT", "CT", "HC" });

  structure.derive_interactions();
  EXPECT_EQ(structure.num_interactions(InteractionKind::kAngle), 2);
  ASSERT_EQ(structure.num_interactions(InteractionKind::kProper), 1);
  EXPECT_EQ(structure.interactions(InteractionKind::kProper)[0],
            (AtomTuple { 0, 1, 2, 3 }));
  EXPECT_EQ(structure.num_interactions(InteractionKind::kImproper), 0);
}

TEST(StructureTest, ThreeMemberedRing) {
  TypedStructure structure;
  internal::add_chain(structure, { "C", "C", "C" });
  ASSERT_TRUE(structure.add_bond(2, 0));

  structure.derive_interactions();
  EXPECT_EQ(structure.num_interactions(InteractionKind::kAngle), 3);
  // i == l for every path around the ring
  EXPECT_EQ(structure.num_interactions(InteractionKind::kProper), 0);
}

TEST(StructureTest, ExplicitInteractionsAreKept) {
  TypedStructure structure;
  internal::add_chain(structure, { "HC", "CT", "CT", "HC" });
  ASSERT_TRUE(
      structure.add_interaction(InteractionKind::kAngle, { 0, 1, 2 }));

  structure.derive_interactions();
  EXPECT_EQ(structure.num_interactions(InteractionKind::kAngle), 1);
  EXPECT_EQ(structure.num_interactions(InteractionKind::kProper), 1);
}

TEST(StructureTest, Untyped) {
  TypedStructure structure;
  EXPECT_FALSE(structure.is_typed());

  structure.add_atom("C1", "CT");
  structure.add_atom("X", "");
  EXPECT_FALSE(structure.is_typed());
  EXPECT_EQ(structure.atom_types(), (std::vector<std::string> { "CT" }));

  structure.atom(1).set_type("HC");
  EXPECT_TRUE(structure.is_typed());

  structure.clear();
  EXPECT_TRUE(structure.empty());
  EXPECT_EQ(structure.num_bonds(), 0);
}
}  // namespace
}  // namespace fftrim
