//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/tools/trim.h"

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/match.h>
#include <gtest/gtest.h>

#include "test_utils.h"
#include "fftrim/core/attributes.h"
#include "fftrim/core/forcefield.h"
#include "fftrim/core/interaction.h"
#include "fftrim/core/structure.h"
#include "fftrim/fmt/base.h"
#include "fftrim/fmt/ffxml.h"
#include "fftrim/fmt/mol2.h"

namespace fftrim {
namespace {
std::vector<std::string> values_of(const ForceFieldSection &sec,
                                   std::string_view key) {
  std::vector<std::string> ret;
  for (const ForceFieldRecord &record: sec.records())
    ret.emplace_back(record.get(key));
  return ret;
}

std::vector<std::string> section_names(const ForceField &ff) {
  std::vector<std::string> ret;
  for (const ForceFieldSection &sec: ff.sections())
    ret.push_back(sec.name());
  return ret;
}

class TrimForceFieldTest: public ::testing::Test {
protected:
  void SetUp() override {
    ff_.attrs().emplace_back("name", "toy");

    ForceFieldSection &types = ff_.section("AtomTypes");
    types.add_record(
        ForceFieldRecord("Type", { { "name", "t1" }, { "class", "c1" } }));
    types.add_record(
        ForceFieldRecord("Type", { { "name", "t2" }, { "class", "c2" } }));
    types.add_record(
        ForceFieldRecord("Type", { { "name", "t3" }, { "class", "c3" } }));

    ff_.section("HarmonicBondForce")
        .add_record(ForceFieldRecord(
            "Bond", { { "class1", "c1" }, { "class2", "c2" }, { "k", "1" } }));
    ff_.section("HarmonicAngleForce")
        .add_record(ForceFieldRecord("Angle", { { "class1", "c1" },
                                                { "class2", "c2" },
                                                { "class3", "c1" },
                                                { "k", "2" } }));

    ForceFieldSection &nb = ff_.section("NonbondedForce");
    nb.attrs().emplace_back("lj14scale", "0.5");
    for (const char *type: { "t1", "t2", "t3" })
      nb.add_record(ForceFieldRecord("Atom", { { "type", type } }));

    internal::add_chain(structure_, { "t1", "t2", "t1" });
  }

  ForceField ff_;
  TypedStructure structure_;
};

TEST_F(TrimForceFieldTest, SymmetricBondsEmittedOnce) {
  TrimResult result = trim_forcefield(structure_, ff_);
  ASSERT_TRUE(result.ok()) << *result.error;

  const ForceField &out = result.forcefield;
  EXPECT_EQ(section_names(out), (std::vector<std::string> {
                                    "AtomTypes",
                                    "HarmonicBondForce",
                                    "HarmonicAngleForce",
                                    "RBTorsionForce",
                                    "PeriodicTorsionForce",
                                    "NonbondedForce",
                                }));

  EXPECT_EQ(internal::get_key(out.attrs(), "name"), "toy");
  EXPECT_EQ(values_of(*out.find_section("AtomTypes"), "name"),
            (std::vector<std::string> { "t1", "t2" }));
  EXPECT_EQ(out.find_section("HarmonicBondForce")->size(), 1);
  EXPECT_EQ(out.find_section("HarmonicAngleForce")->size(), 1);
  EXPECT_TRUE(out.find_section("RBTorsionForce")->empty());
  EXPECT_TRUE(out.find_section("PeriodicTorsionForce")->empty());

  const ForceFieldSection *nb = out.find_section("NonbondedForce");
  EXPECT_EQ(internal::get_key(nb->attrs(), "lj14scale"), "0.5");
  EXPECT_EQ(values_of(*nb, "type"), (std::vector<std::string> { "t1", "t2" }));

  const KindReport &bonds = result.report(InteractionKind::kBond);
  EXPECT_EQ(bonds.num_interactions, 2);
  EXPECT_EQ(bonds.num_unique, 1);
  EXPECT_EQ(bonds.num_candidates, 1);
  EXPECT_EQ(bonds.num_matched, 1);
  EXPECT_TRUE(bonds.unmatched.empty());
}

TEST_F(TrimForceFieldTest, UnmatchedInteractions) {
  const int t3 = structure_.add_atom("X", "t3");
  ASSERT_TRUE(structure_.add_bond(2, t3));

  TrimResult result = trim_forcefield(structure_, ff_);
  ASSERT_TRUE(result.ok());

  const KindReport &bonds = result.report(InteractionKind::kBond);
  EXPECT_EQ(bonds.num_unique, 2);
  EXPECT_EQ(bonds.num_matched, 1);
  ASSERT_EQ(bonds.unmatched.size(), 1);
  EXPECT_EQ(bonds.unmatched[0], (TypeTuple { "t1", "t3" }));

  const KindReport &angles = result.report(InteractionKind::kAngle);
  EXPECT_EQ(angles.num_unique, 2);
  EXPECT_EQ(angles.unmatched.size(), 1);

  EXPECT_EQ(result.report(InteractionKind::kProper).unmatched.size(), 1);
}

TEST_F(TrimForceFieldTest, UndefinedAtomType) {
  const int tx = structure_.add_atom("X", "tx");
  ASSERT_TRUE(structure_.add_bond(0, tx));

  TrimResult result = trim_forcefield(structure_, ff_);
  ASSERT_TRUE(result.ok());

  EXPECT_EQ(result.atom_types.unresolved(),
            (std::vector<std::string> { "tx" }));
  EXPECT_EQ(result.report(InteractionKind::kBond).unmatched.size(), 1);
}

TEST_F(TrimForceFieldTest, OverriddenTypesCopied) {
  ff_.sections()[0].records()[1].attrs().emplace_back("overrides", "t3");

  TrimResult result = trim_forcefield(structure_, ff_);
  ASSERT_TRUE(result.ok());

  EXPECT_EQ(result.atom_types.notes(), (std::vector<std::string> { "t3" }));
  EXPECT_EQ(values_of(*result.forcefield.find_section("AtomTypes"), "name"),
            (std::vector<std::string> { "t1", "t2", "t3" }));
  EXPECT_EQ(result.forcefield.find_section("NonbondedForce")->size(), 3);
}

TEST_F(TrimForceFieldTest, NoDerivation) {
  TrimOptions options;
  options.derive_topology = false;

  TrimResult result = trim_forcefield(structure_, ff_, options);
  ASSERT_TRUE(result.ok());

  EXPECT_EQ(result.report(InteractionKind::kBond).num_matched, 1);
  EXPECT_EQ(result.report(InteractionKind::kAngle).num_interactions, 0);
  EXPECT_TRUE(result.forcefield.find_section("HarmonicAngleForce")->empty());

  // Explicit interactions are used as given
  ASSERT_TRUE(structure_.add_interaction(InteractionKind::kAngle, { 0, 1, 2 }));
  result = trim_forcefield(structure_, ff_, options);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.report(InteractionKind::kAngle).num_matched, 1);
}

TEST_F(TrimForceFieldTest, CustomSections) {
  TrimOptions options;
  options.sections[kind_index(InteractionKind::kBond)] = "CustomBondForce";

  ff_.section("CustomBondForce")
      .add_record(ForceFieldRecord(
          "Bond", { { "type1", "t2" }, { "type2", "t1" }, { "k", "3" } }));

  TrimResult result = trim_forcefield(structure_, ff_, options);
  ASSERT_TRUE(result.ok());

  // Candidates are collected from every section by tag
  const ForceFieldSection *bonds =
      result.forcefield.find_section("CustomBondForce");
  ASSERT_NE(bonds, nullptr);
  EXPECT_EQ(values_of(*bonds, "k"), (std::vector<std::string> { "3" }));
  EXPECT_EQ(result.report(InteractionKind::kBond).num_candidates, 2);

  EXPECT_EQ(result.forcefield.find_section("HarmonicBondForce"), nullptr);
}

TEST_F(TrimForceFieldTest, UntypedStructure) {
  TrimResult result = trim_forcefield(TypedStructure(), ff_);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->code, TrimErrorCode::kUntypedStructure);
  EXPECT_TRUE(result.forcefield.empty());

  structure_.atom(1).set_type("");
  result = trim_forcefield(structure_, ff_);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->code, TrimErrorCode::kUntypedStructure);
  EXPECT_EQ(result.error->index, 1);
  EXPECT_TRUE(result.forcefield.empty());
}

TEST_F(TrimForceFieldTest, MalformedInteractionRecord) {
  ff_.section("HarmonicAngleForce")
      .add_record(ForceFieldRecord(
          "Angle", { { "class1", "c1" }, { "type2", "t2" }, { "k", "4" } }));

  TrimResult result = trim_forcefield(structure_, ff_);
  ASSERT_FALSE(result.ok());

  const TrimError &err = *result.error;
  EXPECT_EQ(err.code, TrimErrorCode::kMalformedRecord);
  ASSERT_TRUE(err.kind.has_value());
  EXPECT_EQ(*err.kind, InteractionKind::kAngle);
  EXPECT_EQ(err.section, "Angle");
  EXPECT_EQ(err.index, 1);
  EXPECT_TRUE(result.forcefield.empty());

  std::ostringstream oss;
  oss << err;
  EXPECT_EQ(oss.str(),
            "malformed record (angle) in Angle #1: missing attribute type3");
}

TEST_F(TrimForceFieldTest, MalformedAtomType) {
  ff_.sections()[0].add_record(ForceFieldRecord("Type", { { "class", "c4" } }));

  TrimResult result = trim_forcefield(structure_, ff_);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->code, TrimErrorCode::kMalformedRecord);
  EXPECT_EQ(result.error->section, "AtomTypes");
  EXPECT_EQ(result.error->index, 3);
}

TEST_F(TrimForceFieldTest, MalformedNonbonded) {
  ff_.find_section("NonbondedForce")
      ->add_record(ForceFieldRecord("Atom", { { "charge", "0.0" } }));

  TrimResult result = trim_forcefield(structure_, ff_);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->code, TrimErrorCode::kMalformedRecord);
  EXPECT_EQ(result.error->section, "NonbondedForce");
  EXPECT_EQ(result.error->index, 3);
}

TEST_F(TrimForceFieldTest, Template) {
  ForceField templ;
  templ.attrs().emplace_back("name", "template");
  templ.attrs().emplace_back("combining_rule", "geometric");
  templ.section("Info").add_record(
      ForceFieldRecord("Reference", { { "doi", "10.1021/ja9621760" } }));
  templ.section("NonbondedForce").attrs().emplace_back("coulomb14scale", "0.5");

  TrimOptions options;
  options.templ = &templ;

  TrimResult result = trim_forcefield(structure_, ff_, options);
  ASSERT_TRUE(result.ok());

  const ForceField &out = result.forcefield;
  EXPECT_EQ(internal::get_key(out.attrs(), "name"), "toy");
  EXPECT_EQ(internal::get_key(out.attrs(), "combining_rule"), "geometric");

  std::vector<std::string> names = section_names(out);
  ASSERT_EQ(names.size(), 7);
  EXPECT_EQ(names[0], "Info");
  EXPECT_EQ(names[1], "NonbondedForce");
  EXPECT_EQ(out.find_section("Info")->size(), 1);

  const ForceFieldSection *nb = out.find_section("NonbondedForce");
  EXPECT_EQ(nb->attrs(), (AttributeList {
                             { "coulomb14scale", "0.5" },
                             { "lj14scale", "0.5" },
                         }));
  EXPECT_EQ(nb->size(), 2);
}

TEST(MakeTemplateTest, EmptySource) {
  ForceField out = make_template(ForceField());
  EXPECT_EQ(out.root_tag(), "ForceField");
  EXPECT_TRUE(out.attrs().empty());
  EXPECT_EQ(out.sections().size(), 6);
  EXPECT_EQ(out.num_records(), 0);
}

TEST(TrimEthanolTest, EndToEnd) {
  FileStructureReader<> reader(internal::test_data("ethanol.mol2"));
  ASSERT_TRUE(reader);

  TypedStructure structure;
  StructureStream<> stream = reader.stream();
  stream >> structure;
  ASSERT_EQ(structure.num_atoms(), 9);

  ForceField ff =
      read_forcefield_xml_file(internal::test_data("oplsaa_mini.xml"));
  ASSERT_FALSE(ff.empty());

  TrimResult result = trim_forcefield(structure, ff);
  ASSERT_TRUE(result.ok()) << *result.error;

  EXPECT_EQ(result.atom_types.notes(),
            (std::vector<std::string> { "opls_135", "opls_136" }));
  EXPECT_TRUE(result.atom_types.unresolved().empty());

  const ForceField &out = result.forcefield;
  EXPECT_EQ(internal::get_key(out.attrs(), "combining_rule"), "geometric");

  EXPECT_EQ(values_of(*out.find_section("AtomTypes"), "name"),
            (std::vector<std::string> { "opls_135", "opls_136", "opls_140",
                                        "opls_154", "opls_155",
                                        "opls_157" }));
  EXPECT_EQ(values_of(*out.find_section("NonbondedForce"), "type"),
            (std::vector<std::string> { "opls_135", "opls_136", "opls_140",
                                        "opls_154", "opls_155",
                                        "opls_157" }));

  // First-match order
  const ForceFieldSection *bonds = out.find_section("HarmonicBondForce");
  EXPECT_EQ(values_of(*bonds, "class1"),
            (std::vector<std::string> { "CT", "CT", "CT", "HO" }));
  EXPECT_EQ(values_of(*bonds, "class2"),
            (std::vector<std::string> { "CT", "OH", "HC", "OH" }));

  const ForceFieldSection *angles = out.find_section("HarmonicAngleForce");
  EXPECT_EQ(values_of(*angles, "k"),
            (std::vector<std::string> { "313.8", "276.144", "418.4", "292.88",
                                        "460.24" }));

  // Type-specific record takes precedence over the generic one
  const ForceFieldSection *propers = out.find_section("RBTorsionForce");
  EXPECT_EQ(values_of(*propers, "c0"),
            (std::vector<std::string> { "0.97905", "0.6276", "-0.4435",
                                        "0.7364" }));
  EXPECT_TRUE(propers->records()[0].has("type1"));

  EXPECT_TRUE(out.find_section("PeriodicTorsionForce")->empty());

  const KindReport &report = result.report(InteractionKind::kProper);
  EXPECT_EQ(report.num_interactions, 12);
  EXPECT_EQ(report.num_unique, 4);
  EXPECT_EQ(report.num_candidates, 7);
  EXPECT_TRUE(report.unmatched.empty());

  std::string data = FFTRIM_WRITE_ONCE(write_forcefield_xml, out);
  EXPECT_TRUE(
      absl::StartsWith(data, R"(<?xml version="1.0" encoding="UTF-8"?>)"));
  EXPECT_FALSE(absl::StrContains(data, "opls_145"));
  EXPECT_FALSE(absl::StrContains(data, "class1=\"CA\""));
}
}  // namespace
}  // namespace fftrim
