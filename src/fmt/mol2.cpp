//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/fmt/mol2.h"

#include <istream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <absl/container/inlined_vector.h>
#include <absl/log/absl_log.h>
#include <absl/strings/match.h>
#include <boost/fusion/include/std_tuple.hpp>
#include <boost/spirit/home/x3.hpp>

#include "fmt_internal.h"
#include "fftrim/core/structure.h"
#include "fftrim/fmt/base.h"
#include "fftrim/utils.h"

namespace fftrim {
namespace {
constexpr std::string_view kCommentIndicator = "****";

bool advance_header_unread(std::istream &is, std::vector<std::string> &block,
                           bool &read_mol_header) {
  bool first = true;

  std::string line;
  while (std::getline(is, line)) {
    if (absl::StartsWith(line, "#")) {
      continue;
    }

    if (absl::StartsWith(line, "@<TRIPOS>MOLECULE")) {
      if (first) {
        first = false;
      } else {
        read_mol_header = true;
        break;
      }
    }

    block.push_back(std::move(line));
  }

  return !block.empty();
}

void advance_header_read(std::istream &is, std::vector<std::string> &block,
                         bool &read_mol_header) {
  std::string line;

  block.push_back("@<TRIPOS>MOLECULE");

  while (std::getline(is, line)) {
    if (absl::StartsWith(line, "@<TRIPOS>MOLECULE")) {
      return;
    }

    if (absl::StartsWith(line, "#")) {
      continue;
    }

    block.push_back(std::move(line));
  }

  read_mol_header = false;
}
}  // namespace

bool TypedMol2Reader::getnext(std::vector<std::string> &block) {
  block.clear();

  if (read_mol_header_) {
    advance_header_read(*is_, block, read_mol_header_);
    return true;
  }

  return advance_header_unread(*is_, block, read_mol_header_);
}

const bool TypedMol2ReaderFactory::kRegistered =
    register_reader_factory<TypedMol2ReaderFactory>({ "mol2" });

namespace {
namespace x3 = boost::spirit::x3;

void parse_mol_block(TypedStructure &structure, Iter &it, const Iter end) {
  if (tripos_block_end(++it, end))
    return;

  structure.name() = *it == kCommentIndicator ? "" : *it;

  for (; !tripos_block_end(++it, end);)
    ;
}

// NOLINTBEGIN(readability-identifier-naming)
namespace parser {
const auto atom_line = *x3::omit[x3::blank]         //
                       >> x3::omit[uint_trailing_blanks]
                       >> nonblank_trailing_blanks  //
                       >> x3::omit[x3::repeat(3)[double_trailing_blanks]]
                       >> +~x3::space  //
                       >> x3::omit[*x3::char_];
using AtomLine = std::tuple<std::string, std::string>;
}  // namespace parser
// NOLINTEND(readability-identifier-naming)

bool parse_atom_block(TypedStructure &structure, Iter &it, const Iter end) {
  parser::AtomLine tokens;

  while (!tripos_block_end(++it, end)) {
    if (is_blank_line(*it)) {
      ABSL_LOG(INFO) << "Skipping blank line";
      continue;
    }

    std::get<0>(tokens).clear();
    std::get<1>(tokens).clear();

    auto lit = it->begin();
    if (!x3::parse(lit, it->end(), parser::atom_line, tokens)) {
      ABSL_LOG(WARNING) << "Failed to parse atom line";
      ABSL_LOG(INFO) << "The line is: " << *it;
      return false;
    }

    structure.add_atom(std::move(std::get<0>(tokens)),
                       std::move(std::get<1>(tokens)));
  }

  return true;
}

// NOLINTBEGIN(readability-identifier-naming)
namespace parser {
const auto bond_line = *x3::omit[x3::blank]  //
                       >> +x3::omit[x3::digit] >> +x3::omit[x3::blank]
                       >> x3::repeat(2)[uint_trailing_blanks]  //
                       >> x3::omit[*x3::char_];
using BondLine = absl::InlinedVector<unsigned int, 2>;
}  // namespace parser
// NOLINTEND(readability-identifier-naming)

bool parse_bond_block(TypedStructure &structure, Iter &it, const Iter end) {
  parser::BondLine ids;

  while (!tripos_block_end(++it, end)) {
    if (is_blank_line(*it)) {
      ABSL_LOG(INFO) << "Skipping blank line";
      continue;
    }

    ids.clear();

    auto lit = it->begin();
    if (!x3::parse(lit, it->end(), parser::bond_line, ids)) {
      ABSL_LOG(WARNING) << "Failed to parse bond line";
      ABSL_LOG(INFO) << "The line is: " << *it;
      return false;
    }

    const int src = static_cast<int>(ids[0]) - 1,
              dst = static_cast<int>(ids[1]) - 1;
    if (!structure.add_bond(src, dst)) {
      ABSL_LOG(WARNING) << "Failed to add bond " << ids[0] << " -> " << ids[1]
                        << "; check mol2 file consistency";
      return false;
    }
  }

  return true;
}
}  // namespace

TypedStructure read_typed_mol2(const std::vector<std::string> &mol2) {
  TypedStructure structure;
  bool success = true;

  auto it = mol2.begin();
  for (; it != mol2.end(); ++it) {
    if (absl::StartsWith(*it, "@<TRIPOS>MOLECULE")) {
      parse_mol_block(structure, it, mol2.end());
      break;
    }
  }

  for (; it != mol2.end() && success;) {
    if (absl::StartsWith(*it, "@<TRIPOS>ATOM")) {
      if (!structure.empty()) {
        ABSL_LOG(WARNING) << "Duplicate ATOM block";
        success = false;
        break;
      }
      success = parse_atom_block(structure, it, mol2.end());
    } else if (absl::StartsWith(*it, "@<TRIPOS>BOND")) {
      success = parse_bond_block(structure, it, mol2.end());
    } else {
      ABSL_LOG_IF(INFO, absl::StartsWith(*it, "@"))
          << "Ignoring mol2 block: " << *it;
      ++it;
    }
  }

  if (!success) {
    ABSL_LOG(ERROR) << "Failed to parse mol2 block";
    structure.clear();
    return structure;
  }

  return structure;
}
}  // namespace fftrim
