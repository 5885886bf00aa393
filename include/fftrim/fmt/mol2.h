//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_FMT_MOL2_H_
#define FFTRIM_FMT_MOL2_H_

//! @cond
#include <string>
#include <vector>

#include <absl/base/attributes.h>
//! @endcond

#include "fftrim/core/structure.h"
#include "fftrim/fmt/base.h"

namespace fftrim {
/**
 * @brief Read a single typed Mol2 string and return a structure.
 *
 * @param mol2 the Mol2 string to read.
 * @return A typed structure. On failure, the returned structure is empty.
 *
 * The atom type column of the ATOM block is taken verbatim as the force field
 * atom type of each atom, so files written by force field atom typing tools
 * can be read directly. Bonds are read from the BOND block; the bond type is
 * ignored.
 */
extern TypedStructure read_typed_mol2(const std::vector<std::string> &mol2);

class TypedMol2Reader final: public DefaultReaderImpl<read_typed_mol2> {
public:
  using DefaultReaderImpl<read_typed_mol2>::DefaultReaderImpl;

  bool getnext(std::vector<std::string> &block) override;

private:
  bool read_mol_header_ = false;
};

class TypedMol2ReaderFactory
    : public DefaultReaderFactoryImpl<TypedMol2Reader> {
private:
  static const bool kRegistered ABSL_ATTRIBUTE_UNUSED;
};
}  // namespace fftrim

#endif /* FFTRIM_FMT_MOL2_H_ */
