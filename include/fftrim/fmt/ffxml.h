//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_FMT_FFXML_H_
#define FFTRIM_FMT_FFXML_H_

//! @cond
#include <filesystem>
#include <string>
#include <string_view>

#include <absl/base/attributes.h>
//! @endcond

#include "fftrim/core/forcefield.h"

namespace fftrim {
/**
 * @brief Read a force field document in the OpenMM/Foyer XML format.
 *
 * @param xml The XML string to read.
 * @return A force field. On failure, the returned force field is empty.
 *
 * Only the root element, its child elements (sections) and their child
 * elements (records) are kept. Text content, comments and deeper elements are
 * ignored.
 */
extern ForceField read_forcefield_xml(std::string_view xml);

/**
 * @brief Read a force field document file in the OpenMM/Foyer XML format.
 *
 * @param path Path to the file.
 * @return A force field. On failure, the returned force field is empty.
 * @sa read_forcefield_xml()
 */
extern ForceField read_forcefield_xml_file(const std::filesystem::path &path);

/**
 * @brief Write a force field document in the OpenMM/Foyer XML format.
 *
 * @param out The output string. The document is appended to it.
 * @param ff The force field to write.
 * @return Whether the serialization succeeded.
 *
 * The output is UTF-8 encoded, begins with an XML declaration, and each
 * nesting level is indented with a tab. Attributes are written in the stored
 * order.
 */
ABSL_MUST_USE_RESULT
extern bool write_forcefield_xml(std::string &out, const ForceField &ff);

/**
 * @brief Write a force field document file in the OpenMM/Foyer XML format.
 *
 * @param path Path to the file. Existing file is overwritten.
 * @param ff The force field to write.
 * @return Whether the file was written successfully.
 * @sa write_forcefield_xml()
 */
ABSL_MUST_USE_RESULT
extern bool write_forcefield_xml_file(const std::filesystem::path &path,
                                      const ForceField &ff);
}  // namespace fftrim

#endif /* FFTRIM_FMT_FFXML_H_ */
