//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/absl_log.h>
#include <absl/log/initialize.h>
#include <absl/strings/str_join.h>

#include "fftrim/core/forcefield.h"
#include "fftrim/core/interaction.h"
#include "fftrim/core/structure.h"
#include "fftrim/fmt/base.h"
#include "fftrim/fmt/ffxml.h"
#include "fftrim/fmt/mol2.h"
#include "fftrim/tools/trim.h"

ABSL_FLAG(std::string, structure, "", "Typed structure file.");
ABSL_FLAG(std::string, format, "",
          "Format of the structure file. Deduced from the file extension if "
          "empty.");
ABSL_FLAG(std::string, forcefield, "", "Force field XML file to trim.");
ABSL_FLAG(std::string, output, "",
          "Output force field XML file. Written to stdout if empty.");
ABSL_FLAG(std::string, template_file, "",
          "Force field XML file used as the output skeleton.");
ABSL_FLAG(bool, derive_topology, true,
          "Derive angles, torsions and impropers from the bonds.");
ABSL_FLAG(bool, report_unmatched, false,
          "Print the interactions without parameters to stderr.");

namespace fftrim {
namespace {
template <class ReaderWrapper>
bool read_first(ReaderWrapper &reader, TypedStructure &structure) {
  if (!reader)
    return false;

  auto stream = reader.stream();
  if (!stream.advance())
    return false;

  structure = std::move(stream.current());
  return !structure.empty();
}

bool read_structure(const std::filesystem::path &path, std::string_view fmt,
                    TypedStructure &structure) {
  if (fmt.empty()) {
    FileStructureReader<> reader(path);
    return read_first(reader, structure);
  }

  FileStructureReader<> reader(fmt, path);
  return read_first(reader, structure);
}

void print_report(const TrimResult &result) {
  for (const std::string &type: result.atom_types.unresolved())
    std::cerr << "Unresolved atom type: " << type << '\n';

  for (InteractionKind kind: kInteractionKinds) {
    const KindReport &report = result.report(kind);
    std::cerr << kind << ": " << report.num_matched << " records for "
              << report.num_unique << " unique interactions ("
              << report.num_interactions << " total, "
              << report.unmatched.size() << " unmatched)\n";

    for (const TypeTuple &tuple: report.unmatched)
      std::cerr << "  " << tuple << '\n';
  }
}

int run() {
  const std::string structure_path = absl::GetFlag(FLAGS_structure),
                    ff_path = absl::GetFlag(FLAGS_forcefield);
  if (structure_path.empty() || ff_path.empty()) {
    std::cerr << "Both --structure and --forcefield are required\n";
    return 1;
  }

  TypedStructure structure;
  if (!read_structure(structure_path, absl::GetFlag(FLAGS_format),
                      structure)) {
    ABSL_LOG(ERROR) << "Failed to read structure from " << structure_path;
    return 1;
  }

  ForceField ff = read_forcefield_xml_file(ff_path);
  if (ff.empty()) {
    ABSL_LOG(ERROR) << "Failed to read force field from " << ff_path;
    return 1;
  }

  TrimOptions options;
  options.derive_topology = absl::GetFlag(FLAGS_derive_topology);

  ForceField templ;
  const std::string templ_path = absl::GetFlag(FLAGS_template_file);
  if (!templ_path.empty()) {
    templ = read_forcefield_xml_file(templ_path);
    if (templ.empty()) {
      ABSL_LOG(ERROR) << "Failed to read template from " << templ_path;
      return 1;
    }
    options.templ = &templ;
  }

  TrimResult result = trim_forcefield(structure, ff, options);
  if (!result.ok()) {
    std::cerr << "Error: " << *result.error << '\n';
    return 1;
  }

  const std::vector<std::string> notes = result.atom_types.notes();
  ABSL_LOG_IF(INFO, !notes.empty())
      << "Atom types referenced only by overrides: "
      << absl::StrJoin(notes, ", ");

  if (absl::GetFlag(FLAGS_report_unmatched))
    print_report(result);

  const std::string output = absl::GetFlag(FLAGS_output);
  if (output.empty()) {
    std::string data;
    if (!write_forcefield_xml(data, result.forcefield)) {
      ABSL_LOG(ERROR) << "Failed to serialize the trimmed force field";
      return 1;
    }
    std::cout << data;
    return 0;
  }

  if (!write_forcefield_xml_file(output, result.forcefield)) {
    ABSL_LOG(ERROR) << "Failed to write the trimmed force field to " << output;
    return 1;
  }

  return 0;
}
}  // namespace
}  // namespace fftrim

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(
      "Trim a force field XML file to the parameters used by a typed "
      "structure.\n\nUsage: fftrim --structure=<file> --forcefield=<file> "
      "[--output=<file>]");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  return fftrim::run();
}
