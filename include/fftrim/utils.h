//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_UTILS_H_
#define FFTRIM_UTILS_H_

//! @cond
#include <algorithm>
#include <filesystem>
#include <memory>
#include <string_view>

#include <absl/base/optimization.h>
#include <absl/strings/ascii.h>
//! @endcond

namespace fftrim {
template <typename Derived, typename Base>
std::unique_ptr<Derived>
static_unique_ptr_cast(std::unique_ptr<Base> &&p) noexcept {
  auto d = static_cast<Derived *>(p.release());
  return std::unique_ptr<Derived>(d);
}

inline std::string_view extension_no_dot(const std::filesystem::path &ext) {
  const std::string_view ext_view = ext.native();
  if (ABSL_PREDICT_TRUE(!ext_view.empty())) {
    return ext_view.substr(1);
  }
  return ext_view;
}

inline bool is_blank_line(std::string_view line) {
  return std::all_of(line.begin(), line.end(), absl::ascii_isblank);
}
}  // namespace fftrim

#endif /* FFTRIM_UTILS_H_ */
