//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_CORE_ATTRIBUTES_H_
#define FFTRIM_CORE_ATTRIBUTES_H_

//! @cond
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
//! @endcond

namespace fftrim {
/**
 * @brief Attributes of a document element, in document order.
 *
 * Unlike a sorted map, the order of insertion is preserved so that copied
 * records serialize the same way as the source document.
 */
using AttributeList = std::vector<std::pair<std::string, std::string>>;

namespace internal {
  template <
      class AT,
      std::enable_if_t<std::is_same_v<AttributeList, std::decay_t<AT>>, int> = 0>
  auto find_key(AT &attrs, std::string_view key) {
    return absl::c_find_if(attrs,
                           [key](const auto &kv) { return kv.first == key; });
  }

  template <
      class AT,
      std::enable_if_t<std::is_same_v<AttributeList, std::decay_t<AT>>, int> = 0>
  bool has_key(AT &attrs, std::string_view key) {
    return find_key(attrs, key) != attrs.end();
  }

  /**
   * @brief Get the value of an attribute.
   * @return Pointer to the value, or nullptr if the attribute is not present.
   */
  inline const std::string *find_value(const AttributeList &attrs,
                                       std::string_view key) {
    auto it = find_key(attrs, key);
    if (it == attrs.end())
      return nullptr;
    return &it->second;
  }

  template <
      class AT,
      std::enable_if_t<std::is_same_v<AttributeList, std::decay_t<AT>>, int> = 0>
  std::string_view get_key(AT &attrs, std::string_view key) {
    auto it = find_key(attrs, key);
    if (it == attrs.end())
      return "";
    return it->second;
  }

  template <
      class AT, class ST,
      std::enable_if_t<std::is_same_v<AttributeList, std::decay_t<AT>>, int> = 0>
  void set_key(AT &attrs, std::string_view key, ST &&value) {
    auto it = find_key(attrs, key);

    if (it != attrs.end()) {
      it->second = std::forward<ST>(value);
    } else {
      attrs.emplace_back(key, std::forward<ST>(value));
    }
  }
}  // namespace internal
}  // namespace fftrim

#endif /* FFTRIM_CORE_ATTRIBUTES_H_ */
