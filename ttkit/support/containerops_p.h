// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_SUPPORT_CONTAINEROPS_P_H_INCLUDED
#define TTKIT_SUPPORT_CONTAINEROPS_P_H_INCLUDED

#include <ttkit/core/api-internal_p.h>

#include <new>
#include <stdexcept>

//! \cond INTERNAL
//! \addtogroup tt_internal
//! \{

//! Growing operations of standard containers, which translate allocation failures to `TTResult`.
namespace tt {
namespace ContainerOps {

//! Appends a new element constructed from `args` to a sequence container.
template<typename Container, typename... Args>
static TT_INLINE TTResult append(Container& container, Args&&... args) noexcept {
  try {
    container.emplace_back(std::forward<Args>(args)...);
    return TT_SUCCESS;
  }
  catch (const std::bad_alloc&) {
    return tt_make_error(TT_ERROR_OUT_OF_MEMORY);
  }
  catch (const std::length_error&) {
    return tt_make_error(TT_ERROR_DATA_TOO_LARGE);
  }
}

//! Reserves capacity of `n` elements.
template<typename Container>
static TT_INLINE TTResult reserve(Container& container, size_t n) noexcept {
  try {
    container.reserve(n);
    return TT_SUCCESS;
  }
  catch (const std::bad_alloc&) {
    return tt_make_error(TT_ERROR_OUT_OF_MEMORY);
  }
  catch (const std::length_error&) {
    return tt_make_error(TT_ERROR_DATA_TOO_LARGE);
  }
}

//! Resizes a sequence container to `n` value-initialized elements.
template<typename Container>
static TT_INLINE TTResult resize(Container& container, size_t n) noexcept {
  try {
    container.resize(n);
    return TT_SUCCESS;
  }
  catch (const std::bad_alloc&) {
    return tt_make_error(TT_ERROR_OUT_OF_MEMORY);
  }
  catch (const std::length_error&) {
    return tt_make_error(TT_ERROR_DATA_TOO_LARGE);
  }
}

//! Inserts `key` -> `value` into an associative container, replacing an existing value of the same key.
template<typename Map, typename Key, typename Value>
static TT_INLINE TTResult assign(Map& map, Key&& key, Value&& value) noexcept {
  try {
    map.insert_or_assign(std::forward<Key>(key), std::forward<Value>(value));
    return TT_SUCCESS;
  }
  catch (const std::bad_alloc&) {
    return tt_make_error(TT_ERROR_OUT_OF_MEMORY);
  }
  catch (const std::length_error&) {
    return tt_make_error(TT_ERROR_DATA_TOO_LARGE);
  }
}

} // {ContainerOps}
} // {tt}

//! \}
//! \endcond

#endif // TTKIT_SUPPORT_CONTAINEROPS_P_H_INCLUDED
