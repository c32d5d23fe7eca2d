// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_RUNTIME_H_INCLUDED
#define TTKIT_CORE_RUNTIME_H_INCLUDED

#include <ttkit/core/api.h>

#include <stdarg.h>
#include <utility>

//! \addtogroup tt_runtime
//! \{

//! \name Runtime - Constants
//! \{

//! ttkit runtime build type.
enum TTRuntimeBuildType : uint32_t {
  //! Describes a ttkit debug build.
  TT_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a ttkit release build.
  TT_RUNTIME_BUILD_TYPE_RELEASE = 1
};

//! \}

//! \name Runtime - Structs
//! \{

//! ttkit build information.
struct TTRuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! ttkit build type, see \ref TTRuntimeBuildType.
  uint32_t build_type;

  //! Identification of the C++ compiler used to build ttkit.
  char compiler_info[32];

  TT_INLINE_NODEBUG void reset() noexcept { *this = TTRuntimeBuildInfo{}; }
};

//! \}

//! \name Runtime - Functions
//! \{

//! Writes a message to the runtime output (stderr).
TT_API TTResult tt_runtime_message_out(const char* msg) noexcept;
//! Formats a message and writes it to the runtime output.
TT_API TTResult tt_runtime_message_fmt(const char* fmt, ...) noexcept;
//! Formats a message from `va_list` and writes it to the runtime output.
TT_API TTResult tt_runtime_message_vfmt(const char* fmt, va_list ap) noexcept;

//! Translates a POSIX `errno` value into a \ref TTResultCode.
TT_API TTResult tt_result_from_posix_error(int e) noexcept;

//! \}

//! Interface to access ttkit runtime.
namespace TTRuntime {

//! Queries build information of the ttkit library.
TT_API TTResult query_build_info(TTRuntimeBuildInfo* out) noexcept;

static TT_INLINE TTResult message(const char* msg) noexcept { return tt_runtime_message_out(msg); }

template<typename... Args>
static TT_INLINE TTResult message_fmt(const char* fmt, Args&&... args) noexcept { return tt_runtime_message_fmt(fmt, std::forward<Args>(args)...); }

} // {TTRuntime}

//! \}

#endif // TTKIT_CORE_RUNTIME_H_INCLUDED
