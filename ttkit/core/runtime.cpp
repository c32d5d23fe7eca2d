// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/runtime.h>

#include <errno.h>
#include <stdio.h>

#define TT_STRINGIFY_WRAPPED(N) #N
#define TT_STRINGIFY(N) TT_STRINGIFY_WRAPPED(N)

// TTRuntime - Build Information
// =============================

static const TTRuntimeBuildInfo tt_runtime_build_info = {
  // ttkit major version.
  (TT_VERSION >> 16),
  // ttkit minor version.
  (TT_VERSION >> 8) & 0xFF,
  // ttkit patch version.
  (TT_VERSION >> 0) & 0xFF,

  // Build Type.
#ifdef TT_BUILD_DEBUG
  TT_RUNTIME_BUILD_TYPE_DEBUG,
#else
  TT_RUNTIME_BUILD_TYPE_RELEASE,
#endif

  // Compiler Info.
#if defined(__clang_minor__)
  "Clang " TT_STRINGIFY(__clang_major__) "." TT_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  "GCC "  TT_STRINGIFY(__GNUC__) "." TT_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  "MSC"
#else
  "Unknown"
#endif
};

TTResult TTRuntime::query_build_info(TTRuntimeBuildInfo* out) noexcept {
  if (TT_UNLIKELY(!out))
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  memcpy(out, &tt_runtime_build_info, sizeof(TTRuntimeBuildInfo));
  return TT_SUCCESS;
}

// TTRuntime - API - Message
// =========================

TTResult tt_runtime_message_out(const char* msg) noexcept {
  fputs(msg, stderr);
  return TT_SUCCESS;
}

TTResult tt_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  TTResult result = tt_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

TTResult tt_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
  char buf[1024];
  vsnprintf(buf, TT_ARRAY_SIZE(buf), fmt, ap);
  return tt_runtime_message_out(buf);
}

// TTRuntime - ResultFromPosixError
// ================================

TTResult tt_result_from_posix_error(int e) noexcept {
  #define MAP(C_ERROR, TT_ERROR) case C_ERROR: return TT_ERROR

  switch (e) {
  #ifdef EACCES
    MAP(EACCES, TT_ERROR_ACCESS_DENIED);
  #endif
  #ifdef EAGAIN
    MAP(EAGAIN, TT_ERROR_TRY_AGAIN);
  #endif
  #ifdef EBADF
    MAP(EBADF, TT_ERROR_INVALID_HANDLE);
  #endif
  #ifdef EBUSY
    MAP(EBUSY, TT_ERROR_BUSY);
  #endif
  #ifdef EDQUOT
    MAP(EDQUOT, TT_ERROR_NO_SPACE_LEFT);
  #endif
  #ifdef EEXIST
    MAP(EEXIST, TT_ERROR_ALREADY_EXISTS);
  #endif
  #ifdef EFAULT
    MAP(EFAULT, TT_ERROR_INVALID_STATE);
  #endif
  #ifdef EFBIG
    MAP(EFBIG, TT_ERROR_FILE_TOO_LARGE);
  #endif
  #ifdef EINTR
    MAP(EINTR, TT_ERROR_INTERRUPTED);
  #endif
  #ifdef EINVAL
    MAP(EINVAL, TT_ERROR_INVALID_VALUE);
  #endif
  #ifdef EIO
    MAP(EIO, TT_ERROR_IO);
  #endif
  #ifdef EISDIR
    MAP(EISDIR, TT_ERROR_NOT_FILE);
  #endif
  #ifdef ELOOP
    MAP(ELOOP, TT_ERROR_SYMLINK_LOOP);
  #endif
  #ifdef EMFILE
    MAP(EMFILE, TT_ERROR_TOO_MANY_OPEN_FILES);
  #endif
  #ifdef ENAMETOOLONG
    MAP(ENAMETOOLONG, TT_ERROR_FILE_NAME_TOO_LONG);
  #endif
  #ifdef ENFILE
    MAP(ENFILE, TT_ERROR_TOO_MANY_OPEN_FILES_BY_OS);
  #endif
  #ifdef ENMFILE
    MAP(ENMFILE, TT_ERROR_NO_MORE_FILES);
  #endif
  #ifdef ENODATA
    MAP(ENODATA, TT_ERROR_NO_MORE_DATA);
  #endif
  #ifdef ENODEV
    MAP(ENODEV, TT_ERROR_NO_DEVICE);
  #endif
  #ifdef ENOENT
    MAP(ENOENT, TT_ERROR_NO_ENTRY);
  #endif
  #ifdef ENOMEDIUM
    MAP(ENOMEDIUM, TT_ERROR_NO_MEDIA);
  #endif
  #ifdef ENOMEM
    MAP(ENOMEM, TT_ERROR_OUT_OF_MEMORY);
  #endif
  #ifdef ENOSPC
    MAP(ENOSPC, TT_ERROR_NO_SPACE_LEFT);
  #endif
  #ifdef ENOSYS
    MAP(ENOSYS, TT_ERROR_NOT_IMPLEMENTED);
  #endif
  #ifdef ENOTBLK
    MAP(ENOTBLK, TT_ERROR_NOT_BLOCK_DEVICE);
  #endif
  #ifdef ENOTDIR
    MAP(ENOTDIR, TT_ERROR_NOT_DIRECTORY);
  #endif
  #ifdef ENOTEMPTY
    MAP(ENOTEMPTY, TT_ERROR_NOT_EMPTY);
  #endif
  #ifdef ENXIO
    MAP(ENXIO, TT_ERROR_NO_DEVICE);
  #endif
  #ifdef EOVERFLOW
    MAP(EOVERFLOW, TT_ERROR_VALUE_TOO_LARGE);
  #endif
  #ifdef EPERM
    MAP(EPERM, TT_ERROR_NOT_PERMITTED);
  #endif
  #ifdef EPIPE
    MAP(EPIPE, TT_ERROR_BROKEN_PIPE);
  #endif
  #ifdef EROFS
    MAP(EROFS, TT_ERROR_READ_ONLY_FS);
  #endif
  #ifdef ESPIPE
    MAP(ESPIPE, TT_ERROR_INVALID_SEEK);
  #endif
  #ifdef ETIMEDOUT
    MAP(ETIMEDOUT, TT_ERROR_TIMED_OUT);
  #endif
  #ifdef EXDEV
    MAP(EXDEV, TT_ERROR_NOT_SAME_DEVICE);
  #endif
  #ifdef EMLINK
    MAP(EMLINK, TT_ERROR_TOO_MANY_LINKS);
  #endif
  }

  #undef MAP

  // Pass the system error if it's below our error indexing.
  if (e != 0 && unsigned(e) < TT_ERROR_START_INDEX)
    return uint32_t(unsigned(e));
  else
    return TT_ERROR_UNKNOWN_SYSTEM_ERROR;
}
