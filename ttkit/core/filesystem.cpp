// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/filesystem.h>
#include <ttkit/core/runtime.h>
#include <ttkit/support/containerops_p.h>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

// TTFile - API
// ============

TTResult TTFile::open(const char* file_name) noexcept {
  if (TT_UNLIKELY(!file_name))
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  int fd = TT_FILE64_API(::open)(file_name, O_RDONLY);
  if (fd < 0)
    return tt_make_error(tt_result_from_posix_error(errno));

  // A directory can be opened for reading on most systems, but it cannot be read.
  struct TT_FILE64_API(stat) s;
  if (TT_FILE64_API(::fstat)(fd, &s) != 0) {
    int e = errno;
    ::close(fd);
    return tt_make_error(tt_result_from_posix_error(e));
  }

  if (!S_ISREG(s.st_mode)) {
    ::close(fd);
    return tt_make_error(S_ISDIR(s.st_mode) ? TT_ERROR_NOT_FILE : TT_ERROR_NOT_PERMITTED);
  }

  close();
  handle = intptr_t(fd);

  return TT_SUCCESS;
}

TTResult TTFile::close() noexcept {
  if (is_open()) {
    int result = ::close(int(handle));

    // Regardless of the result the descriptor is released.
    handle = -1;
    if (TT_UNLIKELY(result != 0)) {
      int e = errno;

      // EINTR is not an error to report, the descriptor has been already closed.
      if (e != EINTR)
        return tt_make_error(tt_result_from_posix_error(e));
    }
  }

  return TT_SUCCESS;
}

TTResult TTFile::read(void* buffer, size_t n, size_t* bytes_read_out) noexcept {
  using SignedSizeT = std::make_signed_t<size_t>;

  if (!is_open()) {
    *bytes_read_out = 0;
    return tt_make_error(TT_ERROR_INVALID_HANDLE);
  }

  int fd = int(handle);
  size_t bytes_read = 0;

  while (bytes_read < n) {
    SignedSizeT result = ::read(fd, static_cast<uint8_t*>(buffer) + bytes_read, n - bytes_read);
    if (result < 0) {
      int e = errno;
      if (e == EINTR)
        continue;

      *bytes_read_out = bytes_read;

      // Returned when the file was not open for reading.
      if (e == EBADF)
        return tt_make_error(TT_ERROR_NOT_PERMITTED);

      return tt_make_error(tt_result_from_posix_error(e));
    }

    if (result == 0)
      break;

    bytes_read += size_t(result);
  }

  *bytes_read_out = bytes_read;
  return TT_SUCCESS;
}

TTResult TTFile::get_size(uint64_t* file_size_out) noexcept {
  *file_size_out = 0;

  if (!is_open())
    return tt_make_error(TT_ERROR_INVALID_HANDLE);

  struct TT_FILE64_API(stat) s;
  if (TT_FILE64_API(::fstat)(int(handle), &s) != 0)
    return tt_make_error(tt_result_from_posix_error(errno));

  *file_size_out = uint64_t(s.st_size);
  return TT_SUCCESS;
}

// TTFileSystem - API
// ==================

TTResult TTFileSystem::read_file(const char* file_name, std::vector<uint8_t>& dst) noexcept {
  dst.clear();

  TTFile file;
  TT_PROPAGATE(file.open(file_name));

  uint64_t size64;
  TT_PROPAGATE(file.get_size(&size64));

  if (size64 == 0)
    return TT_SUCCESS;

  if (TT_UNLIKELY(size64 >= uint64_t(SIZE_MAX)))
    return tt_make_error(TT_ERROR_FILE_TOO_LARGE);

  size_t size = size_t(size64);
  TT_PROPAGATE(tt::ContainerOps::resize(dst, size));

  size_t bytes_read;
  TTResult result = file.read(dst.data(), size, &bytes_read);

  dst.resize(bytes_read);
  return result;
}
