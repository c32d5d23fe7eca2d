// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_FILESYSTEM_H_INCLUDED
#define TTKIT_CORE_FILESYSTEM_H_INCLUDED

#include <ttkit/core/api.h>

#include <vector>

//! \addtogroup tt_filesystem
//! \{

//! A thin abstraction over a native file descriptor (read-only).
//!
//! The file is closed automatically when the instance is destroyed.
class TT_API TTFile {
public:
  //! \name Members
  //! \{

  //! A file descriptor, -1 if the file is not open.
  intptr_t handle;

  //! \}

  //! \name Construction & Destruction
  //! \{

  TT_INLINE_NODEBUG TTFile() noexcept
    : handle(-1) {}

  TT_INLINE_NODEBUG TTFile(TTFile&& other) noexcept
    : handle(other.handle) { other.handle = -1; }

  TT_INLINE_NODEBUG explicit TTFile(intptr_t handle) noexcept
    : handle(handle) {}

  TTFile(const TTFile& other) = delete;
  TTFile& operator=(const TTFile& other) = delete;

  TT_INLINE_NODEBUG ~TTFile() noexcept { close(); }

  //! \}

  //! \name Interface
  //! \{

  //! Tests whether the file is open.
  TT_INLINE_NODEBUG bool is_open() const noexcept { return handle != -1; }

  //! Opens a file specified by `file_name` for reading.
  TTResult open(const char* file_name) noexcept;

  //! Closes the file (if open) and sets the file handle to -1.
  TTResult close() noexcept;

  //! Reads up to `n` bytes into `buffer`, the number of bytes actually read is stored in `bytes_read_out`.
  TTResult read(void* buffer, size_t n, size_t* bytes_read_out) noexcept;

  //! Queries the size of the file.
  TTResult get_size(uint64_t* file_size_out) noexcept;

  //! \}
};

//! File-system utilities.
namespace TTFileSystem {

//! Reads the whole file specified by `file_name` into `dst`.
//!
//! The content of `dst` is replaced. An empty file is not an error, `dst` would be empty in that case.
TT_API TTResult read_file(const char* file_name, std::vector<uint8_t>& dst) noexcept;

} // {TTFileSystem}

//! \}

#endif // TTKIT_CORE_FILESYSTEM_H_INCLUDED
