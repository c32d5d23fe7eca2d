// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_API_H_INCLUDED
#define TTKIT_CORE_API_H_INCLUDED

#include <stddef.h>
#include <stdint.h>

#include <type_traits>

//! \addtogroup tt_globals
//! \{

//! \name Version Information
//! \{

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define TT_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! ttkit library version.
#define TT_VERSION TT_MAKE_VERSION(0, 3, 0)

//! \}

//! \name Target Information
//! \{

//! \def TT_API
//!
//! A base API decorator that marks functions and variables exported by ttkit.
#if !defined(TT_STATIC)
  #if defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
    #if defined(TT_BUILD_EXPORT)
      #define TT_API __declspec(dllexport)
    #else
      #define TT_API __declspec(dllimport)
    #endif
  #elif defined(_WIN32) && defined(__GNUC__)
    #if defined(TT_BUILD_EXPORT)
      #define TT_API __attribute__((__dllexport__))
    #else
      #define TT_API __attribute__((__dllimport__))
    #endif
  #elif defined(__GNUC__)
    #define TT_API __attribute__((__visibility__("default")))
  #endif
#endif

#if !defined(TT_API)
  #define TT_API
#endif

//! \}

//! \name Function Attributes
//! \{

//! \def TT_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(TT_BUILD_DEBUG)
  #define TT_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(TT_BUILD_DEBUG)
  #define TT_INLINE __forceinline
#else
  #define TT_INLINE inline
#endif

//! \def TT_INLINE_NODEBUG
//!
//! Like \ref TT_INLINE, used by trivial accessors.
#define TT_INLINE_NODEBUG TT_INLINE

//! \def TT_LIKELY(...)
//!
//! A condition is likely.
//!
//! \def TT_UNLIKELY(...)
//!
//! A condition is unlikely.
#if defined(__GNUC__)
  #define TT_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
  #define TT_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define TT_LIKELY(...) (__VA_ARGS__)
  #define TT_UNLIKELY(...) (__VA_ARGS__)
#endif

//! \}

//! \name Utilities
//! \{

//! Creates a 32-bit tag (uint32_t) from the given `A`, `B`, `C`, and `D` values.
#define TT_MAKE_TAG(A, B, C, D) ((TTTag)(((TTTag)(A) << 24) | ((TTTag)(B) << 16) | ((TTTag)(C) << 8) | ((TTTag)(D))))

//! \}

//! \name Enum Flags
//! \{

//! \def TT_DEFINE_ENUM_FLAGS(T)
//!
//! Defines bit operators for an enumeration type `T` that is used as flags.
#define TT_DEFINE_ENUM_FLAGS(T)                                               \
  static TT_INLINE constexpr T operator~(T a) noexcept {                      \
    return T(~std::underlying_type_t<T>(a));                                  \
  }                                                                           \
                                                                              \
  static TT_INLINE constexpr T operator|(T a, T b) noexcept {                 \
    return T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));    \
  }                                                                           \
                                                                              \
  static TT_INLINE constexpr T operator&(T a, T b) noexcept {                 \
    return T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));    \
  }                                                                           \
                                                                              \
  static TT_INLINE T& operator|=(T& a, T b) noexcept {                        \
    a = T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }                                                                           \
                                                                              \
  static TT_INLINE T& operator&=(T& a, T b) noexcept {                        \
    a = T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }

//! \}

//! \}

//! \addtogroup tt_globals
//! \{

//! Result code used by most ttkit functions (32-bit unsigned integer).
//!
//! The `TTResultCode` enumeration contains ttkit result codes. Zero means success and any other value is an error.
typedef uint32_t TTResult;

//! Tag is a 32-bit integer consisting of 4 characters in the following format:
//!
//! ```
//! tag = ((a << 24) | (b << 16) | (c << 8) | d)
//! ```
typedef uint32_t TTTag;

//! Glyph identifier (an index into the glyph sequence of a decoded font).
typedef uint32_t TTGlyphId;

//! Result code.
enum TTResultCode : uint32_t {
  //! Successful result code.
  TT_SUCCESS = 0,

  //! Start of ttkit error codes.
  TT_ERROR_START_INDEX = 0x00010000u,

  TT_ERROR_OUT_OF_MEMORY = 0x00010000u,     //!< Out of memory                 [ENOMEM].
  TT_ERROR_INVALID_VALUE,                   //!< Invalid value/argument        [EINVAL].
  TT_ERROR_INVALID_STATE,                   //!< Invalid state                 [EFAULT].
  TT_ERROR_INVALID_HANDLE,                  //!< Invalid handle or file.       [EBADF].
  TT_ERROR_VALUE_TOO_LARGE,                 //!< Value too large               [EOVERFLOW].
  TT_ERROR_NOT_INITIALIZED,                 //!< Object not initialized.
  TT_ERROR_NOT_IMPLEMENTED,                 //!< Not implemented               [ENOSYS].
  TT_ERROR_NOT_PERMITTED,                   //!< Operation not permitted       [EPERM].

  TT_ERROR_IO,                              //!< IO error                      [EIO].
  TT_ERROR_BUSY,                            //!< Device or resource busy       [EBUSY].
  TT_ERROR_INTERRUPTED,                     //!< Operation interrupted         [EINTR].
  TT_ERROR_TRY_AGAIN,                       //!< Try again                     [EAGAIN].
  TT_ERROR_TIMED_OUT,                       //!< Timed out                     [ETIMEDOUT].
  TT_ERROR_BROKEN_PIPE,                     //!< Broken pipe                   [EPIPE].
  TT_ERROR_INVALID_SEEK,                    //!< File is not seekable          [ESPIPE].
  TT_ERROR_SYMLINK_LOOP,                    //!< Too many levels of symlinks   [ELOOP].
  TT_ERROR_FILE_TOO_LARGE,                  //!< File is too large             [EFBIG].
  TT_ERROR_ALREADY_EXISTS,                  //!< File/directory already exists [EEXIST].
  TT_ERROR_ACCESS_DENIED,                   //!< Access denied                 [EACCES].
  TT_ERROR_MEDIA_CHANGED,                   //!< Media changed                 [Windows::ERROR_MEDIA_CHANGED].
  TT_ERROR_READ_ONLY_FS,                    //!< The file/FS is read-only      [EROFS].
  TT_ERROR_NO_DEVICE,                       //!< Device doesn't exist          [ENXIO].
  TT_ERROR_NO_ENTRY,                        //!< Not found, no entry (fs)      [ENOENT].
  TT_ERROR_NO_MEDIA,                        //!< No media in drive/device      [ENOMEDIUM].
  TT_ERROR_NO_MORE_DATA,                    //!< No more data / end of file    [ENODATA].
  TT_ERROR_NO_MORE_FILES,                   //!< No more files                 [ENMFILE].
  TT_ERROR_NO_SPACE_LEFT,                   //!< No space left on device       [ENOSPC].
  TT_ERROR_NOT_EMPTY,                       //!< Directory is not empty        [ENOTEMPTY].
  TT_ERROR_NOT_FILE,                        //!< Not a file                    [EISDIR].
  TT_ERROR_NOT_DIRECTORY,                   //!< Not a directory               [ENOTDIR].
  TT_ERROR_NOT_SAME_DEVICE,                 //!< Not same device               [EXDEV].
  TT_ERROR_NOT_BLOCK_DEVICE,                //!< Not a block device            [ENOTBLK].
  TT_ERROR_INVALID_FILE_NAME,               //!< File/path name is invalid     [n/a].
  TT_ERROR_FILE_NAME_TOO_LONG,              //!< File/path name is too long    [ENAMETOOLONG].
  TT_ERROR_TOO_MANY_OPEN_FILES,             //!< Too many open files           [EMFILE].
  TT_ERROR_TOO_MANY_OPEN_FILES_BY_OS,       //!< Too many open files by OS     [ENFILE].
  TT_ERROR_TOO_MANY_LINKS,                  //!< Too many symbolic links on FS [EMLINK].
  TT_ERROR_FILE_EMPTY,                      //!< File is empty (not specific to any OS error).
  TT_ERROR_UNKNOWN_SYSTEM_ERROR,            //!< Unknown system error that ttkit failed to map.

  TT_ERROR_DATA_TOO_LARGE,                  //!< Data too large (not specific to any OS error).
  TT_ERROR_INVALID_DATA,                    //!< Invalid data (not specific to any OS error).
  TT_ERROR_INVALID_SIGNATURE,               //!< Invalid signature or header.

  //! A read would cross the end of the data it reads from (truncated or corrupted font).
  TT_ERROR_OUT_OF_BOUNDS,
  //! Kerning subtable advertises a format other than 0.
  TT_ERROR_UNSUPPORTED_KERN_FORMAT,
  //! Character map subtable has an invalid layout.
  TT_ERROR_MALFORMED_CMAP,
  //! No usable character map subtable was found in the font.
  TT_ERROR_UNSUPPORTED_FONT,
  //! Font doesn't have a table required to decode it ('head', 'maxp', 'glyf', or 'loca').
  TT_ERROR_FONT_MISSING_IMPORTANT_TABLE,

  //! Maximum value of `TTResultCode`.
  TT_ERROR_MAX_VALUE = TT_ERROR_FONT_MISSING_IMPORTANT_TABLE
};

//! Returns the given `result`, every error returned by ttkit passes through this function, so it can be used as
//! a breakpoint to catch the origin of an error.
static inline TTResult tt_make_error(TTResult result) noexcept { return result; }

//! \}

#endif // TTKIT_CORE_API_H_INCLUDED
