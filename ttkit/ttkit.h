// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// SPDX-License-Identifier: Zlib
// Official GitHub Repository: https://github.com/ttkit/ttkit
//
// Copyright (c) 2024 The ttkit Authors
//
// This software is provided 'as-is', without any express or implied
// warranty. In no event will the authors be held liable for any damages
// arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose,
// including commercial applications, and to alter it and redistribute it
// freely, subject to the following restrictions:
//
// 1. The origin of this software must not be misrepresented; you must not
//    claim that you wrote the original software. If you use this software
//    in a product, an acknowledgment in the product documentation would be
//    appreciated but is not required.
// 2. Altered source versions must be plainly marked as such, and must not be
//    misrepresented as being the original software.
// 3. This notice may not be removed or altered from any source distribution.

// ----------------------------------------------------------------------------
// This is a public header file designed to be used by ttkit users. It includes
// all the necessary files required to use ttkit and it's the only header that
// is guaranteed to always be provided.
//
// Headers that end with "_p" suffix are private and should never be included,
// they are not part of the public API.
// ----------------------------------------------------------------------------

#ifndef TTKIT_H_INCLUDED
#define TTKIT_H_INCLUDED

#include <ttkit/core/api.h>
#include <ttkit/core/filesystem.h>
#include <ttkit/core/font.h>
#include <ttkit/core/fontdata.h>
#include <ttkit/core/fontdefs.h>
#include <ttkit/core/runtime.h>

#endif // TTKIT_H_INCLUDED
