//++
// EMULIB.hpp -> Global declarations for the emulator library
//
//   COPYRIGHT (C) 2015-2026 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the emulator library project.  EMULIB is free
// software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    EMULIB is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with EMULIB.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   Global constants and macros shared by the emulator library and the LC-3
// simulator.  Everything here is either a word/byte manipulation macro or a
// small string helper from EMULIB.cpp.
//
// REVISION HISTORY:
// 20-MAY-15  RLA   New file.
// 19-OCT-26  RLA   Trim for the LC-3 simulator (no paths, no sockets).
//                  Add SetDefaultExtension() ...
//--
#pragma once
#include <stdint.h>           // uint8_t, uint16_t, etc ...
#include <string>             // C++ std::string class, et al ...
using std::string;            // this is used EVERYWHERE!

#define EMUVER       153      // library version number ...

// Scope of functions that aren't class members ...
#define PRIVATE static
#define PUBLIC

// Single bits in a 16 bit word ...
#define BIT5    0x0020
#define BIT11   0x0800

// Bytes, fields and words ...
#define LOBYTE(x) 	((uint8_t)  ((x) & 0xFF))
#define HIBYTE(x) 	((uint8_t)  (((x) >> 8) & 0xFF))
#define MASK3(x)        ((x) & 0x07)
#define MKWORD(h,l)	((uint16_t) ((((h) & 0xFF) << 8) | ((l) & 0xFF)))
#define ISSET(x,b)	(((x) & (b)) != 0)

//   DBGNEW is the MSVC debug heap's new, which tracks leaks.  Everywhere else
// it's just new.
#if defined(_DEBUG) && defined(_MSC_VER)
#define DBGNEW new( _CLIENT_BLOCK, __FILE__, __LINE__)
#else
#define DBGNEW new
#endif

// EMULIB.cpp ...
// sprintf() into a std::string ...
extern string FormatString (const char *pszFormat, ...);
// Append sType to sFileName unless it already has an extension ...
extern string SetDefaultExtension (const string &sFileName, const string &sType);
