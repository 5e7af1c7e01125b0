//++
// EMULIB.cpp -> Miscellaneous emulator library routines
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
//   This module contains a few utility routines that don't fit anywhere
// else - string formatting and file name handling.
//
// REVISION HISTORY:
// 20-MAY-15  RLA   New file.
// 19-OCT-26  RLA   Only FormatString() and SetDefaultExtension() remain.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdio.h>              // vsnprintf(), et al ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <string>               // C++ std::string class, et al ...
#include "EMULIB.hpp"           // declarations for this module


PUBLIC string FormatString (const char *pszFormat, ...)
{
  //++
  //   Format a printf() style string and return the result as a C++ string.
  // The only restriction is that the result must fit in 512 characters, and
  // anything longer will be silently truncated ...
  //--
  char szBuffer[512];  va_list args;
  va_start(args, pszFormat);
  vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  va_end(args);
  return string(szBuffer);
}

PUBLIC string SetDefaultExtension (const string &sFileName, const string &sType)
{
  //++
  //   If the file name given doesn't already have an extension, then append
  // sType (which should include the ".") to it.  A "." in a directory name
  // doesn't count!
  //--
  size_t nSlash = sFileName.find_last_of('/');
  size_t nDot = sFileName.find_last_of('.');
  if ((nDot != string::npos) && ((nSlash == string::npos) || (nDot > nSlash)))
    return sFileName;
  return sFileName + sType;
}
