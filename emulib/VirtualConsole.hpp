//++
// VirtualConsole.hpp -> CVirtualConsole definitions
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
//   CVirtualConsole is what a terminal device talks to.  CConsoleWindow is
// the real one, on top of the Linux tty, but anything that can move bytes in
// and out will do.  The unit tests plug in a scripted console, for example.
//
// REVISION HISTORY:
// 11-JUN-15  RLA   New file.
// 17-NOV-23  RLA   Separate into our own file
//                  Add console break handling.  Add IsConsoleBreak() ...
// 19-OCT-26  RLA   Remove serial break functions (no UART, no TU58) ...
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <stddef.h>             // size_t, ...


class CVirtualConsole {
  //++
  // Abstract console interface ...
  //--

public:
  enum {
    CH_CONSOLE_BREAK = 0x05,  // ^E stops the simulation
  };

public:
  CVirtualConsole() {m_chConsoleBreak = CH_CONSOLE_BREAK;}
  virtual ~CVirtualConsole() {};
private:
  // Disallow copy and assignments!
  CVirtualConsole (const CVirtualConsole&) = delete;
  CVirtualConsole& operator= (CVirtualConsole const&) = delete;

public:
  //   RawRead() waits at most lTimeout milliseconds and returns the number of
  // bytes read, zero on timeout, or -1 at end of file.  RawWrite() always
  // sends everything ...
  virtual int32_t RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout=0) = 0;
  virtual void RawWrite (const char *pabBuffer, size_t cbBuffer) = 0;
  // True if the operator typed the console break character ...
  virtual bool IsConsoleBreak (uint32_t lTimeout=0) {return false;}

protected:
  uint8_t m_chConsoleBreak;   // console break character
};
