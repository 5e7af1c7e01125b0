//++
// ConsoleWindow.hpp -> CConsoleWindow (console terminal) class
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
//   CConsoleWindow owns stdin and stdout.  While the LC-3 is running it puts
// the terminal in raw mode and while messages are being written it puts it
// back in cooked mode.  Only one instance may exist.
//
// REVISION HISTORY:
//  5-JUN-17  RLA   Split from WindowsConsole.cpp
// 25-DEC-23  RLA   Add keyboard buffer and make IsConsoleBreak() read ahead
// 19-OCT-26  RLA   Linux only.  Remove the title, color and window size
//                    functions.  Add end of file detection and pipe input.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <deque>                // C++ std::deque template
#include "VirtualConsole.hpp"   // CVirtualConsole base class
using std::deque;               // ...
struct termios;                 // ...


class CConsoleWindow : public CVirtualConsole {
  //++
  // Linux terminal (or redirected stdin) console ...
  //--

public:
  CConsoleWindow();
  virtual ~CConsoleWindow();
private:
  // Disallow copy and assignments!
  CConsoleWindow (const CConsoleWindow&) = delete;
  CConsoleWindow& operator= (CConsoleWindow const &) = delete;

public:
  static CConsoleWindow *GetConsole() {return m_pConsole;}
  // Messages (always written in cooked mode) ...
  void Write (const char *pszText);

  // CVirtualConsole methods used while the simulation runs ...
public:
  virtual int32_t RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout=0) override;
  virtual void RawWrite (const char *pabBuffer, size_t cbBuffer) override;
  virtual bool IsConsoleBreak (uint32_t lTimeout=0) override;

public:
  void RawMode();
  void CookedMode();

private:
  int32_t ReadKey (uint8_t &bData, uint32_t lTimeout);

private:
  bool             m_fTerminal;     // stdin is a tty (not a file or pipe)
  bool             m_fRawMode;      // raw mode is selected now
  bool             m_fConsoleBreak; // the break character has been read
  bool             m_fEOF;          // stdin has reached end of file
  struct termios  *m_pRawAttr;      // tty settings while running
  struct termios  *m_pCookedAttr;   // tty settings we started with
  deque<uint8_t>   m_KeyBuffer;     // keys read ahead by IsConsoleBreak()
  static CConsoleWindow *m_pConsole;// the one and only instance
};
