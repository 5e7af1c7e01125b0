//++
// LinuxConsole.cpp -> CConsoleWindow implementation for Linux/ANSI
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
//   This is the Linux implementation of CConsoleWindow.  In raw mode the
// terminal doesn't echo, doesn't edit lines and never blocks on read().
// Output processing stays on, so the LF that ends an LC-3 line comes out
// as CRLF.
//
//   When stdin is a file or a pipe there's no terminal to configure and all
// the termios calls are skipped.  Running out of input is then an end of
// file condition, and RawRead() reports it by returning -1.
//
// REVISION HISTORY:
//  5-JUN-17  RLA   Split from WindowsConsole.cpp
// 25-DEC-23  RLA   Add keyboard buffer and make IsConsoleBreak() read ahead
//                  DON'T call RawWrite() from Write() ...
// 19-OCT-26  RLA   Detect end of file.  Skip termios when stdin isn't a tty.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdio.h>              // fputs(), fflush(), ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include <string.h>             // memset(), memcpy(), ...
#include <errno.h>              // errno, EINTR, ...
#include <termios.h>            // struct termios (what else?!)
#include <unistd.h>             // read(), write(), isatty(), etc ...
#include <sys/select.h>         // select(), fd_set, ...
#include "EMULIB.hpp"           // emulator library definitions
#include "VirtualConsole.hpp"   // CVirtualConsole abstract class
#include "ConsoleWindow.hpp"    // declarations for this module

CConsoleWindow *CConsoleWindow::m_pConsole = NULL;


CConsoleWindow::CConsoleWindow()
{
  //++
  //   Save the tty settings we were started with and make a raw copy of them
  // for later.  VMIN and VTIME of zero make read() return at once with
  // whatever is there.
  //--
  assert(m_pConsole == NULL);
  m_pConsole = this;
  m_fRawMode = m_fConsoleBreak = m_fEOF = false;
  m_pRawAttr = DBGNEW struct termios;
  m_pCookedAttr = DBGNEW struct termios;
  memset(m_pCookedAttr, 0, sizeof(struct termios));
  m_fTerminal = (isatty(STDIN_FILENO) != 0)
             && (tcgetattr(STDIN_FILENO, m_pCookedAttr) == 0);
  memcpy(m_pRawAttr, m_pCookedAttr, sizeof(struct termios));
  cfmakeraw(m_pRawAttr);
  m_pRawAttr->c_cc[VMIN] = 0;
  m_pRawAttr->c_cc[VTIME] = 0;
  m_pRawAttr->c_oflag |= OPOST|ONLCR;
}

CConsoleWindow::~CConsoleWindow()
{
  assert(m_pConsole == this);
  CookedMode();
  delete m_pRawAttr;  delete m_pCookedAttr;
  m_pConsole = NULL;
}

void CConsoleWindow::RawMode()
{
  //++
  //   Note that cfmakeraw() turns off ISIG, so a ^C typed while we're in raw
  // mode is just another character.  The console break character (^E) is
  // how the operator stops the simulation.
  //--
  if (m_fRawMode || !m_fTerminal) return;
  fflush(stdout);
  tcsetattr(STDIN_FILENO, TCSANOW, m_pRawAttr);
  m_fRawMode = true;
}

void CConsoleWindow::CookedMode()
{
  if (!m_fRawMode) return;
  tcsetattr(STDIN_FILENO, TCSANOW, m_pCookedAttr);
  m_fRawMode = false;
}

void CConsoleWindow::Write (const char *pszText)
{
  //++
  //   Write a message to stdout.  This goes thru stdio, unlike RawWrite(), so
  // be sure we're in cooked mode first ...
  //--
  assert(pszText != NULL);
  CookedMode();
  fputs(pszText, stdout);
  fflush(stdout);
}

void CConsoleWindow::RawWrite (const char *pabBuffer, size_t cbBuffer)
{
  //++
  //   Send characters from the simulated display.  NULs are dropped and the
  // eighth bit is stripped ...
  //--
  RawMode();
  for (size_t i = 0;  i < cbBuffer;  ++i) {
    char ch = pabBuffer[i] & 0x7F;
    if (ch == 0) continue;
    while (write(STDOUT_FILENO, &ch, 1) != 1)
      if (errno != EINTR) return;
  }
}

int32_t CConsoleWindow::ReadKey (uint8_t &bData, uint32_t lTimeout)
{
  //++
  //   Wait up to lTimeout milliseconds for one key.  Returns 1 if we got one,
  // 0 on timeout (or if the key was the console break character), and -1 at
  // end of file or on an error.
  //--
  if (m_fEOF) return -1;
  RawMode();
  struct timeval tmo;
  tmo.tv_sec = lTimeout / 1000UL;  tmo.tv_usec = (lTimeout % 1000UL) * 1000UL;
  fd_set fds;  FD_ZERO(&fds);  FD_SET(STDIN_FILENO, &fds);
  int nReady = select(STDIN_FILENO+1, &fds, NULL, NULL, &tmo);
  if (nReady < 0) return (errno == EINTR) ? 0 : -1;
  if (nReady == 0) return 0;

  // A zero length read after select() is end of file, unless it's a tty ...
  ssize_t cbRead = read(STDIN_FILENO, &bData, 1);
  if (cbRead < 0) return (errno == EINTR) ? 0 : -1;
  if (cbRead == 0) {
    if (m_fTerminal) return 0;
    m_fEOF = true;  return -1;
  }
  if (bData == m_chConsoleBreak) {
    m_fConsoleBreak = true;  return 0;
  }
  return (bData != 0) ? 1 : 0;
}

bool CConsoleWindow::IsConsoleBreak (uint32_t lTimeout)
{
  //++
  //   Drain everything that's been typed into m_KeyBuffer, so we notice a
  // break even when the LC-3 program isn't reading the keyboard, and then
  // return (and clear) the break flag.
  //--
  uint8_t bData;
  while (ReadKey(bData, lTimeout) > 0) m_KeyBuffer.push_back(bData);
  bool fBreak = m_fConsoleBreak;
  m_fConsoleBreak = false;
  return fBreak;
}

int32_t CConsoleWindow::RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout)
{
  //++
  //   Fill the buffer from the type ahead keys first and then from stdin.
  // Returns the number of bytes, 0 on timeout, or -1 at end of file when
  // nothing was read at all.
  //--
  size_t cbRead = 0;  uint8_t bData;
  while ((cbRead < cbBuffer) && !m_KeyBuffer.empty()) {
    pabBuffer[cbRead++] = m_KeyBuffer.front();  m_KeyBuffer.pop_front();
  }
  while (cbRead < cbBuffer) {
    int32_t nRet = ReadKey(bData, lTimeout);
    if (nRet < 0) return (cbRead > 0) ? (int32_t) cbRead : -1;
    if (nRet == 0) break;
    pabBuffer[cbRead++] = bData;
  }
  return (int32_t) cbRead;
}
