//++
// Terminal.cpp -> LC-3 memory mapped console terminal
//
// DESCRIPTION:
//   This module implements the LC-3 keyboard and display registers.  There
// are four of them, at every other address -
//
//      KBSR  (0xFE00) - bit 15 set when a key has been typed
//      KBDR  (0xFE02) - the last key typed (reading clears KBSR)
//      DSR   (0xFE04) - bit 15 set when the display is ready (always!)
//      DDR   (0xFE06) - writing sends the low byte to the display
//
// The odd addresses in between read as zero and ignore writes.
//
//   Reading KBSR polls the console but never waits.  Reading KBDR when no
// key has been typed waits until one is, which is what the GETC and IN trap
// routines want.  While we're waiting we keep an eye on the CPU, and if the
// simulation is interrupted (by a console break, or a ^C from the main
// program) we give up and return all ones.  We also return all ones when
// the console reaches end of file.
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, uint16_t, etc ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "VirtualConsole.hpp"   // CVirtualConsole abstract class
#include "CPU.hpp"              // CCPU base class definitions
#include "Device.hpp"           // generic device definitions
#include "LC3.hpp"              // LC-3 device register addresses
#include "Terminal.hpp"         // declarations for this module


CTerminal::CTerminal (const char *pszName, CVirtualConsole *pConsole, CCPU *pCPU)
  : CDevice(pszName, "TERMINAL", "Console Terminal", INOUT, CLC3::KBSR, PORT_COUNT)
{
  //++
  //   The CPU is optional, but if there isn't one then there's no way to
  // stop waiting for a key other than end of file ...
  //--
  assert(pConsole != NULL);
  m_pConsole = pConsole;  m_pCPU = pCPU;
  m_bBuffer = 0;  m_fReady = m_fEOF = false;
}

void CTerminal::ClearDevice()
{
  //++
  // Forget any character that's been received but not yet read ...
  //--
  m_bBuffer = 0;  m_fReady = false;
}

void CTerminal::Poll (uint32_t lTimeout)
{
  //++
  //   See if the console has anything for us.  If a character is already
  // waiting then don't read another one - the LC-3 keyboard has no type
  // ahead of its own, but the console window buffers keys for us anyway.
  // A carriage return is turned into a line feed, which is what LC-3
  // programs expect at the end of a line.
  //--
  if (m_pConsole->IsConsoleBreak() && (m_pCPU != NULL)) m_pCPU->Break();
  if (m_fReady || m_fEOF) return;
  uint8_t bData;
  int32_t nRead = m_pConsole->RawRead(&bData, 1, lTimeout);
  if (nRead < 0) {
    LOGS(DEBUG, "end of file on " << GetName());
    m_fEOF = true;
  } else if (nRead > 0) {
    m_bBuffer = (bData == '\r') ? '\n' : bData;
    m_fReady = true;
  }
}

word_t CTerminal::ReadData()
{
  //++
  //   Return the next keyboard character, waiting for one if necessary.  The
  // wait ends early if the console reaches end of file or the CPU is stopped
  // for any reason, and in either case we return EOF_DATA ...
  //--
  while (!m_fReady) {
    if (m_fEOF) return EOF_DATA;
    if ((m_pCPU != NULL) && (m_pCPU->GetStopCode() != CCPU::STOP_NONE))
      return EOF_DATA;
    Poll(POLL_TIMEOUT);
  }
  m_fReady = false;
  return m_bBuffer;
}

word_t CTerminal::DevRead (address_t nPort)
{
  //++
  // Read a terminal register ...
  //--
  assert(nPort >= GetBasePort());
  switch (nPort) {
    case CLC3::KBSR:  Poll();  return m_fReady ? READY : 0;
    case CLC3::KBDR:  return ReadData();
    case CLC3::DSR:   return READY;
    default:          return 0;
  }
}

void CTerminal::DevWrite (address_t nPort, word_t wData)
{
  //++
  //   Only DDR does anything when written.  The keyboard registers and the
  // display status register are read only here ...
  //--
  assert(nPort >= GetBasePort());
  if (nPort == CLC3::DDR) {
    char ch = (char) LOBYTE(wData);
    m_pConsole->RawWrite(&ch, 1);
  }
}

void CTerminal::ShowDevice (ostringstream &ofs) const
{
  //++
  // Dump the terminal state for debugging ...
  //--
  ofs << FormatString("KBSR=%04X KBDR=%04X DSR=%04X%s\n",
    m_fReady ? READY : 0, m_bBuffer, READY, m_fEOF ? " EOF" : "");
  CDevice::ShowDevice(ofs);
}
