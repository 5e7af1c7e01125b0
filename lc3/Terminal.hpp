//++
// Terminal.hpp -> LC-3 memory mapped console terminal
//
// DESCRIPTION:
//   The CTerminal class emulates the LC-3 keyboard and display registers -
// KBSR, KBDR, DSR and DDR - and connects them to a CVirtualConsole.  The
// display is always ready and characters written to DDR go straight out.
// Reading KBDR waits for a key if none has been typed yet.
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // generic device definitions
class CVirtualConsole;          // ...
class CCPU;                     // ...


class CTerminal : public CDevice {
  //++
  // LC-3 console terminal ...
  //--

  // Terminal magic constants ...
public:
  enum {
    PORT_COUNT    = 7,          // KBSR thru DDR, inclusive
    READY         = 0x8000,     // status register ready bit
    POLL_TIMEOUT  = 100,        // milliseconds to wait per keyboard poll
    EOF_DATA      = 0xFFFF,     // returned by KBDR at end of input
  };

public:
  // Constructor and destructor...
  CTerminal (const char *pszName, CVirtualConsole *pConsole, CCPU *pCPU=NULL);
  virtual ~CTerminal() {};
private:
  // Disallow copy and assignments!
  CTerminal (const CTerminal &) = delete;
  CTerminal& operator= (CTerminal const &) = delete;

  // Public properties ...
public:
  // Return TRUE if a received character is waiting ...
  inline bool IsReady() const {return m_fReady;}
  // Return TRUE if the console has reached end of file ...
  inline bool IsEOF() const {return m_fEOF;}

  // CDevice methods implemented by the terminal ...
public:
  virtual void ClearDevice() override;
  virtual word_t DevRead (address_t nPort) override;
  virtual void DevWrite (address_t nPort, word_t wData) override;
  virtual void ShowDevice (ostringstream &ofs) const override;

  // Private methods ...
private:
  // Check the console for input, waiting at most lTimeout milliseconds ...
  void Poll (uint32_t lTimeout=0);
  // Read the keyboard data register, waiting if necessary ...
  word_t ReadData();

  // Private member data...
private:
  CVirtualConsole *m_pConsole;  // console window for I/O
  CCPU            *m_pCPU;      // CPU to interrupt on a console break
  uint8_t          m_bBuffer;   // last character received
  bool             m_fReady;    // TRUE if m_bBuffer contains a character
  bool             m_fEOF;      // TRUE if end of file was reached on input
};
