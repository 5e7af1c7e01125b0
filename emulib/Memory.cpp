//++
// Memory.cpp -> implementation of the CGenericMemory class
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
//   This is the implementation of CGenericMemory.  Besides the obvious reads
// and writes it has the LC-3 object file loader.
//
// LC-3 OBJECT FILES
//   An object file is a sequence of big endian 16 bit words.  The first word
// is the origin and the rest are stored in consecutive locations starting
// there.  There's no header, checksum or end record.
//
// REVISION HISTORY:
// 24-JUL-19  RLA   New file.
//  4-JUL-22  RLA   Add memory mapped I/O support.
// 24-MAR-25  RLA   Add warning for write to unwritable memory
// 19-OCT-26  RLA   Remove Intel hex and binary files.  Add LoadImage() ...
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdio.h>              // fopen(), fgetc(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <errno.h>              // errno (what else?) ...
#include <string.h>             // strerror(), memset() ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // declarations for this module
using std::string;              // too lazy to type "std::string..."!


CGenericMemory::CGenericMemory (size_t cwMemory)
{
  //++
  //   Allocate the data and flag arrays.  Everything starts out zeroed and
  // nonexistent, so the caller will want SetRAM() next ...
  //--
  assert((cwMemory > 0) && (cwMemory <= ADDRESS_MASK+1));
  m_cwMemory = cwMemory;
  m_pawMemory = DBGNEW word_t[m_cwMemory];
  m_pabFlags = DBGNEW uint8_t[m_cwMemory];
  memset(m_pabFlags, MEM_NONE, m_cwMemory);
  ClearMemory();
}

CGenericMemory::~CGenericMemory()
{
  delete[] m_pawMemory;  delete[] m_pabFlags;
}

void CGenericMemory::ClearMemory()
{
  memset(m_pawMemory, 0, m_cwMemory*sizeof(word_t));
}

void CGenericMemory::SetFlags (address_t nFirst, address_t nLast, uint8_t bSet, uint8_t bClear)
{
  assert(IsValid(nFirst) && IsValid(nLast) && (nFirst <= nLast));
  for (uint32_t a = nFirst;  a <= nLast;  ++a)
    m_pabFlags[a] = (m_pabFlags[a] & ~bClear) | bSet;
}

word_t CGenericMemory::CPUread (address_t a) const
{
  //++
  //   Device addresses go to the device, RAM comes from the array and
  // anything else reads as all ones ...
  //--
  assert(IsValid(a));
  if (IsIO(a)) return m_Devices.DevRead(a);
  return ISSET(m_pabFlags[a], MEM_RAM) ? m_pawMemory[a] : WORD_MAX;
}

void CGenericMemory::CPUwrite (address_t a, word_t d)
{
  assert(IsValid(a));
  if (IsIO(a))
    m_Devices.DevWrite(a, d);
  else if (ISSET(m_pabFlags[a], MEM_RAM))
    m_pawMemory[a] = d;
  else
    LOGF(WARNING, "write to nonexistent memory at 0x%04X", a);
}

bool CGenericMemory::InstallDevice (CDevice *pDevice)
{
  //++
  //   Map the device at its own base address and mark those locations as I/O.
  // Returns false if another device is already there ...
  //--
  assert(pDevice != NULL);
  address_t nFirst = pDevice->GetBasePort();
  address_t cwSize = pDevice->GetPortCount();
  if (!m_Devices.Install(pDevice, nFirst, cwSize)) return false;
  SetFlags(nFirst, ADDRESS(nFirst+cwSize-1), MEM_IO, 0);
  return true;
}

bool CGenericMemory::RemoveDevice (CDevice *pDevice)
{
  //++
  //   Unmap the device, and its addresses go back to being whatever they were
  // underneath (normally RAM).  The device object isn't deleted ...
  //--
  int32_t nFirst = m_Devices.Find(pDevice);
  if (nFirst < 0) return false;
  m_Devices.Remove(pDevice);
  address_t nLast = ADDRESS(nFirst+pDevice->GetPortCount()-1);
  SetFlags(ADDRESS(nFirst), nLast, 0, MEM_IO);
  return true;
}

int32_t CGenericMemory::FileError (const string &sFileName, const char *pszMsg, int nError)
{
  //++
  // Log a file error and return -1, so callers can "return FileError(...)".
  //--
  if (nError > 0)
    LOGS(ERROR, pszMsg << " " << sFileName << " - " << strerror(nError));
  else
    LOGS(ERROR, pszMsg << " - " << sFileName);
  return -1;
}

int32_t CGenericMemory::LoadImage (const string &sFileName, address_t &wOrigin)
{
  //++
  //   Load an LC-3 object file.  Words that would go past the top of memory
  // are dropped, and so is an odd byte at the end of the file.  Both of those
  // only get a warning.  A file that can't be read, or that has no data after
  // the origin, is an error.  Memory flags are ignored ...
  //--
  FILE *pFile = fopen(sFileName.c_str(), "rb");
  if (pFile == NULL) return FileError(sFileName, "unable to open", errno);

  int bHigh = fgetc(pFile), bLow = fgetc(pFile);
  if ((bHigh == EOF) || (bLow == EOF)) {
    fclose(pFile);  return FileError(sFileName, "no origin in file");
  }
  wOrigin = MKWORD(bHigh, bLow);

  // nNext is wider than address_t so it can run off the top without wrapping.
  uint32_t nNext = wOrigin;  int32_t nWords = 0;
  while ((bHigh = fgetc(pFile)) != EOF) {
    if ((bLow = fgetc(pFile)) == EOF) {
      LOGS(WARNING, sFileName << " has an odd number of bytes");  break;
    }
    if (nNext >= m_cwMemory) {
      LOGF(WARNING, "%s truncated at 0x%04X", sFileName.c_str(), Top());  break;
    }
    UIwrite(ADDRESS(nNext++), MKWORD(bHigh, bLow));  ++nWords;
  }
  int nError = ferror(pFile) ? errno : 0;
  fclose(pFile);
  if (nError != 0) return FileError(sFileName, "error reading", nError);
  if (nWords == 0) return FileError(sFileName, "no data in file");

  LOGF(DEBUG, "loaded %d words from %s at 0x%04X", nWords, sFileName.c_str(), wOrigin);
  return nWords;
}
