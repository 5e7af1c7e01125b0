//++
// Memory.hpp -> CMemory (mapped virtual memory) interface
//               CGenericMemory (generic memory emulation) class
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
//   CMemory is the small interface the CPU sees - read a word, write a word
// and ask about a breakpoint.  CGenericMemory implements it with a flat array
// of words plus one flag byte per word.  The flags say whether the word is
// RAM, belongs to a memory mapped device, doesn't exist at all, or has a
// breakpoint set on it.
//
//   CPUread() and CPUwrite() honor the flags and forward device addresses to
// the CDevice that owns them.  UIread() and UIwrite() ignore the flags and go
// straight to the array, which is what the loader and the tests want.
//
// REVISION HISTORY:
// 24-Jul-19  RLA   New file.
// 16-JUN-22  RLA   Split up CMemory interface and CGenericMemory implementation
// 19-OCT-26  RLA   Remove ROM, base offsets, Intel hex and raw binary files.
//                  Add LoadImage() for LC-3 object files.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include "EMULIB.hpp"           // ISSET(), et al ...
#include "MemoryTypes.h"        // address_t and word_t data types
#include "DeviceMap.hpp"        // CDeviceMap class for I/O mapping
using std::string;              // ...


class CMemory {
  //++
  // Abstract memory interface for CPUs ...
  //--

public:
  // Bits in the per word flag byte ...
  enum {
    MEM_NONE  = 0x00,     // nonexistent memory
    MEM_RAM   = 0x01,     // ordinary read/write memory
    MEM_IO    = 0x40,     // owned by a memory mapped device
    MEM_BREAK = 0x80,     // breakpoint on this location
  };

public:
  virtual ~CMemory() {};

  // CPU memory access functions ...
public:
  virtual word_t CPUread (address_t a) const = 0;
  virtual void CPUwrite (address_t a, word_t d) = 0;
  virtual bool IsBreak (address_t a) const = 0;
};


class CGenericMemory : public CMemory {
  //++
  // Flat word addressed memory with memory mapped devices ...
  //--

public:
  CGenericMemory (size_t cwMemory);
  virtual ~CGenericMemory();
private:
  // Disallow copy and assignments!
  CGenericMemory (const CGenericMemory &) = delete;
  CGenericMemory& operator= (CGenericMemory const &) = delete;

public:
  inline size_t Size() const {return m_cwMemory;}
  inline address_t Top() const {return ADDRESS(m_cwMemory-1);}
  inline bool IsValid (address_t a) const {return (size_t) a < m_cwMemory;}

  // CPU access ...
public:
  virtual word_t CPUread (address_t a) const override;
  virtual void CPUwrite (address_t a, word_t d) override;
  virtual bool IsBreak (address_t a) const override
    {assert(IsValid(a));  return ISSET(m_pabFlags[a], MEM_BREAK);}
  inline bool IsRAM (address_t a) const
    {assert(IsValid(a));  return (m_pabFlags[a] & (MEM_RAM|MEM_IO)) == MEM_RAM;}
  inline bool IsIO (address_t a) const
    {assert(IsValid(a));  return ISSET(m_pabFlags[a], MEM_IO);}

  // Loader and debugger access, regardless of the flags ...
public:
  inline word_t UIread (address_t a) const {assert(IsValid(a));  return m_pawMemory[a];}
  inline void UIwrite (address_t a, word_t d) {assert(IsValid(a));  m_pawMemory[a] = d;}

  // Memory map ...
public:
  void SetRAM (address_t nFirst, address_t nLast) {SetFlags(nFirst, nLast, MEM_RAM, MEM_IO);}
  void SetRAM () {SetRAM(0, Top());}
  void SetNXM (address_t nFirst, address_t nLast) {SetFlags(nFirst, nLast, MEM_NONE, MEM_RAM|MEM_IO);}
  void SetBreak (address_t a, bool fSet=true)
    {assert(IsValid(a));  SetFlags(a, a, (fSet ? MEM_BREAK : 0), (fSet ? 0 : MEM_BREAK));}
  void ClearAllBreaks() {SetFlags(0, Top(), 0, MEM_BREAK);}
  void ClearMemory();
  //   Load an LC-3 object file and return the number of words loaded, or -1
  // if the file can't be used.  The origin from the file is returned in
  // wOrigin ...
  int32_t LoadImage (const string &sFileName, address_t &wOrigin);

  // Memory mapped devices ...
public:
  bool InstallDevice (CDevice *pDevice);
  bool RemoveDevice (CDevice *pDevice);
  CDevice *FindDevice (address_t a) const {return m_Devices.Find(a);}

private:
  void SetFlags (address_t nFirst, address_t nLast, uint8_t bSet, uint8_t bClear);
  static int32_t FileError (const string &sFileName, const char *pszMsg, int nError=0);

private:
  size_t      m_cwMemory;     // number of words
  word_t     *m_pawMemory;    // the data
  uint8_t    *m_pabFlags;     // MEM_xxx flags, one per word
  CDeviceMap  m_Devices;      // memory mapped devices
};
