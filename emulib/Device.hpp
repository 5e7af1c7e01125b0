//++
// Device.hpp -> definitions for the CDevice base class
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
//   CDevice is the base class for the memory mapped devices.  A device owns
// a block of consecutive addresses, and the memory object calls DevRead() or
// DevWrite() whenever the CPU touches one of them.
//
// REVISION HISTORY:
// 12-AUG-19  RLA   New file.
// 15-JUL-22  RLA   Create a .cpp file for some of the implementation.
// 19-OCT-26  RLA   Remove events, interrupts, sense and flags.  The LC-3
//                    terminal is polled and needs none of them.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
#include "MemoryTypes.h"        // address_t and word_t data types
using std::string;              // ...
using std::ostringstream;       // ...


class CDevice {
  //++
  // Generic memory mapped device ...
  //--
public:
  // Which way the device registers can be accessed by the CPU ...
  enum _DEVICE_MODES {
    INPUT  = 1,               // read only registers
    OUTPUT = 2,               // write only registers
    INOUT  = 3                // some of each
  };
  typedef enum _DEVICE_MODES DEVICE_MODE;

public:
  CDevice (const char *pszName, const char *pszType, const char *pszDescription, DEVICE_MODE nMode, address_t nBase, address_t cwSize=1);
  virtual ~CDevice() {};
private:
  // Disallow copy and assignments!
  CDevice (const CDevice&) = delete;
  CDevice& operator= (CDevice const &) = delete;

  // Device properties ...
public:
  const char *GetName() const {return m_pszName;}
  const char *GetType() const {return m_pszType;}
  const char *GetDescription() const {return m_pszDescription;}
  bool IsInput() const {return (m_nMode == INPUT) || (m_nMode == INOUT);}
  bool IsOutput() const {return (m_nMode == OUTPUT) || (m_nMode == INOUT);}
  bool IsInOut() const {return (m_nMode == INOUT);}
  // First register address and the number of registers ...
  address_t GetBasePort() const {return m_nBasePort;}
  address_t GetPortCount() const {return m_nPortCount;}

  // Called by the memory object ...
public:
  // Hardware reset ...
  virtual void ClearDevice() {};
  //   nPort is the absolute memory address of the register.  A plain CDevice
  // reads as all ones and ignores writes ...
  virtual word_t DevRead (address_t nPort) {return WORD_MAX;}
  virtual void DevWrite (address_t nPort, word_t wData) {};
  virtual void ShowDevice (ostringstream &ofs) const;

protected:
  const char   *m_pszName;        // this instance (e.g. "TTY")
  const char   *m_pszType;        // generic kind (e.g. "TERMINAL")
  const char   *m_pszDescription; // for messages (e.g. "Console Terminal")
  DEVICE_MODE   m_nMode;          // INPUT, OUTPUT or INOUT
  address_t     m_nBasePort;      // address of the first register
  address_t     m_nPortCount;     // number of registers
};
