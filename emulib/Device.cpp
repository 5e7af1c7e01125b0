//++
// Device.cpp -> Implementation of the CDevice base class
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
//   The non-inline parts of CDevice.  A bare CDevice can be instantiated, and
// it behaves like a block of addresses that read as all ones and ignore
// writes.
//
// REVISION HISTORY:
// 12-AUG-19  RLA   New file.
// 15-JUL-22  RLA   Create a .cpp file for some of the implementation.
// 19-OCT-26  RLA   Remove events, interrupts, sense and flags.
//--
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // declarations for this module


CDevice::CDevice (const char *pszName, const char *pszType, const char *pszDescription, DEVICE_MODE nMode, address_t nBase, address_t cwSize)
{
  //++
  //   The name identifies this instance (e.g. "TTY"), the type says what kind
  // of device it is (e.g. "TERMINAL") and the description is what goes in
  // messages.  The device answers to cwSize addresses starting at nBase.
  //--
  assert((pszName != NULL) && (cwSize > 0));
  m_pszName = pszName;  m_pszType = pszType;  m_pszDescription = pszDescription;
  m_nMode = nMode;  m_nBasePort = nBase;  m_nPortCount = cwSize;
}

void CDevice::ShowDevice (ostringstream &ofs) const
{
  ofs << m_pszName << " (" << m_pszDescription << ") at 0x" << std::hex
      << m_nBasePort << "..0x" << (m_nBasePort+m_nPortCount-1) << std::dec;
}
