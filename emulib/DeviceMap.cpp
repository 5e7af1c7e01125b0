//++
// DeviceMap.cpp -> Port or Memory address to Device Mapping class
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
//   This module implements the CDeviceMap lookups along with installing and
// removing devices.  Address ranges are walked with a 32 bit counter so that
// a device occupying the very last word of memory doesn't wrap to zero.
//
// REVISION HISTORY:
//  4-JUL-22  RLA   Split out of CCPU ...
// 19-OCT-26  RLA   Rewrite for memory mapped devices only.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include <map>                  // C++ std::map template
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // basic I/O device emulation declarations ...
#include "DeviceMap.hpp"        // declarations for this module


CDevice *CDeviceMap::Find (address_t nAddress) const
{
  CONST_MAP_ITERATOR it = m_Map.find(nAddress);
  return (it == m_Map.end()) ? NULL : it->second;
}

int32_t CDeviceMap::Find (const CDevice *pDevice) const
{
  //++
  //   The map is sorted by address, so the first match is also the lowest
  // address this device owns.
  //--
  for (CONST_MAP_ITERATOR it = m_Map.begin();  it != m_Map.end();  ++it)
    if (it->second == pDevice) return it->first;
  return -1;
}

bool CDeviceMap::IsInstalled (address_t nFirst, address_t cwSize) const
{
  for (uint32_t n = nFirst;  n < ((uint32_t) nFirst+cwSize);  ++n)
    if (Find(ADDRESS(n)) != NULL) return true;
  return false;
}

bool CDeviceMap::Install (CDevice *pDevice, address_t nFirst, address_t cwSize)
{
  //++
  //   Give every address from nFirst to nFirst+cwSize-1 to pDevice.  If any
  // of them already belongs to somebody else then return false and leave
  // the map alone.
  //--
  assert((pDevice != NULL) && (cwSize > 0));
  if (IsInstalled(nFirst, cwSize)) return false;
  for (uint32_t n = nFirst;  n < ((uint32_t) nFirst+cwSize);  ++n)
    m_Map[ADDRESS(n)] = pDevice;
  return true;
}

bool CDeviceMap::Remove (CDevice *pDevice)
{
  //++
  //   Drop every address mapped to pDevice and return false if there weren't
  // any.  The device object itself is left for its owner to delete.
  //--
  bool fFound = false;
  DEVICE_MAP::iterator it = m_Map.begin();
  while (it != m_Map.end()) {
    if (it->second == pDevice) {
      m_Map.erase(it++);  fFound = true;
    } else
      ++it;
  }
  return fFound;
}
