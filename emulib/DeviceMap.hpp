//++
// DeviceMap.hpp -> Port or Memory address to Device Mapping class
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
//   CDeviceMap keeps track of which device, if any, answers to each address
// in the I/O page.  Every address owned by a device gets its own entry in the
// map, so a lookup is a single find() no matter how the devices are laid out.
// The map never owns the devices it points to.
//
// REVISION HISTORY:
//  4-JUL-22  RLA   Split out of CCPU ...
// 19-OCT-26  RLA   Rewrite for memory mapped devices only.  Drop the device
//                    set, name lookup and the iterators.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <map>                  // C++ std::map template
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // CDevice class delcarations
using std::map;                 // ...


class CDeviceMap {
  //++
  // Map memory addresses to devices ...
  //--

public:
  CDeviceMap() {}
  virtual ~CDeviceMap() {m_Map.clear();}
private:
  // Disallow copy and assignments!
  CDeviceMap (const CDeviceMap&) = delete;
  CDeviceMap& operator= (CDeviceMap const &) = delete;

  // Special types ...
public:
  typedef map<address_t, CDevice *> DEVICE_MAP;
  typedef DEVICE_MAP::const_iterator CONST_MAP_ITERATOR;

  // Lookups ...
public:
  // Return the device at this address, or NULL if there is none ...
  CDevice *Find (address_t nAddress) const;
  // Return the lowest address owned by pDevice, or -1 if it has none ...
  int32_t Find (const CDevice *pDevice) const;
  // Return true if any address in the range already belongs to a device ...
  bool IsInstalled (address_t nFirst, address_t cwSize) const;
  // Number of addresses currently mapped ...
  size_t GetCount() const {return m_Map.size();}

  // Adding and removing devices ...
public:
  bool Install (CDevice *pDevice, address_t nFirst, address_t cwSize);
  bool Remove (CDevice *pDevice);

  // Device register access ...
public:
  //   An unmapped address reads as all ones and ignores writes, the same as
  // nonexistent memory ...
  word_t DevRead (address_t nAddress) const
    {CDevice *p = Find(nAddress);  return (p == NULL) ? WORD_MAX : p->DevRead(nAddress);}
  void DevWrite (address_t nAddress, word_t wData) const
    {CDevice *p = Find(nAddress);  if (p != NULL) p->DevWrite(nAddress, wData);}

private:
  DEVICE_MAP  m_Map;          // address -> device
};
