//++
//CPU.cpp - generic microprocessor emulation
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
//   The few CCPU methods that aren't inline - the constructor and a table of
// printable stop codes.
//
// REVISION HISTORY:
// 17-JAN-20  RLA  New file.
// 22-Aug-22  RLA  Constructor should call ClearCPU(), not MasterClear()!
// 19-OCT-26  RLA  Remove events, interrupts and I/O mapped devices.
//                 Add StopCodeToString() ...
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // basic memory emulation declarations ...
#include "CPU.hpp"              // CCPU base class definitions


CCPU::CCPU (CMemory *pMemory)
{
  assert(pMemory != NULL);
  m_pMemory = pMemory;
  m_fStopOnIllegalOpcode = true;
  m_nLastPC = 0;
  m_nStopCode = STOP_NONE;
}

/*static*/ const char *CCPU::StopCodeToString (STOP_CODE nStop)
{
  switch (nStop) {
    case STOP_NONE:           return "running";
    case STOP_FINISHED:       return "instruction count reached";
    case STOP_ILLEGAL_IO:     return "end of file on console input";
    case STOP_ILLEGAL_OPCODE: return "illegal opcode";
    case STOP_HALT:           return "halt";
    case STOP_ENDLESS_LOOP:   return "endless loop";
    case STOP_BREAKPOINT:     return "breakpoint";
    case STOP_BREAK:          return "break";
    default:                  return "unknown";
  }
}
