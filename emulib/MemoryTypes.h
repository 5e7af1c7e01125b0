//++
// MemoryTypes.h -> Emulation dependent data types
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
//   Types shared by the CPU, memory and device code - an address, the
// contents of one memory location and a register index.  The build files
// set ADDRESS_SIZE and WORD_SIZE for every target.  Both are 16 on the LC-3.
//
// REVISION HISTORY:
// 19-JUN-22  RLA   New file.
// 26-AUG-22  RLA   Change register_t to cpureg_t (because stupid gcc has a
//                    built in definition for register_t!)
// 19-OCT-26  RLA   Default to 16 bit words for the LC-3 ...
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...

//   An address is exactly 16 bits so that PC relative and base+offset
// arithmetic wraps around at the top of memory ...
#ifndef ADDRESS_SIZE
#define ADDRESS_SIZE  16
#endif
#define ADDRESS_MASK  ((1UL<<ADDRESS_SIZE)-1)
#define ADDRESS(x)    ((address_t) ((x) & ADDRESS_MASK))
typedef uint16_t address_t;

// One memory location.  The LC-3 is word addressed ...
#ifndef WORD_SIZE
#define WORD_SIZE    16
#endif
#define WORD_MASK   ((1UL<<WORD_SIZE)-1)
#define WORD_MAX    ((word_t) WORD_MASK)
typedef uint16_t word_t;

// Register index for GetRegister() and SetRegister() ...
typedef uint16_t cpureg_t;
// Three bit register selector field from an instruction ...
typedef uint8_t uint3_t;
