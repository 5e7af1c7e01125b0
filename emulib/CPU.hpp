//++
// CPU.hpp -> CCPU (generic microprocessor) class
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
//   CCPU is the abstract base class for a CPU emulation.  It holds the state
// every CPU shares - the memory it's attached to, the reason the last Run()
// stopped, the address of the last instruction and whether an unknown opcode
// stops the simulation - and declares the register and run methods that a
// real CPU must provide.  CPUs don't own any devices.  Anything memory mapped
// lives in the memory object.
//
// REVISION HISTORY:
// 12-AUG-19  RLA   New file.
//  5-JUL-22  RLA   Change to use CDeviceMap class ...
// 19-OCT-26  RLA   Remove the event queue, interrupts and I/O mapped
//                    devices.  Replace the command parser keyword table
//                    with REGNAME.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // basic memory emulation declarations ...


class CCPU {
  //++
  // Generic CPU emulator class ...
  //--

  // Reasons for Run() to return ...
public:
  enum _STOP_CODES {
    STOP_NONE,          // still running (never returned by Run())
    STOP_FINISHED,      // ran the requested number of instructions
    STOP_ILLEGAL_IO,    // console input hit end of file
    STOP_ILLEGAL_OPCODE,// reserved opcode or unknown trap vector
    STOP_HALT,          // the program executed HALT
    STOP_ENDLESS_LOOP,  // branch or jump to itself
    STOP_BREAKPOINT,    // PC reached a location with a breakpoint
    STOP_BREAK          // Break() was called, e.g. by a ^C
  };
  typedef enum _STOP_CODES STOP_CODE;

  // One entry in the register name table, which ends with a NULL name ...
  struct _REGNAME {
    const char *pszName;        // what the operator calls it
    cpureg_t    nReg;           // index for GetRegister()/SetRegister()
  };
  typedef struct _REGNAME REGNAME;

public:
  CCPU (CMemory *pMemory);
  virtual ~CCPU() {};
private:
  // Disallow copy and assignments!
  CCPU (const CCPU&) = delete;
  CCPU& operator= (CCPU const &) = delete;

  // CCPU properties ...
public:
  inline void StopOnIllegalOpcode (bool fStop=true) {m_fStopOnIllegalOpcode = fStop;}
  inline bool IsStopOnIllegalOpcode() const {return m_fStopOnIllegalOpcode;}
  inline address_t GetLastPC() const {return m_nLastPC;}
  inline STOP_CODE GetStopCode() const {return m_nStopCode;}
  virtual address_t GetPC() const = 0;
  virtual void SetPC (address_t a) = 0;
  virtual const char *GetDescription() const = 0;
  virtual const char *GetName() const = 0;

  // Emulation control...
public:
  // Reset the CPU state (but not memory!) ...
  virtual void ClearCPU() {m_nStopCode = STOP_NONE;}
  //   Execute instructions until something stops us or, if nCount is not
  // zero, until nCount instructions have been executed ...
  virtual STOP_CODE Run (uint32_t nCount=0) = 0;
  // Ask Run() to stop after the current instruction ...
  virtual void Break (STOP_CODE nStop=STOP_BREAK) {m_nStopCode = nStop;}
  // Called for anything the CPU doesn't know how to execute ...
  void IllegalOpcode() {if (m_fStopOnIllegalOpcode) Break(STOP_ILLEGAL_OPCODE);}
  static const char *StopCodeToString (STOP_CODE nStop);

  // Register access for the user interface ...
public:
  virtual const REGNAME *GetRegisterNames() const = 0;
  virtual unsigned GetRegisterSize (cpureg_t nReg) const = 0;
  virtual uint16_t GetRegister (cpureg_t nReg) const = 0;
  virtual void SetRegister (cpureg_t nReg, uint16_t nVal) = 0;

protected:
  bool            m_fStopOnIllegalOpcode; // stop on reserved opcodes
  STOP_CODE       m_nStopCode;      // why Run() stopped
  address_t       m_nLastPC;        // address of the last instruction
  CMemory        *m_pMemory;        // main memory for this CPU
};
