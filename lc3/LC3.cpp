//++
//LC3.cpp - LC-3 microprocessor emulation
//
// DESCRIPTION:
//   This module implements a simulation of the LC-3 CPU.  The LC-3 has no
// operating system in this emulator, so the standard trap vectors (GETC, OUT,
// PUTS, IN, PUTSP and HALT) are implemented directly in C++ rather than by
// executing service routines from the trap vector table.  The trap routines
// still talk to the console thru the memory mapped keyboard and display
// registers, though, so whatever device is installed there gets the I/O.
//
//   Only the user mode instruction set is implemented.  RTI and the reserved
// opcode (1101) are treated as illegal instructions.
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string.h>             // memset(), strlen(), etc ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CMemory memory emulation object
#include "CPU.hpp"              // CCPU base class definitions
#include "LC3opcodes.hpp"       // LC-3 opcode definitions
#include "LC3.hpp"              // declarations for this module

// Internal CPU register names for GetRegisterNames() ...
const CCPU::REGNAME CLC3::g_aRegisterNames[] = {
  {"R0", CLC3::REG_R0},  {"R1", CLC3::REG_R1},
  {"R2", CLC3::REG_R2},  {"R3", CLC3::REG_R3},
  {"R4", CLC3::REG_R4},  {"R5", CLC3::REG_R5},
  {"R6", CLC3::REG_R6},  {"R7", CLC3::REG_R7},
  {"PC", CLC3::REG_PC},  {"CC", CLC3::REG_COND},
  {NULL, 0}
};

// Prompt printed by the IN trap ...
PRIVATE const char *g_pszInPrompt = "Enter a character: ";


CLC3::CLC3 (CMemory *pMemory)
  : CCPU(pMemory)
{
  //++
  //--
  CLC3::ClearCPU();
}

void CLC3::ClearCPU()
{
  //++
  //   This routine resets the LC-3 to a power on state.  All the registers
  // are cleared, the PC points to the conventional start of user programs,
  // and the condition code is Z ...
  //--
  CCPU::ClearCPU();
  memset(m_R, 0, sizeof(m_R));
  m_PC = USER_START;  m_COND = FL_ZRO;
  m_llInstructions = 0;
}

void CLC3::TraceInstruction (address_t wPC, uint16_t wIR) const
{
  //++
  //   This routine will log the instruction that we're about to execute.
  // If tracing is not enabled, it does nothing ...
  //--
  if (!ISLOGGED(TRACE)) return;
  LOGF(TRACE, "%04X/ %04X\t%s", wPC, wIR, Disassemble(wIR, wPC).c_str());
}


////////////////////////////////////////////////////////////////////////////////
//////////////////////////   OPERATE INSTRUCTIONS   ////////////////////////////
////////////////////////////////////////////////////////////////////////////////

void CLC3::ADD (uint16_t wIR)
{
  //++
  //   Add SR1 to either SR2 or a sign extended five bit immediate value and
  // store the result in DR.  Overflow is silently ignored (the result just
  // wraps around) and the condition codes are set from the result.
  //--
  uint16_t wSRC2 = ISIMM5(wIR) ? IMM5(wIR) : REG(SR2(wIR));
  uint16_t wResult = (uint16_t) (REG(SR1(wIR)) + wSRC2);
  UpdateCC((REG(DR(wIR)) = wResult));
}

void CLC3::AND (uint16_t wIR)
{
  //++
  // Same as ADD, but a bitwise AND ...
  //--
  uint16_t wSRC2 = ISIMM5(wIR) ? IMM5(wIR) : REG(SR2(wIR));
  UpdateCC((REG(DR(wIR)) = REG(SR1(wIR)) & wSRC2));
}

void CLC3::NOT (uint16_t wIR)
{
  //++
  // DR <- ones complement of SR ...
  //--
  UpdateCC((REG(DR(wIR)) = (uint16_t) ~REG(SR1(wIR))));
}


////////////////////////////////////////////////////////////////////////////////
/////////////////////   CONTROL TRANSFER INSTRUCTIONS   ////////////////////////
////////////////////////////////////////////////////////////////////////////////

void CLC3::BR (uint16_t wIR)
{
  //++
  //   Branch if ANY of the n, z or p bits in the instruction matches the
  // current condition code.  Since the condition code bits are in the same
  // order as the instruction bits, that's just an AND.  Note that a BR with
  // none of the bits set never branches and is effectively a NOP ...
  //--
  if ((NZP(wIR) & m_COND) != 0) m_PC = ADDRESS(m_PC + PCOFFSET9(wIR));
}

void CLC3::JMP (uint16_t wIR)
{
  //++
  // Jump to the address in BaseR.  RET is just JMP R7 ...
  //--
  m_PC = REG(BASER(wIR));
}

void CLC3::JSR (uint16_t wIR)
{
  //++
  //   Jump to subroutine, either PC relative (JSR) or thru a base register
  // (JSRR), and save the return address in R7.  Be careful - the target must
  // be computed BEFORE R7 is changed, because JSRR R7 is perfectly legal!
  //--
  address_t wReturn = m_PC;
  if (ISJSR(wIR))
    m_PC = ADDRESS(m_PC + PCOFFSET11(wIR));
  else
    m_PC = REG(BASER(wIR));
  REG(7) = wReturn;
}


////////////////////////////////////////////////////////////////////////////////
//////////////////////   DATA MOVEMENT INSTRUCTIONS   //////////////////////////
////////////////////////////////////////////////////////////////////////////////

void CLC3::LD (uint16_t wIR)
{
  //++
  // Load DR from a PC relative address and set the condition codes ...
  //--
  UpdateCC((REG(DR(wIR)) = MEMR(ADDRESS(m_PC + PCOFFSET9(wIR)))));
}

void CLC3::LDI (uint16_t wIR)
{
  //++
  //   Load indirect - the PC relative location contains the address of the
  // actual operand ...
  //--
  address_t wEA = MEMR(ADDRESS(m_PC + PCOFFSET9(wIR)));
  UpdateCC((REG(DR(wIR)) = MEMR(wEA)));
}

void CLC3::LDR (uint16_t wIR)
{
  //++
  // Load DR from BaseR plus a sign extended six bit offset ...
  //--
  UpdateCC((REG(DR(wIR)) = MEMR(ADDRESS(REG(BASER(wIR)) + OFFSET6(wIR)))));
}

void CLC3::LEA (uint16_t wIR)
{
  //++
  //   Load the effective address (not the contents!) of a PC relative
  // location into DR.  The condition codes ARE updated, even though some
  // later versions of the LC-3 don't ...
  //--
  UpdateCC((REG(DR(wIR)) = ADDRESS(m_PC + PCOFFSET9(wIR))));
}

void CLC3::ST (uint16_t wIR)
{
  //++
  // Store SR at a PC relative address.  No stores change the condition codes.
  //--
  MEMW(ADDRESS(m_PC + PCOFFSET9(wIR)), REG(SR(wIR)));
}

void CLC3::STI (uint16_t wIR)
{
  //++
  // Store indirect ...
  //--
  address_t wEA = MEMR(ADDRESS(m_PC + PCOFFSET9(wIR)));
  MEMW(wEA, REG(SR(wIR)));
}

void CLC3::STR (uint16_t wIR)
{
  MEMW(ADDRESS(REG(BASER(wIR)) + OFFSET6(wIR)), REG(SR(wIR)));
}

void CLC3::Reserved (uint16_t wIR)
{
  //++
  //   RTI and the reserved opcode both end up here.  There's no supervisor
  // mode, so neither one means anything to us.  If we're stopping on illegal
  // opcodes then print a message too; otherwise the instruction is just a
  // no-op and no state changes.
  //--
  if (IsStopOnIllegalOpcode())
    LOGF(WARNING, "illegal opcode 0x%04X at 0x%04X", wIR, m_nLastPC);
  IllegalOpcode();
}


////////////////////////////////////////////////////////////////////////////////
////////////////////////   TRAP SERVICE ROUTINES   /////////////////////////////
////////////////////////////////////////////////////////////////////////////////

bool CLC3::ReadChar (uint16_t &wChar)
{
  //++
  //   Read one character from the keyboard data register.  The device waits
  // for a key to be typed, and it returns all ones if there's no more input
  // (end of file) or if the simulation was interrupted while waiting.  In
  // either case the trap is aborted and we return false.
  //--
  uint16_t wData = MEMR(KBDR);
  if (wData == WORD_MAX) {
    if (m_nStopCode == STOP_NONE) {
      LOGF(WARNING, "end of file on console input at 0x%04X", m_nLastPC);
      Break(STOP_ILLEGAL_IO);
    }
    return false;
  }
  wChar = LOBYTE(wData);
  return true;
}

void CLC3::TrapGETC()
{
  //++
  // Read a single character into R0, without echo ...
  //--
  uint16_t wChar;
  if (ReadChar(wChar)) REG(0) = wChar;
}

void CLC3::TrapOUT()
{
  //++
  // Write the character in R0[7:0] to the display ...
  //--
  WriteChar(LOBYTE(REG(0)));
}

void CLC3::TrapPUTS()
{
  //++
  //   Write a null terminated string starting at the address in R0.  There's
  // one character per word, in the low byte.  A string can't be longer than
  // all of memory, so the loop will always terminate even if there's no zero
  // word anywhere ...
  //--
  address_t wAddr = REG(0);
  for (uint32_t i = 0;  i < MAXMEMORY;  ++i, wAddr = ADDRESS(wAddr+1)) {
    uint16_t wData = MEMR(wAddr);
    if (wData == 0) break;
    WriteChar(LOBYTE(wData));
  }
}

void CLC3::TrapIN()
{
  //++
  //   Print a prompt, read a single character into R0, and echo it.  On end
  // of file R0 is left alone and nothing is echoed ...
  //--
  for (const char *p = g_pszInPrompt;  *p != 0;  ++p) WriteChar(*p);
  uint16_t wChar;
  if (!ReadChar(wChar)) return;
  WriteChar(LOBYTE(wChar));
  REG(0) = wChar;
}

void CLC3::TrapPUTSP()
{
  //++
  //   Write a packed string starting at the address in R0.  There are two
  // characters per word, low byte first.  A zero word terminates the string,
  // and a zero high byte means a string of odd length ...
  //--
  address_t wAddr = REG(0);
  for (uint32_t i = 0;  i < MAXMEMORY;  ++i, wAddr = ADDRESS(wAddr+1)) {
    uint16_t wData = MEMR(wAddr);
    if (wData == 0) break;
    WriteChar(LOBYTE(wData));
    if (HIBYTE(wData) != 0) WriteChar(HIBYTE(wData));
  }
}

void CLC3::TRAP (uint16_t wIR)
{
  //++
  //   Save the return address in R7 and then execute the trap routine.  The
  // trap routines never change the condition codes.  An unknown trap vector
  // is treated the same as an illegal opcode ...
  //--
  REG(7) = m_PC;
  uint8_t bVector = TRAPVECT8(wIR);
  switch (bVector) {
    case TRAP_GETC:   TrapGETC();         break;
    case TRAP_OUT:    TrapOUT();          break;
    case TRAP_PUTS:   TrapPUTS();         break;
    case TRAP_IN:     TrapIN();           break;
    case TRAP_PUTSP:  TrapPUTSP();        break;
    case TRAP_HALT:   Break(STOP_HALT);   break;
    default:
      if (IsStopOnIllegalOpcode())
        LOGF(WARNING, "unknown trap vector 0x%02X at 0x%04X", bVector, m_nLastPC);
      IllegalOpcode();
      break;
  }
}


////////////////////////////////////////////////////////////////////////////////
////////////////////////   CPU EXECUTION ENGINE   //////////////////////////////
////////////////////////////////////////////////////////////////////////////////

void CLC3::DoExecute (uint16_t wIR)
{
  //++
  //   Decode and execute a single instruction.  The PC has already been
  // incremented and points to the next instruction, which is what all the
  // PC relative addressing modes want.
  //--
  OPCODE nOpcode;
  if (!DecodeOpcode(wIR, nOpcode)) {
    IllegalOpcode();  return;
  }

  switch (nOpcode) {
    case OP_ADD:   ADD(wIR);        break;    // ADD
    case OP_AND:   AND(wIR);        break;    // AND
    case OP_NOT:   NOT(wIR);        break;    // NOT
    case OP_BR:    BR(wIR);         break;    // BR
    case OP_JMP:   JMP(wIR);        break;    // JMP, RET
    case OP_JSR:   JSR(wIR);        break;    // JSR, JSRR
    case OP_LD:    LD(wIR);         break;    // LD
    case OP_LDI:   LDI(wIR);        break;    // LDI
    case OP_LDR:   LDR(wIR);        break;    // LDR
    case OP_LEA:   LEA(wIR);        break;    // LEA
    case OP_ST:    ST(wIR);         break;    // ST
    case OP_STI:   STI(wIR);        break;    // STI
    case OP_STR:   STR(wIR);        break;    // STR
    case OP_TRAP:  TRAP(wIR);       break;    // TRAP

    // Everything else is invalid!
    case OP_RTI:                              // RTI
    case OP_RES:                              // (reserved)
    default:
      Reserved(wIR);  break;
  }
}

CCPU::STOP_CODE CLC3::Execute (uint16_t wIR)
{
  //++
  //   Execute exactly one instruction.  The instruction has already been
  // fetched and the PC must already point to the next instruction.  This is
  // mostly useful for testing, and it doesn't check breakpoints or count
  // instructions.  The return value is STOP_NONE unless the instruction
  // halted the machine or was illegal ...
  //--
  m_nStopCode = STOP_NONE;
  m_nLastPC = ADDRESS(m_PC-1);
  DoExecute(wIR);
  return m_nStopCode;
}

CCPU::STOP_CODE CLC3::Run (uint32_t nCount)
{
  //++
  //   This is the main "engine" of the LC-3 emulator.  The main program
  // calls it to execute LC-3 instructions until it either a) executes the
  // number of instructions specified by nCount, or b) some condition arises
  // to interrupt the simulation such as a HALT trap, an illegal opcode, end
  // of file on the console, the user typing the break character, etc.  If
  // nCount is zero on entry, then we will run forever until one of the
  // previously mentioned break conditions arises.
  //--
  bool fFirst = true;
  m_nStopCode = STOP_NONE;
  while (m_nStopCode == STOP_NONE) {

    // Stop if we've hit a breakpoint ...
    if (!fFirst && m_pMemory->IsBreak(m_PC)) {
      m_nStopCode = STOP_BREAKPOINT;  break;
    } else
      fFirst = false;

    // Fetch the next instruction and, if tracing is on, log it ...
    m_nLastPC = m_PC;  uint16_t wIR = MEMR(m_PC);
    if (ISLOGGED(TRACE)) TraceInstruction(m_nLastPC, wIR);

    // Increment the PC and execute the instruction ...
    m_PC = ADDRESS(m_PC+1);
    DoExecute(wIR);
    ++m_llInstructions;

    // Terminate if we've executed enough instructions ...
    if (m_nStopCode == STOP_NONE) {
      if ((nCount > 0)  &&  (--nCount == 0))  m_nStopCode = STOP_FINISHED;
    }
  }

  return m_nStopCode;
}

uint16_t CLC3::GetRegister (cpureg_t nReg) const
{
  //++
  // This method will return the contents of an internal CPU register ...
  //--
  switch (nReg) {
    case REG_R0:  case REG_R1:  case REG_R2:  case REG_R3:
    case REG_R4:  case REG_R5:  case REG_R6:  case REG_R7:
      return m_R[nReg];
    case REG_PC:    return m_PC;
    case REG_COND:  return m_COND;
    default:        return 0;
  }
}

void CLC3::SetRegister (cpureg_t nReg, uint16_t wData)
{
  //++
  //   Change the contents of an internal CPU register.  Setting the condition
  // codes to anything other than exactly one of N, Z or P is ignored ...
  //--
  switch (nReg) {
    case REG_R0:  case REG_R1:  case REG_R2:  case REG_R3:
    case REG_R4:  case REG_R5:  case REG_R6:  case REG_R7:
      m_R[nReg] = wData;  break;
    case REG_PC:    m_PC = ADDRESS(wData);  break;
    case REG_COND:
      if ((wData == FL_POS) || (wData == FL_ZRO) || (wData == FL_NEG))
        m_COND = (uint3_t) wData;
      break;
    default:
      break;
  }
}
