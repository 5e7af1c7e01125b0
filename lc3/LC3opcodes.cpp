//++
//LC3opcodes.cpp -> LC-3 decoder and disassembler
//
// DESCRIPTION:
//   This file contains a table of ASCII mnemonics for LC-3 opcodes, the
// opcode decoder, and a one line disassembler.  The disassembler output is
// used by the instruction trace.
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "LC3opcodes.hpp"       // declarations for this module

// Opcode argument types ...
enum _OP_ARG_TYPES {
  OP_ARG_NONE,      // no arguments at all (RTI)
  OP_ARG_OPERATE,   // DR, SR1 and either SR2 or imm5 (ADD, AND)
  OP_ARG_NOT,       // DR and SR (NOT)
  OP_ARG_BRANCH,    // condition codes and PC relative address (BR)
  OP_ARG_PCREL,     // register and PC relative address (LD, LEA, ST, ...)
  OP_ARG_BASE,      // register, base register and offset6 (LDR, STR)
  OP_ARG_JMP,       // base register (JMP)
  OP_ARG_JSR,       // PC relative address or base register (JSR, JSRR)
  OP_ARG_TRAP,      // trap vector
  OP_ARG_ILLEGAL,   // reserved opcode
};
typedef enum _OP_ARG_TYPES OP_ARG_TYPE;

// Opcode definitions for the disassembler ...
struct _OP_NAME {
  const char   *pszName;        // the mnemonic for the opcode
  OP_ARG_TYPE   nType;          // argument/operand for this opcode
};
typedef struct _OP_NAME OP_NAME;

//   LC-3 opcode table.  This is indexed by the opcode, so the order here
// must match the OPCODE enum exactly!
PRIVATE const OP_NAME g_aOpcodes[OP_COUNT] = {
  {"BR",   OP_ARG_BRANCH},      // 0x0
  {"ADD",  OP_ARG_OPERATE},     // 0x1
  {"LD",   OP_ARG_PCREL},       // 0x2
  {"ST",   OP_ARG_PCREL},       // 0x3
  {"JSR",  OP_ARG_JSR},         // 0x4
  {"AND",  OP_ARG_OPERATE},     // 0x5
  {"LDR",  OP_ARG_BASE},        // 0x6
  {"STR",  OP_ARG_BASE},        // 0x7
  {"RTI",  OP_ARG_NONE},        // 0x8
  {"NOT",  OP_ARG_NOT},         // 0x9
  {"LDI",  OP_ARG_PCREL},       // 0xA
  {"STI",  OP_ARG_PCREL},       // 0xB
  {"JMP",  OP_ARG_JMP},         // 0xC
  {"RES",  OP_ARG_ILLEGAL},     // 0xD
  {"LEA",  OP_ARG_PCREL},       // 0xE
  {"TRAP", OP_ARG_TRAP},        // 0xF
};

// Names of the standard trap vectors, starting from TRAP_GETC ...
PRIVATE const char *g_apszTrapNames[] = {
  "GETC", "OUT", "PUTS", "IN", "PUTSP", "HALT"
};
#define TRAP_NAME_COUNT (sizeof(g_apszTrapNames)/sizeof(g_apszTrapNames[0]))


PUBLIC bool DecodeOpcode (uint32_t wIR, OPCODE &nOpcode)
{
  //++
  //   Extract the opcode from bits 15..12 of the instruction.  This can't
  // fail for a real 16 bit instruction, but anything larger that gets
  // passed to us is rejected (and nOpcode is left unchanged).
  //--
  uint32_t nOp = wIR >> 12;
  if (nOp >= OP_COUNT) return false;
  nOpcode = (OPCODE) nOp;
  return true;
}

PUBLIC const char *GetOpcodeName (OPCODE nOpcode)
{
  //++
  // Return the mnemonic for an opcode ...
  //--
  assert(nOpcode < OP_COUNT);
  return g_aOpcodes[nOpcode].pszName;
}

PUBLIC const char *GetTrapName (uint8_t bVector)
{
  //++
  // Return the name of a standard trap vector, or NULL if it isn't one ...
  //--
  if ((bVector < TRAP_GETC) || ((size_t) (bVector-TRAP_GETC) >= TRAP_NAME_COUNT))
    return NULL;
  return g_apszTrapNames[bVector-TRAP_GETC];
}

PRIVATE string ShowPCRelative (address_t wPC, uint16_t wOffset)
{
  //++
  //   Disassemble a PC relative address.  Remember that the offset is relative
  // to the address of the NEXT instruction!
  //--
  return FormatString("0x%04X", ADDRESS(wPC + 1 + wOffset));
}

PRIVATE string ShowImmediate (uint16_t wValue)
{
  //++
  // Show a sign extended immediate value in decimal, LC-3 style ...
  //--
  return FormatString("#%d", (int16_t) wValue);
}

PRIVATE string ShowConditions (uint3_t bNZP)
{
  //++
  //   Return the condition code suffix for a BR instruction.  Note that BR
  // with all three bits set is usually written without any suffix, but we
  // spell it out anyway so there's no confusion ...
  //--
  string s;
  if (ISSET(bNZP, 4)) s += "N";
  if (ISSET(bNZP, 2)) s += "Z";
  if (ISSET(bNZP, 1)) s += "P";
  return s;
}

PUBLIC string Disassemble (uint16_t wIR, address_t wPC)
{
  //++
  //   Disassemble one instruction and return a string containg the result.
  // Since LC-3 instructions are always exactly one word, this is easy.  The
  // address of the instruction is needed to show PC relative addresses.
  //--
  OPCODE nOpcode = OP_BR;
  if (!DecodeOpcode(wIR, nOpcode)) return FormatString(".FILL 0x%04X", wIR);
  const OP_NAME *pOpcode = &g_aOpcodes[nOpcode];
  string sCode = pOpcode->pszName;

  switch (pOpcode->nType) {
    case OP_ARG_NONE:
      break;

    case OP_ARG_OPERATE:
      sCode += FormatString(" R%d,R%d,", DR(wIR), SR1(wIR));
      if (ISIMM5(wIR))
        sCode += ShowImmediate(IMM5(wIR));
      else
        sCode += FormatString("R%d", SR2(wIR));
      break;

    case OP_ARG_NOT:
      sCode += FormatString(" R%d,R%d", DR(wIR), SR1(wIR));
      break;

    case OP_ARG_BRANCH:
      // A branch with no condition bits never branches at all ...
      if (NZP(wIR) == 0) return string("NOP");
      sCode += ShowConditions(NZP(wIR)) + " " + ShowPCRelative(wPC, PCOFFSET9(wIR));
      break;

    case OP_ARG_PCREL:
      sCode += FormatString(" R%d,", DR(wIR)) + ShowPCRelative(wPC, PCOFFSET9(wIR));
      break;

    case OP_ARG_BASE:
      sCode += FormatString(" R%d,R%d,", DR(wIR), BASER(wIR)) + ShowImmediate(OFFSET6(wIR));
      break;

    case OP_ARG_JMP:
      if (BASER(wIR) == 7) return string("RET");
      sCode += FormatString(" R%d", BASER(wIR));
      break;

    case OP_ARG_JSR:
      if (ISJSR(wIR))
        sCode += " " + ShowPCRelative(wPC, PCOFFSET11(wIR));
      else
        sCode = FormatString("JSRR R%d", BASER(wIR));
      break;

    case OP_ARG_TRAP:
      if (GetTrapName(TRAPVECT8(wIR)) != NULL)
        sCode = GetTrapName(TRAPVECT8(wIR));
      else
        sCode += FormatString(" x%02X", TRAPVECT8(wIR));
      break;

    case OP_ARG_ILLEGAL:
      sCode = FormatString(".FILL 0x%04X", wIR);
      break;
  }
  return sCode;
}
