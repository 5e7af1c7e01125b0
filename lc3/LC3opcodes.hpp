//++
//LC3opcodes.hpp -> LC-3 opcodes, instruction fields and disassembler
//
// DESCRIPTION:
//    This file contains the LC-3 opcodes, inline functions to extract the
// various bit fields from an instruction word, and the function prototypes
// for the decoder and the one line disassembler ...
//
//   Every LC-3 instruction is exactly one 16 bit word, and the opcode is
// always the upper four bits.  The remaining twelve bits are fields whose
// meaning depends on the opcode, but the same field always lives in the same
// place - DR is always bits 11..9, SR1 and BaseR are always 8..6, and so on.
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include "EMULIB.hpp"           // ISSET(), MASK3(), etc ...
#include "MemoryTypes.h"        // address_t and word_t data types
using std::string;              // ...

//   LC-3 opcodes.  Note that the values here are the actual bits 15..12 of
// the instruction, so the order matters!  RTI and RES are reserved and are
// never executed by a user mode program ...
enum _OPCODES {
  OP_BR   =  0,       // conditional branch
  OP_ADD  =  1,       // add
  OP_LD   =  2,       // load PC relative
  OP_ST   =  3,       // store PC relative
  OP_JSR  =  4,       // jump to subroutine (JSR and JSRR)
  OP_AND  =  5,       // bitwise logical AND
  OP_LDR  =  6,       // load base+offset
  OP_STR  =  7,       // store base+offset
  OP_RTI  =  8,       // return from interrupt (reserved)
  OP_NOT  =  9,       // bitwise complement
  OP_LDI  = 10,       // load indirect
  OP_STI  = 11,       // store indirect
  OP_JMP  = 12,       // jump (and RET)
  OP_RES  = 13,       // reserved
  OP_LEA  = 14,       // load effective address
  OP_TRAP = 15,       // system call
  OP_COUNT = 16       // number of opcodes
};
typedef enum _OPCODES OPCODE;

// Standard trap vectors ...
enum _TRAP_VECTORS {
  TRAP_GETC  = 0x20,  // read one character into R0 (no echo)
  TRAP_OUT   = 0x21,  // write the character in R0
  TRAP_PUTS  = 0x22,  // write a string, one character per word
  TRAP_IN    = 0x23,  // prompt, read and echo one character
  TRAP_PUTSP = 0x24,  // write a string, two characters per word
  TRAP_HALT  = 0x25,  // halt the machine
};

//++
//   Sign extend an n bit field to a full 16 bits.  The field must already
// be right justified and masked to n bits!
//--
inline uint16_t SEXT (uint16_t wField, unsigned nBits)
  {return ISSET(wField, 1U << (nBits-1)) ? (uint16_t) (wField | (0xFFFFU << nBits)) : wField;}

// Extract fields from an instruction word ...
inline uint8_t  OPFIELD (uint16_t wIR)    {return (wIR >> 12) & 0xF;}
inline uint3_t  DR (uint16_t wIR)         {return MASK3(wIR >> 9);}
inline uint3_t  SR (uint16_t wIR)         {return MASK3(wIR >> 9);}
inline uint3_t  SR1 (uint16_t wIR)        {return MASK3(wIR >> 6);}
inline uint3_t  SR2 (uint16_t wIR)        {return MASK3(wIR);}
inline uint3_t  BASER (uint16_t wIR)      {return MASK3(wIR >> 6);}
inline uint3_t  NZP (uint16_t wIR)        {return MASK3(wIR >> 9);}
inline uint16_t IMM5 (uint16_t wIR)       {return SEXT(wIR & 0x1F, 5);}
inline uint16_t OFFSET6 (uint16_t wIR)    {return SEXT(wIR & 0x3F, 6);}
inline uint16_t PCOFFSET9 (uint16_t wIR)  {return SEXT(wIR & 0x1FF, 9);}
inline uint16_t PCOFFSET11 (uint16_t wIR) {return SEXT(wIR & 0x7FF, 11);}
inline uint8_t  TRAPVECT8 (uint16_t wIR)  {return LOBYTE(wIR);}
// ADD and AND use an immediate operand if bit 5 is set ...
inline bool ISIMM5 (uint16_t wIR)         {return ISSET(wIR, BIT5);}
// JSR uses a PC relative address if bit 11 is set, and JSRR if it's clear ...
inline bool ISJSR (uint16_t wIR)          {return ISSET(wIR, BIT11);}

// Decode the opcode, return the mnemonic, and disassemble instructions ...
extern bool DecodeOpcode (uint32_t wIR, OPCODE &nOpcode);
extern const char *GetOpcodeName (OPCODE nOpcode);
extern const char *GetTrapName (uint8_t bVector);
extern string Disassemble (uint16_t wIR, address_t wPC);
