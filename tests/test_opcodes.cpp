//++
// test_opcodes.cpp -> opcode decoder, field helpers and disassembler tests
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
#include <stdint.h>             // uint8_t, uint16_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "LC3opcodes.hpp"       // LC-3 opcode definitions
using std::string;              // ...


TEST(DecodeOpcode, EveryTopNibbleMapsToItsOpcode)
{
  for (uint32_t n = 0;  n < 16;  ++n) {
    OPCODE nOpcode = OP_COUNT;
    ASSERT_TRUE(DecodeOpcode(n << 12, nOpcode));
    EXPECT_EQ((uint32_t) nOpcode, n);
  }
}

TEST(DecodeOpcode, NamedValues)
{
  OPCODE nOpcode = OP_BR;
  ASSERT_TRUE(DecodeOpcode(0x4000, nOpcode));
  EXPECT_EQ(nOpcode, OP_JSR);
  ASSERT_TRUE(DecodeOpcode(0xF025, nOpcode));
  EXPECT_EQ(nOpcode, OP_TRAP);
  ASSERT_TRUE(DecodeOpcode(0x0000, nOpcode));
  EXPECT_EQ(nOpcode, OP_BR);
  ASSERT_TRUE(DecodeOpcode(0xD000, nOpcode));
  EXPECT_EQ(nOpcode, OP_RES);
}

TEST(DecodeOpcode, RejectsValuesWiderThanSixteenBits)
{
  OPCODE nOpcode = OP_ADD;
  EXPECT_FALSE(DecodeOpcode(0x10000, nOpcode));
  EXPECT_EQ(nOpcode, OP_ADD);
}

TEST(DecodeOpcode, MnemonicsMatchTheOpcodes)
{
  EXPECT_STREQ(GetOpcodeName(OP_BR), "BR");
  EXPECT_STREQ(GetOpcodeName(OP_LDI), "LDI");
  EXPECT_STREQ(GetOpcodeName(OP_TRAP), "TRAP");
}

TEST(SignExtend, NegativeFieldsFillTheUpperBits)
{
  EXPECT_EQ(SEXT(0x10, 5), 0xFFF0);
  EXPECT_EQ(SEXT(0x1F, 5), 0xFFFF);
  EXPECT_EQ(SEXT(0x20, 6), 0xFFE0);
  EXPECT_EQ(SEXT(0x400, 11), 0xFC00);
}

TEST(SignExtend, PositiveFieldsAreUnchanged)
{
  EXPECT_EQ(SEXT(0x0F, 5), 0x000F);
  EXPECT_EQ(SEXT(0x0FF, 9), 0x00FF);
  EXPECT_EQ(SEXT(0x000, 9), 0x0000);
}

TEST(InstructionFields, ExtractedFromTheRightBits)
{
  // ADD R1,R2,#-3 ...
  uint16_t wIR = 0x12BD;
  EXPECT_EQ(OPFIELD(wIR), 1);
  EXPECT_EQ(DR(wIR), 1);
  EXPECT_EQ(SR1(wIR), 2);
  EXPECT_TRUE(ISIMM5(wIR));
  EXPECT_EQ(IMM5(wIR), 0xFFFD);
  // LDR R0,R6,#-1 ...
  wIR = 0x61BF;
  EXPECT_EQ(BASER(wIR), 6);
  EXPECT_EQ(OFFSET6(wIR), 0xFFFF);
  // JSR with the largest negative offset ...
  wIR = 0x4C00;
  EXPECT_TRUE(ISJSR(wIR));
  EXPECT_EQ(PCOFFSET11(wIR), 0xFC00);
  EXPECT_EQ(TRAPVECT8(0xF023), TRAP_IN);
}

TEST(TrapNames, KnownAndUnknownVectors)
{
  EXPECT_STREQ(GetTrapName(TRAP_GETC), "GETC");
  EXPECT_STREQ(GetTrapName(TRAP_HALT), "HALT");
  EXPECT_EQ(GetTrapName(0x1F), (const char *) NULL);
  EXPECT_EQ(GetTrapName(0x26), (const char *) NULL);
}

TEST(Disassemble, OperateInstructions)
{
  EXPECT_EQ(Disassemble(0x12BD, 0x3000), "ADD R1,R2,#-3");
  EXPECT_EQ(Disassemble(0x1042, 0x3000), "ADD R0,R1,R2");
  EXPECT_EQ(Disassemble(0x5020, 0x3000), "AND R0,R0,#0");
  EXPECT_EQ(Disassemble(0x973F, 0x3000), "NOT R3,R4");
}

TEST(Disassemble, BranchesShowTheTargetAddress)
{
  EXPECT_EQ(Disassemble(0x0C04, 0x3000), "BRNZ 0x3005");
  EXPECT_EQ(Disassemble(0x0E00, 0x3000), "BRNZP 0x3001");
  EXPECT_EQ(Disassemble(0x03FF, 0x3000), "BRP 0x3000");
  EXPECT_EQ(Disassemble(0x0000, 0x3000), "NOP");
}

TEST(Disassemble, MemoryAndControlInstructions)
{
  EXPECT_EQ(Disassemble(0x2001, 0x3000), "LD R0,0x3002");
  EXPECT_EQ(Disassemble(0xEBFE, 0x3000), "LEA R5,0x2FFF");
  EXPECT_EQ(Disassemble(0x61BF, 0x3000), "LDR R0,R6,#-1");
  EXPECT_EQ(Disassemble(0x7942, 0x3000), "STR R4,R5,#2");
  EXPECT_EQ(Disassemble(0xC080, 0x3000), "JMP R2");
  EXPECT_EQ(Disassemble(0xC1C0, 0x3000), "RET");
  EXPECT_EQ(Disassemble(0x4810, 0x3000), "JSR 0x3011");
  EXPECT_EQ(Disassemble(0x40C0, 0x3000), "JSRR R3");
}

TEST(Disassemble, TrapsAndReservedOpcodes)
{
  EXPECT_EQ(Disassemble(0xF025, 0x3000), "HALT");
  EXPECT_EQ(Disassemble(0xF022, 0x3000), "PUTS");
  EXPECT_EQ(Disassemble(0xF026, 0x3000), "TRAP x26");
  EXPECT_EQ(Disassemble(0x8000, 0x3000), "RTI");
  EXPECT_EQ(Disassemble(0xD123, 0x3000), ".FILL 0xD123");
}
