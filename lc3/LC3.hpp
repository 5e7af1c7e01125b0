//++
// LC3.hpp -> definitions for LC-3 microprocessor emulation
//
// DESCRIPTION:
//   The CLC3 class is derived from the CCPU class and implements the LC-3
// teaching microprocessor - eight 16 bit general purpose registers, a 16 bit
// PC, and a three bit N/Z/P condition code.
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include "EMULIB.hpp"           // ISSET(), et al ...
#include "MemoryTypes.h"        // address_t and word_t data types
#include "CPU.hpp"              // CPU definitions
using std::string;              // ...


class CLC3 : public CCPU {
  // LC-3 CPU characteristics...
public:
  enum {
    MAXMEMORY     = 65536UL,    // memory size (16 bit words!)
    MAXREG        = 8,          // number of general purpose registers
    USER_START    = 0x3000,     // conventional start of user programs
  };

  // Internal CPU registers ...
  //   These codes are passed to the GetRegister() and SetRegister() methods to
  // access internal CPU registers and state.
public:
  enum _REGISTERS {
    REG_R0    =  0,           // general purpose registers ...
    REG_R1    =  1,           // ...
    REG_R2    =  2,           // ...
    REG_R3    =  3,           // ...
    REG_R4    =  4,           // ...
    REG_R5    =  5,           // ...
    REG_R6    =  6,           // (stack pointer, by convention)
    REG_R7    =  7,           // (return address for JSR and TRAP)
    REG_PC    =  8,           // program counter
    REG_COND  =  9,           // condition codes (N, Z or P)
  };
  // This table is used to translate a name to a REGISTER ...
  static const REGNAME g_aRegisterNames[];

  //   Condition code bits.  Exactly one of these is always set - the LC-3
  // never has more than one, or none, of them true at the same time.  Note
  // that the order matches the n, z and p bits in the BR instruction!
public:
  enum _CONDITION_CODES {
    FL_POS  = 0x01,           // last result was positive
    FL_ZRO  = 0x02,           //   "     "     "  zero
    FL_NEG  = 0x04,           //   "     "     "  negative
  };

  // Memory mapped device registers used by the trap routines ...
public:
  enum _DEVICE_REGISTERS {
    KBSR    = 0xFE00,         // keyboard status register
    KBDR    = 0xFE02,         // keyboard data register
    DSR     = 0xFE04,         // display status register
    DDR     = 0xFE06,         // display data register
  };

  // Constructors and destructors...
public:
  CLC3 (CMemory *pMemory);
  virtual ~CLC3() {};

  // CLC3 properties ...
public:
  // Get a constant string for the CPU name, type or options ...
  const char *GetDescription() const override {return "LC-3 microprocessor";}
  const char *GetName() const override {return "LC3";}
  // Get the address of the next instruction to be executed ...
  inline address_t GetPC() const override {return m_PC;}
  inline void SetPC (address_t a) override {m_PC = a;}
  // Get or set the condition codes ...
  inline uint3_t GetCC() const {return m_COND;}
  inline void SetCC (uint3_t bCC)
    {assert((bCC == FL_POS) || (bCC == FL_ZRO) || (bCC == FL_NEG));  m_COND = bCC;}
  // Return the number of instructions executed since the last ClearCPU() ...
  inline uint64_t GetInstructionCount() const {return m_llInstructions;}

  // CLC3 public functions ...
public:
  // Reset the CPU ...
  virtual void ClearCPU() override;
  // Simulate one or more LC-3 instructions ...
  STOP_CODE Run (uint32_t nCount=0) override;
  //   Execute one instruction that has already been fetched.  The PC must
  // already point to the next instruction!
  STOP_CODE Execute (uint16_t wIR);
  // Read or write CPU registers ...
  const REGNAME *GetRegisterNames() const override {return g_aRegisterNames;}
  unsigned GetRegisterSize (cpureg_t nReg) const override
    {return (nReg == REG_COND) ? 3 : 16;}
  uint16_t GetRegister (cpureg_t nReg) const override;
  void SetRegister (cpureg_t nReg, uint16_t nVal) override;

  // LC-3 memory access primitives ...
private:
  inline uint16_t MEMR (address_t a) const {return m_pMemory->CPUread(a);}
  inline void MEMW (address_t a, uint16_t w) {m_pMemory->CPUwrite(a, w);}
  // Update the condition codes based on the value (positive, negative or zero) ...
  inline void UpdateCC (uint16_t wVal)
    {m_COND = (wVal == 0) ? FL_ZRO : ISSET(wVal, 0x8000) ? FL_NEG : FL_POS;}
  // Return a reference to the specified general register ...
  inline uint16_t &REG (uint3_t r) {assert(r < MAXREG);  return m_R[r];}

  // Internal LC-3 CPU operations ...
private:
  // Execute the opcode just fetched ...
  void DoExecute (uint16_t wIR);
  // Trace instruction execution ...
  void TraceInstruction (address_t wPC, uint16_t wIR) const;
  // Operate instructions ...
  void ADD (uint16_t wIR);
  void AND (uint16_t wIR);
  void NOT (uint16_t wIR);
  // Control transfer instructions ...
  void BR (uint16_t wIR);
  void JMP (uint16_t wIR);
  void JSR (uint16_t wIR);
  // Data movement instructions ...
  void LD (uint16_t wIR);
  void LDI (uint16_t wIR);
  void LDR (uint16_t wIR);
  void LEA (uint16_t wIR);
  void ST (uint16_t wIR);
  void STI (uint16_t wIR);
  void STR (uint16_t wIR);
  // Reserved opcodes (RTI and RES) ...
  void Reserved (uint16_t wIR);
  // Traps and the trap service routines ...
  void TRAP (uint16_t wIR);
  void TrapGETC();
  void TrapOUT();
  void TrapPUTS();
  void TrapIN();
  void TrapPUTSP();
  // Console I/O for the trap routines, thru the device registers ...
  bool ReadChar (uint16_t &wChar);
  void WriteChar (uint8_t ch) {MEMW(DDR, ch);}

  // LC-3 internal registers and state ...
private:
  uint16_t  m_R[MAXREG];      // general purpose registers
  address_t m_PC;             // program counter
  uint3_t   m_COND;           // condition codes
  uint64_t  m_llInstructions; // count of instructions executed
};
