//++
// test_terminal.cpp -> LC-3 console terminal device register tests
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
#include <stdint.h>             // uint8_t, uint16_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <sstream>              // C++ std::ostringstream, et al ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CGenericMemory
#include "CPU.hpp"              // CCPU base class definitions
#include "LC3.hpp"              // LC-3 CPU emulation
#include "Terminal.hpp"         // LC-3 console terminal
#include "FakeConsole.hpp"      // scripted console for testing
using std::string;              // ...
using std::ostringstream;       // ...


class TerminalTest : public ::testing::Test {
protected:
  TerminalTest()
    : m_Memory(CLC3::MAXMEMORY), m_CPU(&m_Memory),
      m_Terminal("TTY", &m_Console, &m_CPU) {}

  CGenericMemory  m_Memory;
  CLC3            m_CPU;
  CFakeConsole    m_Console;
  CTerminal       m_Terminal;
};


TEST_F(TerminalTest, DeviceProperties)
{
  EXPECT_STREQ(m_Terminal.GetName(), "TTY");
  EXPECT_STREQ(m_Terminal.GetType(), "TERMINAL");
  EXPECT_TRUE(m_Terminal.IsInOut());
  EXPECT_EQ(m_Terminal.GetBasePort(), CLC3::KBSR);
  EXPECT_EQ(m_Terminal.GetPortCount(), CLC3::DDR - CLC3::KBSR + 1);
}

TEST_F(TerminalTest, KeyboardStatusWithoutInput)
{
  CFakeConsole Console("", false);
  CTerminal Terminal("TTY2", &Console, &m_CPU);
  EXPECT_EQ(Terminal.DevRead(CLC3::KBSR), 0);
  EXPECT_FALSE(Terminal.IsReady());
  EXPECT_FALSE(Terminal.IsEOF());
}

TEST_F(TerminalTest, KeyboardStatusAndDataWithInput)
{
  m_Console.AddInput("ab");
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBSR), CTerminal::READY);
  // Polling again doesn't lose the first character ...
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBSR), CTerminal::READY);
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBDR), 'a');
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBSR), CTerminal::READY);
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBDR), 'b');
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBSR), 0);
}

TEST_F(TerminalTest, KeyboardDataAtEndOfFile)
{
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBDR), CTerminal::EOF_DATA);
  EXPECT_TRUE(m_Terminal.IsEOF());
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBSR), 0);
}

TEST_F(TerminalTest, KeyboardDataGivesUpWhenTheCpuStops)
{
  CFakeConsole Console("", false);
  CTerminal Terminal("TTY2", &Console, &m_CPU);
  Console.SetBreak();
  EXPECT_EQ(Terminal.DevRead(CLC3::KBDR), CTerminal::EOF_DATA);
  EXPECT_EQ(m_CPU.GetStopCode(), CCPU::STOP_BREAK);
  EXPECT_FALSE(Terminal.IsEOF());
}

TEST_F(TerminalTest, CarriageReturnBecomesLineFeed)
{
  m_Console.AddInput("\r");
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBDR), '\n');
}

TEST_F(TerminalTest, DisplayIsAlwaysReady)
{
  EXPECT_EQ(m_Terminal.DevRead(CLC3::DSR), CTerminal::READY);
  m_Terminal.DevWrite(CLC3::DDR, 'x');
  EXPECT_EQ(m_Terminal.DevRead(CLC3::DSR), CTerminal::READY);
}

TEST_F(TerminalTest, DisplayDataSendsTheLowByte)
{
  m_Terminal.DevWrite(CLC3::DDR, 0x4148);
  m_Terminal.DevWrite(CLC3::DDR, 'i');
  EXPECT_EQ(m_Console.GetOutput(), "Hi");
}

TEST_F(TerminalTest, OtherRegistersReadZeroAndIgnoreWrites)
{
  m_Console.AddInput("z");
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBSR+1), 0);
  m_Terminal.DevWrite(CLC3::KBSR, 0xFFFF);
  m_Terminal.DevWrite(CLC3::KBDR, 'q');
  m_Terminal.DevWrite(CLC3::DSR, 'q');
  EXPECT_EQ(m_Console.GetOutput(), "");
  EXPECT_EQ(m_Terminal.DevRead(CLC3::KBDR), 'z');
}

TEST_F(TerminalTest, ClearDeviceDiscardsTheBufferedKey)
{
  CFakeConsole Console("k", false);
  CTerminal Terminal("TTY2", &Console, &m_CPU);
  EXPECT_EQ(Terminal.DevRead(CLC3::KBSR), CTerminal::READY);
  Terminal.ClearDevice();
  EXPECT_FALSE(Terminal.IsReady());
  EXPECT_EQ(Terminal.DevRead(CLC3::KBSR), 0);
}

TEST_F(TerminalTest, MappedIntoMemory)
{
  m_Memory.SetRAM();
  ASSERT_TRUE(m_Memory.InstallDevice(&m_Terminal));
  EXPECT_TRUE(m_Memory.IsIO(CLC3::KBSR));
  EXPECT_TRUE(m_Memory.IsIO(CLC3::DDR));
  EXPECT_FALSE(m_Memory.IsIO(CLC3::DDR+1));
  EXPECT_EQ(m_Memory.FindDevice(CLC3::DSR), &m_Terminal);
  m_Memory.CPUwrite(CLC3::DDR, '!');
  EXPECT_EQ(m_Console.GetOutput(), "!");
  EXPECT_EQ(m_Memory.CPUread(CLC3::DSR), CTerminal::READY);
  ASSERT_TRUE(m_Memory.RemoveDevice(&m_Terminal));
  EXPECT_FALSE(m_Memory.IsIO(CLC3::KBSR));
  EXPECT_TRUE(m_Memory.IsRAM(CLC3::KBSR));
}

TEST_F(TerminalTest, ShowDeviceMentionsTheRegisters)
{
  ostringstream ofs;
  m_Terminal.ShowDevice(ofs);
  EXPECT_NE(ofs.str().find("DSR=8000"), string::npos);
}
