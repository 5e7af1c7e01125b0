//++
// test_log.cpp -> message logging and instruction trace tests
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
#include <stdio.h>              // fopen(), fgets(), remove(), etc ...
#include <stdint.h>             // uint8_t, uint16_t, etc ...
#include <unistd.h>             // getpid() ...
#include <string>               // C++ std::string class, et al ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CGenericMemory
#include "CPU.hpp"              // CCPU base class definitions
#include "LC3.hpp"              // LC-3 CPU emulation
using std::string;              // ...


class LogTest : public ::testing::Test {
protected:
  LogTest() : m_Log("LC3TEST")
  {
    m_Log.SetDefaultConsoleLevel(CLog::NOLOG);
    m_sFileName = FormatString("%slc3test_%d.log", ::testing::TempDir().c_str(), (int) getpid());
  }
  virtual ~LogTest() {remove(m_sFileName.c_str());}

  // Return the entire contents of the log file ...
  string ReadLog() const
  {
    string sText;  char szLine[256];
    FILE *pFile = fopen(m_sFileName.c_str(), "r");
    if (pFile == NULL) return sText;
    while (fgets(szLine, sizeof(szLine), pFile) != NULL) sText += szLine;
    fclose(pFile);
    return sText;
  }

  CLog    m_Log;
  string  m_sFileName;
};


TEST_F(LogTest, OnlyOneInstance)
{
  EXPECT_EQ(CLog::GetLog(), &m_Log);
}

TEST_F(LogTest, LevelsControlWhatIsLogged)
{
  EXPECT_FALSE(ISLOGGED(WARNING));
  m_Log.SetDefaultConsoleLevel(CLog::WARNING);
  EXPECT_TRUE(ISLOGGED(WARNING));
  EXPECT_TRUE(ISLOGGED(ERROR));
  EXPECT_FALSE(ISLOGGED(DEBUG));
  m_Log.SetDefaultConsoleLevel(CLog::NOLOG);
  ASSERT_TRUE(m_Log.OpenLog(m_sFileName, CLog::DEBUG, false));
  EXPECT_TRUE(ISLOGGED(DEBUG));
  EXPECT_FALSE(ISLOGGED(TRACE));
  m_Log.CloseLog();
  EXPECT_FALSE(ISLOGGED(DEBUG));
}

TEST_F(LogTest, MessagesGoToTheLogFile)
{
  ASSERT_TRUE(m_Log.OpenLog(m_sFileName, CLog::DEBUG, false));
  LOGF(WARNING, "illegal opcode 0x%04X at 0x%04X", 0xD000, 0x3000);
  LOGS(DEBUG, "loaded " << 3 << " words");
  LOGF(TRACE, "this is not logged");
  m_Log.CloseLog();
  string sText = ReadLog();
  EXPECT_NE(sText.find("illegal opcode 0xD000 at 0x3000"), string::npos);
  EXPECT_NE(sText.find("loaded 3 words"), string::npos);
  EXPECT_EQ(sText.find("this is not logged"), string::npos);
}

TEST_F(LogTest, MultiLineMessagesAreSplit)
{
  ASSERT_TRUE(m_Log.OpenLog(m_sFileName, CLog::DEBUG, false));
  LOGS(WARNING, "first line\nsecond line");
  m_Log.CloseLog();
  string sText = ReadLog();
  size_t nFirst = sText.find("first line\n");
  ASSERT_NE(nFirst, string::npos);
  EXPECT_NE(sText.find("second line", nFirst), string::npos);
}

TEST_F(LogTest, TraceShowsDisassembledInstructions)
{
  CGenericMemory Memory(CLC3::MAXMEMORY);  Memory.SetRAM();
  CLC3 CPU(&Memory);
  Memory.UIwrite(0x3000, 0x1025);  Memory.UIwrite(0x3001, 0xF025);
  ASSERT_TRUE(m_Log.OpenLog(m_sFileName, CLog::TRACE, false));
  EXPECT_EQ(CPU.Run(), CCPU::STOP_HALT);
  m_Log.CloseLog();
  string sText = ReadLog();
  EXPECT_NE(sText.find("3000/ 1025\tADD R0,R0,#5"), string::npos);
  EXPECT_NE(sText.find("3001/ F025\tHALT"), string::npos);
}
