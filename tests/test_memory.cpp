//++
// test_memory.cpp -> memory flags and LC-3 object file loader tests
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
#include <stdio.h>              // fopen(), fwrite(), remove(), etc ...
#include <stdint.h>             // uint8_t, uint16_t, etc ...
#include <unistd.h>             // getpid() ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <gtest/gtest.h>        // GoogleTest framework
#include "EMULIB.hpp"           // emulator library definitions
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // CGenericMemory
using std::string;              // ...
using std::vector;              // ...


class MemoryTest : public ::testing::Test {
protected:
  MemoryTest() : m_Memory(65536UL)
  {
    m_Memory.SetRAM();
    m_sFileName = FormatString("%slc3test_%d.obj", ::testing::TempDir().c_str(), (int) getpid());
  }
  virtual ~MemoryTest() {remove(m_sFileName.c_str());}

  // Write a file containing exactly these bytes ...
  void WriteBytes (const vector<uint8_t> &vbData)
  {
    FILE *pFile = fopen(m_sFileName.c_str(), "wb");
    ASSERT_TRUE(pFile != NULL);
    if (!vbData.empty()) fwrite(&vbData[0], 1, vbData.size(), pFile);
    fclose(pFile);
  }

  // Write an object file with this origin and these words, big endian ...
  void WriteWords (uint16_t wOrigin, const vector<uint16_t> &vwData)
  {
    vector<uint8_t> vb;
    vb.push_back(HIBYTE(wOrigin));  vb.push_back(LOBYTE(wOrigin));
    for (size_t i = 0;  i < vwData.size();  ++i) {
      vb.push_back(HIBYTE(vwData[i]));  vb.push_back(LOBYTE(vwData[i]));
    }
    WriteBytes(vb);
  }

  CGenericMemory  m_Memory;
  string          m_sFileName;
};


TEST_F(MemoryTest, LoadsAtTheOrigin)
{
  vector<uint16_t> vw;
  vw.push_back(0x1234);  vw.push_back(0xABCD);  vw.push_back(0xF025);
  WriteWords(0x3000, vw);
  address_t wOrigin = 0;
  EXPECT_EQ(m_Memory.LoadImage(m_sFileName, wOrigin), 3);
  EXPECT_EQ(wOrigin, 0x3000);
  EXPECT_EQ(m_Memory.UIread(0x3000), 0x1234);
  EXPECT_EQ(m_Memory.UIread(0x3001), 0xABCD);
  EXPECT_EQ(m_Memory.UIread(0x3002), 0xF025);
  EXPECT_EQ(m_Memory.UIread(0x3003), 0);
  EXPECT_EQ(m_Memory.UIread(0x2FFF), 0);
}

TEST_F(MemoryTest, OddTrailingByteIsIgnored)
{
  vector<uint8_t> vb;
  vb.push_back(0x40);  vb.push_back(0x00);
  vb.push_back(0x12);  vb.push_back(0x34);
  vb.push_back(0x56);
  WriteBytes(vb);
  address_t wOrigin = 0;
  EXPECT_EQ(m_Memory.LoadImage(m_sFileName, wOrigin), 1);
  EXPECT_EQ(wOrigin, 0x4000);
  EXPECT_EQ(m_Memory.UIread(0x4000), 0x1234);
  EXPECT_EQ(m_Memory.UIread(0x4001), 0);
}

TEST_F(MemoryTest, TruncatedAtTheTopOfMemory)
{
  vector<uint16_t> vw;
  vw.push_back(0x1111);  vw.push_back(0x2222);  vw.push_back(0x3333);
  WriteWords(0xFFFE, vw);
  address_t wOrigin = 0;
  EXPECT_EQ(m_Memory.LoadImage(m_sFileName, wOrigin), 2);
  EXPECT_EQ(m_Memory.UIread(0xFFFE), 0x1111);
  EXPECT_EQ(m_Memory.UIread(0xFFFF), 0x2222);
  EXPECT_EQ(m_Memory.UIread(0x0000), 0);
}

TEST_F(MemoryTest, EmptyOrOriginOnlyFilesAreErrors)
{
  address_t wOrigin = 0;
  WriteBytes(vector<uint8_t>());
  EXPECT_EQ(m_Memory.LoadImage(m_sFileName, wOrigin), -1);
  WriteBytes(vector<uint8_t>(1, 0x30));
  EXPECT_EQ(m_Memory.LoadImage(m_sFileName, wOrigin), -1);
  WriteWords(0x3000, vector<uint16_t>());
  EXPECT_EQ(m_Memory.LoadImage(m_sFileName, wOrigin), -1);
}

TEST_F(MemoryTest, MissingFileIsAnError)
{
  address_t wOrigin = 0;
  EXPECT_EQ(m_Memory.LoadImage(m_sFileName + ".missing", wOrigin), -1);
}

TEST_F(MemoryTest, RamAndNonexistentMemory)
{
  EXPECT_TRUE(m_Memory.IsRAM(0x1234));
  m_Memory.CPUwrite(0x1234, 0x5678);
  EXPECT_EQ(m_Memory.CPUread(0x1234), 0x5678);
  m_Memory.SetNXM(0x2000, 0x2FFF);
  EXPECT_FALSE(m_Memory.IsRAM(0x2000));
  m_Memory.CPUwrite(0x2000, 0x5678);
  EXPECT_EQ(m_Memory.UIread(0x2000), 0);
  EXPECT_EQ(m_Memory.CPUread(0x2000), WORD_MAX);
}

TEST_F(MemoryTest, Breakpoints)
{
  EXPECT_FALSE(m_Memory.IsBreak(0x3000));
  m_Memory.SetBreak(0x3000);
  EXPECT_TRUE(m_Memory.IsBreak(0x3000));
  EXPECT_TRUE(m_Memory.IsRAM(0x3000));
  m_Memory.SetBreak(0x3000, false);
  EXPECT_FALSE(m_Memory.IsBreak(0x3000));
  m_Memory.SetBreak(0x3001);  m_Memory.SetBreak(0x3002);
  m_Memory.ClearAllBreaks();
  EXPECT_FALSE(m_Memory.IsBreak(0x3001));
  EXPECT_FALSE(m_Memory.IsBreak(0x3002));
}
