//++
// FakeConsole.hpp -> scripted CVirtualConsole for the unit tests
//
// DESCRIPTION:
//   CFakeConsole returns keystrokes from a fixed string and collects all
// output in another string.  When the input runs out it either reports end
// of file or, if fEOF is false, times out forever.  A console break can be
// queued with SetBreak().
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include "VirtualConsole.hpp"   // CVirtualConsole abstract class
using std::string;              // ...


class CFakeConsole : public CVirtualConsole {
public:
  CFakeConsole (const string &sInput="", bool fEOF=true)
    : m_sInput(sInput), m_fEOF(fEOF), m_fBreak(false) {}
  virtual ~CFakeConsole() {};

public:
  virtual int32_t RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout=0) override
  {
    if (m_sInput.empty()) return m_fEOF ? -1 : 0;
    size_t cb = (cbBuffer < m_sInput.size()) ? cbBuffer : m_sInput.size();
    for (size_t i = 0;  i < cb;  ++i) pabBuffer[i] = (uint8_t) m_sInput[i];
    m_sInput.erase(0, cb);
    return (int32_t) cb;
  }
  virtual void RawWrite (const char *pabBuffer, size_t cbBuffer) override
    {m_sOutput.append(pabBuffer, cbBuffer);}
  virtual bool IsConsoleBreak (uint32_t lTimeout=0) override
    {bool f = m_fBreak;  m_fBreak = false;  return f;}

public:
  void SetBreak() {m_fBreak = true;}
  void AddInput (const string &s) {m_sInput += s;}
  const string &GetOutput() const {return m_sOutput;}
  void ClearOutput() {m_sOutput.clear();}

private:
  string  m_sInput;             // characters still to be "typed"
  string  m_sOutput;            // everything written so far
  bool    m_fEOF;               // report EOF when the input runs out
  bool    m_fBreak;             // TRUE if a console break is pending
};
