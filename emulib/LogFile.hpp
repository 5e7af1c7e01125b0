//++
// LogFile.hpp -> CLog (emulator library log file) class
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
//   CLog sends messages to the console, to a log file, or both, depending
// on their severity.  Code never calls it directly.  It uses LOGF() (printf
// style) or LOGS() (stream style) instead, and both of those do nothing at
// all when no CLog object exists.  That's how the unit tests run the CPU
// without any logging.
//
// REVISION HISTORY:
// 20-May-15  RLA   New file.
//  6-FEB-24  RLA   Create single threaded version.
// 19-OCT-26  RLA   Single threaded ONLY.  Remove operator and script logging.
//--
#pragma once
#include <stdio.h>              // FILE, fopen(), fprintf(), etc ...
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <sys/time.h>           // struct timeval, gettimeofday(), ...
#include <string>               // C++ std::string class, et al ...
#include <iostream>             // C++ style output for LOGS() ...
#include <sstream>              // C++ std::stringstream, et al ...
using std::string;              // ...
using std::ostringstream;       // ...
class CConsoleWindow;           // ...


class CLog {
  //++
  // Emulator library message logging class ...
  //--

public:
  //   A message is logged when its severity is at least the current level, so
  // the order matters.  CMDERR is for the operator and is always shown, and
  // a level of NOLOG turns logging off.
  enum _SEVERITIES {
    TRACE   = 1,              // one line per instruction executed
    DEBUG   = 2,              // loader and run summaries
    WARNING = 3,              // odd but survivable (the console default)
    ERROR   = 4,              // something failed
    CMDERR  = 5,              // command line errors
    NOLOG   = 6,              // nothing is this severe
  };
  typedef enum _SEVERITIES SEVERITY;
  enum {MAXMSG = 1024};       // longest single message
  typedef struct timeval TIMESTAMP;

public:
  CLog (const char *pszProgram, CConsoleWindow *pConsole=NULL);
  virtual ~CLog();
private:
  // Disallow copy and assignments!
  CLog (const CLog&) = delete;
  CLog& operator= (CLog const &) = delete;

public:
  static CLog *GetLog() {return m_pLog;}
  void SetDefaultConsoleLevel (SEVERITY nLevel) {m_lvlConsole = nLevel;}
  SEVERITY GetDefaultConsoleLevel() const {return m_lvlConsole;}
  SEVERITY GetDefaultFileLevel() const {return m_lvlFile;}
  bool IsLoggedToConsole (SEVERITY nLevel) const {return nLevel >= m_lvlConsole;}
  bool IsLoggedToFile (SEVERITY nLevel) const
    {return IsLogFileOpen() && (nLevel >= m_lvlFile);}
  bool IsLogged (SEVERITY nLevel) const
    {return IsLoggedToConsole(nLevel) || IsLoggedToFile(nLevel);}

  // Log file ...
public:
  bool IsLogFileOpen() const {return m_pLogFile != NULL;}
  string GetLogFileName() const {return m_sLogName;}
  //   Open the log (with a default ".log" extension) and log messages of
  // nLevel and up to it.  Any existing file is overwritten unless fAppend ...
  bool OpenLog (const string &sFileName, SEVERITY nLevel=DEBUG, bool fAppend=true);
  void CloseLog();

  // Used by LOGS() and LOGF() ...
public:
  void Print (SEVERITY nLevel, ostringstream &osText);
  void Print (SEVERITY nLevel, const char *pszFormat, ...);
  static string LevelToString (SEVERITY nLevel);
  static string TimeStampToString (const TIMESTAMP *ptb);

private:
  void Send (SEVERITY nLevel, const char *pszText);
  void SendLog (SEVERITY nLevel, const char *pszText);
  void SendConsole (SEVERITY nLevel, const char *pszText);

private:
  string          m_sProgram;     // prefix for console messages
  CConsoleWindow *m_pConsole;     // console for messages (NULL for stderr)
  FILE           *m_pLogFile;     // the log file, if one is open
  string          m_sLogName;     // and its name
  SEVERITY        m_lvlConsole;   // console message level
  SEVERITY        m_lvlFile;      // log file message level
  static CLog    *m_pLog;         // the one and only CLog instance
};


//++
//   The standard way to log something -
//
//      LOGF(WARNING, "illegal opcode 0x%04X at 0x%04X", wIR, wPC);
//      LOGS(DEBUG, "loaded " << nWords << " words from " << sFileName);
//
// The message isn't even formatted unless somebody is going to see it.
//--
#define ISLOGGED(l)   ((CLog::GetLog() != NULL) && CLog::GetLog()->IsLogged(CLog::l))
#define LOGS(l,m)     do {                                            \
                        if (ISLOGGED(l)) {                            \
                          ostringstream osLog;  osLog << m;           \
                          CLog::GetLog()->Print(CLog::l, osLog);      \
                        }                                             \
                      } while (0)
#define LOGF(l,...)   do {                                            \
                        if (ISLOGGED(l))                              \
                          CLog::GetLog()->Print(CLog::l, __VA_ARGS__);\
                      } while (0)
#define CMDERRS(m)    LOGS(CMDERR, m)
