//++
// LogFile.cpp -> CLog (emulator library log file) methods
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
//   This is the single threaded implementation of CLog.  Every line that
// goes to the log file gets a time stamp and the severity, and a message
// containing newlines is split so that each line gets its own prefix.
// Console messages are shorter - TRACE and DEBUG are marked so they stand
// out from the LC-3 program's own output, and everything else is prefixed
// with the program name.
//
//   There's only ever one CLog.  The constructor asserts that, and anybody
// can find it with CLog::GetLog().
//
// REVISION HISTORY:
// 20-May-15  RLA   New file.
// 11-JUN-15  RLA   Add CConsoleWindow support.
//  2-JUN-17  RLA   Linux port.
//  6-FEB-24  RLA   Create single threaded version.
// 19-OCT-26  RLA   Remove the threaded version and the WIN32 code.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdio.h>              // fopen(), fprintf(), snprintf(), ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <assert.h>             // assert() (what else??)
#include <errno.h>              // errno (what else?) ...
#include <string.h>             // strchr(), strerror(), etc ...
#include <time.h>               // localtime_r(), ...
#include <sys/time.h>           // gettimeofday() ...
#include "EMULIB.hpp"           // emulator library definitions
#include "VirtualConsole.hpp"   // CVirtualConsole abstract class
#include "ConsoleWindow.hpp"    // console window methods
#include "LogFile.hpp"          // declarations for this module

CLog *CLog::m_pLog = NULL;


CLog::CLog (const char *pszProgram, CConsoleWindow *pConsole)
  : m_sProgram(pszProgram), m_pConsole(pConsole)
{
  //++
  //   Warnings and worse go to the console, and there's no log file until
  // somebody calls OpenLog() ...
  //--
  assert(m_pLog == NULL);
  m_pLog = this;
  m_pLogFile = NULL;  m_lvlFile = NOLOG;  m_lvlConsole = WARNING;
}

CLog::~CLog()
{
  CloseLog();
  assert(m_pLog == this);
  m_pLog = NULL;
}

/*static*/ string CLog::LevelToString (SEVERITY nLevel)
{
  switch (nLevel) {
    case TRACE:   return string("TRACE");
    case DEBUG:   return string("DEBUG");
    case WARNING: return string("WARN");
    case ERROR:   return string("ERROR");
    case CMDERR:  return string("CMDERR");
    default:      return string("UNKNOWN");
  }
}

/*static*/ string CLog::TimeStampToString (const TIMESTAMP *ptb)
{
  //++
  // Local time as "HH:MM:SS.ddd".  No date ...
  //--
  struct tm tmNow;  char szNow[32];  time_t tSeconds = ptb->tv_sec;
  localtime_r(&tSeconds, &tmNow);
  snprintf(szNow, sizeof(szNow), "%02d:%02d:%02d.%03ld",
    tmNow.tm_hour, tmNow.tm_min, tmNow.tm_sec, (long) (ptb->tv_usec / 1000));
  return string(szNow);
}

bool CLog::OpenLog (const string &sFileName, SEVERITY nLevel, bool fAppend)
{
  assert(!sFileName.empty());
  CloseLog();
  m_sLogName = SetDefaultExtension(sFileName, ".log");
  m_pLogFile = fopen(m_sLogName.c_str(), fAppend ? "a" : "w");
  if (m_pLogFile == NULL) {
    CMDERRS("unable to open log " << m_sLogName << " - " << strerror(errno));
    m_sLogName.clear();  return false;
  }
  m_lvlFile = nLevel;
  LOGS(DEBUG, "log " << m_sLogName << " opened");
  return true;
}

void CLog::CloseLog()
{
  if (!IsLogFileOpen()) return;
  LOGS(DEBUG, "log " << m_sLogName << " closed");
  fclose(m_pLogFile);
  m_pLogFile = NULL;  m_sLogName.clear();  m_lvlFile = NOLOG;
}

void CLog::Print (SEVERITY nLevel, ostringstream &osText)
{
  Send(nLevel, osText.str().c_str());
}

void CLog::Print (SEVERITY nLevel, const char *pszFormat, ...)
{
  char szBuffer[MAXMSG];  va_list args;
  va_start(args, pszFormat);
  vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  va_end(args);
  Send(nLevel, szBuffer);
}

void CLog::Send (SEVERITY nLevel, const char *pszText)
{
  if (IsLoggedToFile(nLevel)) SendLog(nLevel, pszText);
  if (IsLoggedToConsole(nLevel)) SendConsole(nLevel, pszText);
}

void CLog::SendLog (SEVERITY nLevel, const char *pszText)
{
  //++
  //   Write the message to the log file one line at a time, and give every
  // line the same time stamp ...
  //--
  TIMESTAMP tbNow;  gettimeofday(&tbNow, NULL);
  string sPrefix = TimeStampToString(&tbNow) + " " + LevelToString(nLevel);
  const char *pszEnd;
  while ((pszEnd = strchr(pszText, '\n')) != NULL) {
    fprintf(m_pLogFile, "%s\t%.*s\n", sPrefix.c_str(), (int) (pszEnd-pszText), pszText);
    pszText = pszEnd+1;
  }
  fprintf(m_pLogFile, "%s\t%s\n", sPrefix.c_str(), pszText);
  fflush(m_pLogFile);
}

void CLog::SendConsole (SEVERITY nLevel, const char *pszText)
{
  char szBuffer[MAXMSG+64];
  switch (nLevel) {
    case TRACE:  snprintf(szBuffer, sizeof(szBuffer), "-- %s\n", pszText);                        break;
    case DEBUG:  snprintf(szBuffer, sizeof(szBuffer), "[%s]\n", pszText);                         break;
    default:     snprintf(szBuffer, sizeof(szBuffer), "%s: %s\n", m_sProgram.c_str(), pszText); break;
  }
  if (m_pConsole != NULL)
    m_pConsole->Write(szBuffer);
  else
    fputs(szBuffer, stderr);
}
