//++
// LC3SIM.cpp - LC-3 Simulator main program
//
// DESCRIPTION:
//   This file is the main program for the LC-3 simulator.  There's no
// command parser here - everything comes from the shell command line -
//
//      lc3sim [-d] [-t] [-l logfile] [-n count] [-c] image.obj [image.obj ...]
//
//      -d          show debugging messages on the console
//      -t          show an instruction trace (implies -d)
//      -l logfile  also log messages to a file
//      -n count    stop after count instructions
//      -c          continue (ignore) illegal opcodes and trap vectors
//
// All the image files are loaded, in order, and then we start the CPU at the
// origin of the first one.  The simulation runs until the program executes a
// HALT, or something goes wrong, or the operator types ^E or ^C.  The exit
// status is zero if the program halted normally and one for anything else.
//
// REVISION HISTORY:
// 19-OCT-26  RLA   New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), strtoul(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <string.h>             // strcmp(), etc ...
#include <signal.h>             // signal(), SIGINT, ...
#include <assert.h>             // assert() (what else??)
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include "EMULIB.hpp"           // emulator library definitions
#include "ConsoleWindow.hpp"    // emulator console window methods
#include "LogFile.hpp"          // emulator library message logging facility
#include "LC3SIM.hpp"           // global declarations for this project
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Memory.hpp"           // main memory emulation
#include "CPU.hpp"              // CCPU base class definitions
#include "LC3.hpp"              // LC-3 CPU emulation
#include "Device.hpp"           // CDevice I/O device emulation objects
#include "Terminal.hpp"         // LC-3 console terminal
using std::string;              // ...
using std::vector;              // ...


// Global objects ....
//   These objects are used (more or less) everywhere within this program, and
// you'll find "extern ..." declarations for them in LC3SIM.hpp.  Note that
// they are declared as pointers rather than the actual objects because we
// want to control the exact order in which they're created and destroyed!
CConsoleWindow  *g_pConsole     = NULL; // console window object
CLog            *g_pLog         = NULL; // message logging object (including console!)
// These globals point to the objects being emulated ...
CLC3            *g_pCPU         = NULL; // LC-3 CPU
CGenericMemory  *g_pMemory      = NULL; // memory emulation
CTerminal       *g_pTerminal    = NULL; // console terminal

// Command line options ...
PRIVATE bool           g_fDebug       = false;  // -d - debug messages
PRIVATE bool           g_fTrace       = false;  // -t - instruction trace
PRIVATE bool           g_fContinue    = false;  // -c - ignore illegal opcodes
PRIVATE uint32_t       g_nCount       = 0;      // -n - instruction count
PRIVATE string         g_sLogFile;              // -l - log file name
PRIVATE vector<string> g_vImages;               // image files to load


PRIVATE void ShowUsage()
{
  //++
  // Print a one line usage summary ...
  //--
  CMDERRS("usage: lc3sim [-d] [-t] [-l logfile] [-n count] [-c] image.obj [image.obj ...]");
}

PRIVATE bool ParseOptions (int argc, char *argv[])
{
  //++
  //   Parse the shell command line and set the option globals.  Anything that
  // doesn't start with a "-" is an image file name.  Returns false (after
  // printing a message) if anything is wrong ...
  //--
  for (int i = 1;  i < argc;  ++i) {
    const char *pszArg = argv[i];
    if (pszArg[0] != '-') {
      g_vImages.push_back(string(pszArg));  continue;
    }
    if (strcmp(pszArg, "-d") == 0) {
      g_fDebug = true;
    } else if (strcmp(pszArg, "-t") == 0) {
      g_fTrace = g_fDebug = true;
    } else if (strcmp(pszArg, "-c") == 0) {
      g_fContinue = true;
    } else if (strcmp(pszArg, "-l") == 0) {
      if (++i >= argc) {
        CMDERRS("log file name required for -l");  return false;
      }
      g_sLogFile = argv[i];
    } else if (strcmp(pszArg, "-n") == 0) {
      char *pszEnd = NULL;
      if (++i < argc) g_nCount = (uint32_t) strtoul(argv[i], &pszEnd, 10);
      if ((i >= argc) || (*pszEnd != '\0') || (g_nCount == 0)) {
        CMDERRS("instruction count required for -n");  return false;
      }
    } else {
      CMDERRS("unknown option \"" << pszArg << "\"");
      ShowUsage();  return false;
    }
  }

  // There has to be at least one image file!
  if (g_vImages.empty()) {
    ShowUsage();  return false;
  }
  return true;
}

PRIVATE void BreakHandler (int nSignal)
{
  //++
  //   Called when the operator types ^C.  We just ask the CPU to stop, and
  // the main program will clean up and exit after Run() returns ...
  //--
  if (g_pCPU != NULL) g_pCPU->Break();
}

PRIVATE bool LoadImages()
{
  //++
  //   Load all the image files, in the order given, and set the PC to the
  // origin of the first one.  If any image can't be loaded, give up.
  //--
  for (size_t i = 0;  i < g_vImages.size();  ++i) {
    address_t wOrigin = 0;
    if (g_pMemory->LoadImage(g_vImages[i], wOrigin) < 0) return false;
    if (i == 0) g_pCPU->SetPC(wOrigin);
  }
  return true;
}


int main (int argc, char *argv[])
{
  //++
  // Here's the main program for the LC-3 simulator.
  //--
  CCPU::STOP_CODE nStop = CCPU::STOP_NONE;

  //   The very first thing is to create and initialize the console window
  // object, and after that we create and initialize the log object.  We
  // can't issue any error messages until we done these two things!
  g_pConsole = DBGNEW CConsoleWindow();
  g_pLog = DBGNEW CLog(PROGRAM, g_pConsole);

  // Parse the command options and set the logging levels ...
  if (!ParseOptions(argc, argv)) goto shutdown;
  if (g_fDebug) g_pLog->SetDefaultConsoleLevel(g_fTrace ? CLog::TRACE : CLog::DEBUG);
  if (!g_sLogFile.empty()) {
    if (!g_pLog->OpenLog(g_sLogFile, g_fTrace ? CLog::TRACE : CLog::DEBUG, false))
      goto shutdown;
  }
  LOGF(DEBUG, "LC-3 Simulator v%d emulator Library v%d", LC3VER, EMUVER);

  // Create the emulated CPU, memory and peripheral devices ...
  g_pMemory = DBGNEW CGenericMemory(MEMSIZE);
  g_pMemory->SetRAM();
  g_pCPU = DBGNEW CLC3(g_pMemory);
  g_pCPU->StopOnIllegalOpcode(!g_fContinue);
  g_pTerminal = DBGNEW CTerminal("TTY", g_pConsole, g_pCPU);
  if (!g_pMemory->InstallDevice(g_pTerminal)) {
    LOGS(ERROR, "unable to install " << g_pTerminal->GetName());  goto shutdown;
  }

  // Load the program(s) and go ...
  if (!LoadImages()) goto shutdown;
  signal(SIGINT, BreakHandler);
  LOGF(DEBUG, "starting at 0x%04X", g_pCPU->GetPC());
  nStop = g_pCPU->Run(g_nCount);
  signal(SIGINT, SIG_DFL);
  g_pConsole->CookedMode();

  // Say why we stopped ...
  LOGF(DEBUG, "%s at 0x%04X after %llu instructions", CCPU::StopCodeToString(nStop),
    g_pCPU->GetLastPC(), (unsigned long long) g_pCPU->GetInstructionCount());
  if ((nStop != CCPU::STOP_HALT) && (nStop != CCPU::STOP_FINISHED))
    LOGF(WARNING, "%s at 0x%04X", CCPU::StopCodeToString(nStop), g_pCPU->GetLastPC());

shutdown:
  // Delete all our global objects.  Once again, the order here is important!
  delete g_pCPU;      // the CPU
  delete g_pMemory;   // the memory object
  delete g_pTerminal; // and the terminal
  delete g_pLog;      // close the log file
  delete g_pConsole;  // lastly (always lastly!) close the console window
  return (nStop == CCPU::STOP_HALT) ? 0 : 1;
}
