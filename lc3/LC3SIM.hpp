//++
// LC3SIM.hpp -> Global Declarations for the LC-3 Simulator project
//
// DESCRIPTION:
//   This file contains global constants, universal macros, and a very few
// global objects ...
//
// REVISION HISTORY:
// 19-OCT-26  RLA   Stolen from the SC/MP project.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...

// Program name and version ...
#define PROGRAM        "LC3SIM" // used in prompts and error messages
#define LC3VER              1   // version number of this release

// LC-3 memory configuration ...
#define MEMSIZE    65536UL      // total memory space size, in words

// Console and log file objects.
extern class CConsoleWindow  *g_pConsole;     // console window object
extern class CLog            *g_pLog;         // message logging object

//   These pointers reference the major parts of the LC-3 system being
// emulated - CPU, memory and the console terminal.  They're all declared in
// the LC3SIM cpp file.
extern class CLC3            *g_pCPU;         // LC-3 CPU
extern class CGenericMemory  *g_pMemory;      // memory emulation
extern class CTerminal       *g_pTerminal;    // console terminal
