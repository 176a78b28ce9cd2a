/* FILE: qdint.h                    -*-Mode: c++-*-
 *
 *	The Qd extended precision extension internal header file.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#ifndef _QDINT
#define _QDINT

#include <tcl.h>

#include "version.h"
#include "qdcommon.h"
#include "qdexcept.h"
#include "qdmessages.h"
#include "doubledouble.h"
#include "quaddouble.h"
#include "qdformat.h"

/* End includes */

/* Functions to be passed to the Tcl/Tk libraries */
Tcl_PackageInitProc	Qd_Init;

/* Tcl command registration; returns TCL_OK or TCL_ERROR */
int Qd_RegisterCommand(Tcl_Interp* interp,const char* name,
                       Tcl_CmdProc* cmd);

#endif /* _QDINT */
