/* FILE: qd.h                    -*-Mode: c++-*-
 *
 *	The Qd extended precision extension public header file.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#ifndef _QD
#define _QD

// The generated platform header qdport.h comes first, so a missing
// qdport.h shows up here rather than deep inside an internal header.
// Files inside the package include qdint.h rather than this file.
#include "qdport.h"  // Constructed by build_port
#include "qdint.h"

#endif /* _QD */
