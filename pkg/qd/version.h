/* FILE: version.h                    -*-Mode: c++-*-
 *
 *	Version macros for the Qd extended precision extension.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#ifndef _QD_VERSION
#define _QD_VERSION

/* End includes */

#define QD_STRINGIFY(x) QD_STRINGIFY_HELPER(x)
#define QD_STRINGIFY_HELPER(x) #x
#define QD_JOIN(x,y) QD_JOIN_HELPER(x,y)
#define QD_JOIN_HELPER(x,y) x ## y

#define QD_MAKE_VERSION(x) QD_STRINGIFY(QD_JOIN(x,_MAJOR_VERSION)) "." \
                           QD_STRINGIFY(QD_JOIN(x,_MINOR_VERSION)) \
                           QD_JOIN(x,_RELEASE_LEVEL) \
                           QD_STRINGIFY(QD_JOIN(x,_RELEASE_SERIAL))

/*
 * NOTE: When version number information is changed here, it must
 * also be changed in CMakeLists.txt.
 */

#define QD_MAJOR_VERSION	1
#define QD_MINOR_VERSION	0
#define QD_RELEASE_LEVEL	"."
#define QD_RELEASE_SERIAL	0

#define QD_VERSION QD_MAKE_VERSION(QD)

#endif /* _QD_VERSION */
