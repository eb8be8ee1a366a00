/* SPDX-License-Identifier: LGPL-3.0-only */
#ifndef REMUX_CONFIG_H
#define REMUX_CONFIG_H

/* If set, the built binaries will be composed of several shared libraries
 * (.so) for reusability in other projects.
 */
#cmakedefine REMUX_BUILD_SHARED_LIBS

/* If set, the built binary will contain some additional log outputs that are
 * needed for verbose debugging of the project.
 *
 * Turn off to cut down further on the binary size for production.
 */
#cmakedefine REMUX_NON_ESSENTIAL_LOGS

/* The system platform (string) that the current build is being done on. */
#define REMUX_PLATFORM "${REMUX_PLATFORM}"

/* Constants for the supported platforms. Exactly one of them is used as the
 * value of REMUX_PLATFORM_ID, e.g.
 *     #if REMUX_PLATFORM_ID == REMUX_PLATFORM_ID_Unix
 */
/* NOLINTBEGIN(modernize-macro-to-enum) */
#define REMUX_PLATFORM_ID_Unsupported 0
#define REMUX_PLATFORM_ID_Unix 1
/* NOLINTEND(modernize-macro-to-enum) */

/* clang-format off */
#define REMUX_PLATFORM_ID REMUX_PLATFORM_ID_${REMUX_PLATFORM}
/* clang-format on */

/* If set, the PLATFORM is "Unix". Shorthand for the == check on the ID. */
#cmakedefine REMUX_PLATFORM_UNIX

/* The build type for the current build. */
#define REMUX_BUILD_TYPE "${CMAKE_BUILD_TYPE}"

#endif /* REMUX_CONFIG_H */
