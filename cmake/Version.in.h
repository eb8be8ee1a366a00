/* SPDX-License-Identifier: LGPL-3.0-only */
#ifndef REMUX_VERSION_H
#define REMUX_VERSION_H

/* The main version number components. */
#define REMUX_VERSION_MAJOR "${VERSION_MAJOR}"
#define REMUX_VERSION_MINOR "${VERSION_MINOR}"
#define REMUX_VERSION_PATCH "${VERSION_PATCH}"

/* The "tweak" version number is a sub-release indicator.
 * This is usually a direct build number.
 */
#define REMUX_VERSION_TWEAK "${VERSION_TWEAK}"

/* Whether the versioning system uncovered additional detail. */
#cmakedefine REMUX_VERSION_HAS_EXTRAS

#ifdef REMUX_VERSION_HAS_EXTRAS

/* The amount of commits since the tagged version. */
#define REMUX_VERSION_OFFSET "${VERSION_OFFSET}"

/* The hash of the current commit. */
#define REMUX_VERSION_COMMIT "${VERSION_COMMIT}"

/* Whether there were local, uncommitted changes during build. */
#define REMUX_VERSION_DIRTY "${VERSION_DIRTY}"

#endif /* REMUX_VERSION_HAS_EXTRAS */

#endif /* REMUX_VERSION_H */
