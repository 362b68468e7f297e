#ifndef GHBACKUP_VERSION_HPP
#define GHBACKUP_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define GHBACKUP_VERSION_MAJOR 0
#define GHBACKUP_VERSION_MINOR 3
#define GHBACKUP_VERSION_PATCH 0

#define GHBACKUP_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

constexpr const char* GHBACKUP_VERSION = GHBACKUP_VERSION_STR;

#endif /* GHBACKUP_VERSION_HPP */
