#ifndef STALEBRANCH_VERSION_HPP
#define STALEBRANCH_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define STALEBRANCH_VERSION_MAJOR 0
#define STALEBRANCH_VERSION_MINOR 3
#define STALEBRANCH_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow.
 * Example format: "2025.07.31-1".
 */
#define STALEBRANCH_VERSION_STR "0.3.0"
#define STALEBRANCH_VERSION_RC                                                                     \
    STALEBRANCH_VERSION_MAJOR, STALEBRANCH_VERSION_MINOR, STALEBRANCH_VERSION_PATCH, 0
/* ------------------------------------------------------------------ */

#ifndef RC_INVOKED
constexpr const char* STALEBRANCH_VERSION = STALEBRANCH_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* STALEBRANCH_VERSION_HPP */
