#ifndef RDFC_ASSERT_H
#define RDFC_ASSERT_H


// always check asserts, except where project logic dictates otherwise
#ifdef NDEBUG
#undef NDEBUG
#define UNDEF_NDEBUG
#endif
#include <cassert>
#ifdef UNDEF_NDEBUG
#define NDEBUG
#undef UNDEF_NDEBUG
#endif


/*
* These macros check programming contracts only (misuse of the
* library API, broken internal invariants). Malformed input is
* never reported through them: the parsers return a `ParseError`
* for that.
* Each group can be disabled independently.
*/


// #define RDFC_DISABLE_ALL_CHECKS


#ifdef RDFC_DISABLE_ALL_CHECKS
#define RDFC_DISABLE_CHECK_PRECOND
#define RDFC_DISABLE_CHECK_POSTCOND
#define RDFC_DISABLE_CHECK_INVARIANT
#endif


#ifndef RDFC_DISABLE_CHECK_PRECOND
#define RDFC_CHECK_PRECOND(expr) assert(expr)
#define RDFC_CHECKING_PRECONDS
#else
#define RDFC_CHECK_PRECOND(expr) ((void)0)
#endif


#ifndef RDFC_DISABLE_CHECK_POSTCOND
#define RDFC_CHECK_POSTCOND(expr) assert(expr)
#define RDFC_CHECKING_POSTCONDS
#else
#define RDFC_CHECK_POSTCOND(expr) ((void)0)
#endif


#ifndef RDFC_DISABLE_CHECK_INVARIANT
#define RDFC_CHECK_INVARIANT(expr) assert(expr)
#define RDFC_CHECKING_INVARIANTS
#else
#define RDFC_CHECK_INVARIANT(expr) ((void)0)
#endif


#endif  // RDFC_ASSERT_H
