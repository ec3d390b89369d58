#ifndef HAZELNUT_VERSION_HPP
#define HAZELNUT_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define HAZELNUT_VERSION_MAJOR 0
#define HAZELNUT_VERSION_MINOR 3
#define HAZELNUT_VERSION_PATCH 0

/*
 * Published crate version. The build may override it with
 * -DHAZELNUT_VERSION_STR="x.y.z".
 */
#ifndef HAZELNUT_VERSION_STR
#define HAZELNUT_VERSION_STR "0.3.0"
#endif
/* ------------------------------------------------------------------ */

constexpr const char* HAZELNUT_VERSION = HAZELNUT_VERSION_STR;

#endif /* HAZELNUT_VERSION_HPP */
