#ifndef LIBCHUNKSTORE_COMMONDEFS_H_
#define LIBCHUNKSTORE_COMMONDEFS_H_

#if defined(__GNUC__)
#define CHUNKSTORE_API_EXPORT __attribute__((visibility("default")))
#define CHUNKSTORE_API_IMPORT
#else  // Unsupported compiler
#define CHUNKSTORE_API_EXPORT
#define CHUNKSTORE_API_IMPORT
#endif  // defined(__GNUC__)

#ifdef CHUNKSTORE_BUILD_SHARED_LIB
#define CHUNKSTORE_API CHUNKSTORE_API_EXPORT
#else
#define CHUNKSTORE_API CHUNKSTORE_API_IMPORT
#endif  // CHUNKSTORE_BUILD_SHARED_LIB

#endif  // LIBCHUNKSTORE_COMMONDEFS_H_
