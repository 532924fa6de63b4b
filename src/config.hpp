#pragma once

/*here you can choose the text store backend and engine defaults*/

#define HEDIT_BACKEND_VECTOR 1
#define HEDIT_BACKEND_GAP    2

#ifndef HEDIT_BACKEND
#define HEDIT_BACKEND HEDIT_BACKEND_GAP
#endif

#if HEDIT_BACKEND == HEDIT_BACKEND_VECTOR
#define HEDIT_BACKEND_NAME "vector"
#elif HEDIT_BACKEND == HEDIT_BACKEND_GAP
#define HEDIT_BACKEND_NAME "gap"
#else
#define HEDIT_BACKEND_NAME "unknown"
#endif

/* max undo entries kept before the oldest is evicted */
#ifndef HEDIT_UNDO_DEPTH
#define HEDIT_UNDO_DEPTH 100
#endif

/* lines moved by PageUp/PageDown */
#ifndef HEDIT_PAGE_LINES
#define HEDIT_PAGE_LINES 20
#endif

#define HEDIT_PLATFORM_LINUX   0
#define HEDIT_PLATFORM_WINDOWS 1
#define HEDIT_PLATFORM_MAC     2

/* only the host reads this to seed EditorOptions; core logic never branches on it */
#ifndef HEDIT_HOST_PLATFORM
#if defined(__APPLE__)
#define HEDIT_HOST_PLATFORM HEDIT_PLATFORM_MAC
#elif defined(_WIN32)
#define HEDIT_HOST_PLATFORM HEDIT_PLATFORM_WINDOWS
#else
#define HEDIT_HOST_PLATFORM HEDIT_PLATFORM_LINUX
#endif
#endif

#define HEDIT_WRITE_CHUNK_SIZE (1 << 16)
