#pragma once

/*compile-time defaults, rc file (~/.keyedrc) can override some of them*/

#ifndef KEYED_TAB_STOP
#define KEYED_TAB_STOP 4
#endif

#ifndef KEYED_ESCAPE_TIMEOUT_MS
#define KEYED_ESCAPE_TIMEOUT_MS 10
#endif

#define KEYED_MAX_ESCAPE_LEN 16

#ifndef KEYED_READ_CHUNK_SIZE
#define KEYED_READ_CHUNK_SIZE 1024
#endif

#define KEYED_MESSAGE_TTL_SEC 5

#ifndef KEYED_WRITE_CHUNK_SIZE
#define KEYED_WRITE_CHUNK_SIZE (64 * 1024)
#endif

#define KEYED_DEFAULT_ENCODING "utf-8"
#define KEYED_RC_NAME ".keyedrc"

#ifndef KEYED_VERSION
#define KEYED_VERSION "0.1.0"
#endif
