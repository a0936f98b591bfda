#pragma once

/*compile-time knobs, override with -D at build time*/

#define KILN_VERSION "0.3.1"

#ifndef KILN_TAB_STOP
#define KILN_TAB_STOP 8
#endif

/*extra Ctrl-Q presses needed to quit a modified buffer*/
#ifndef KILN_QUIT_TIMES
#define KILN_QUIT_TIMES 1
#endif

#ifndef KILN_MESSAGE_TIMEOUT_SEC
#define KILN_MESSAGE_TIMEOUT_SEC 5
#endif

/*how long to wait for the tail of an escape sequence after a lone ESC*/
#ifndef KILN_ESC_DELAY_MS
#define KILN_ESC_DELAY_MS 25
#endif

#ifndef KILN_WRITE_CHUNK_SIZE
#define KILN_WRITE_CHUNK_SIZE (64 * 1024)
#endif
