#pragma once

/*here you can change the compile-time defaults of tally*/

#ifndef TALLY_VERSION
#define TALLY_VERSION "0.1.0"
#endif

#define TALLY_NAME "tally"
#define TALLY_ABOUT "Tally counter with file-backed storage"

/* rc file looked up in $HOME */
#define TALLY_RC_FILE ".tallyrc"

/* 1: fdatasync after every write unless --no-sync / set sync off */
#ifndef TALLY_DEFAULT_SYNC
#define TALLY_DEFAULT_SYNC 1
#endif

/* minimum severity written once a log file is configured */
#ifndef TALLY_DEFAULT_LOG_LEVEL
#define TALLY_DEFAULT_LOG_LEVEL severity_level::info
#endif

/* how long a lone ESC waits for the rest of an escape sequence */
#define TALLY_ESCAPE_DELAY_MS 25

#define TALLY_READ_CHUNK_SIZE 64
/* a longer first line is never a count; reading stops there */
#define TALLY_MAX_COUNT_LINE 4096
