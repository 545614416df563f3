#pragma once

/*compile-time defaults; run-time overrides live in ~/.wrapviewrc*/

#ifndef WV_INTERRUPT_BYTE
#define WV_INTERRUPT_BYTE 0x03
#endif

#ifndef WV_ESC_BYTE
#define WV_ESC_BYTE 0x1b
#endif

// upper bound for the ESC[<row>;<col>R reply, stray prefix bytes included
#ifndef WV_CURSOR_REPORT_MAX
#define WV_CURSOR_REPORT_MAX 32
#endif

#ifndef WV_DEFAULT_FILLER
#define WV_DEFAULT_FILLER '~'
#endif

#ifndef WV_WRITE_BUF_RESERVE
#define WV_WRITE_BUF_RESERVE 16384
#endif

#define WV_RC_NAME ".wrapviewrc"
#define WV_LOG_ENV "WRAPVIEW_LOG"
