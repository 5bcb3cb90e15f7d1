#pragma once

// ── Assistant CLI ───────────────────────────────────────────
// Defaults for the package-runner wrapper; both can be overridden in config.yaml.
constexpr const char* DEFAULT_RUNNER  = "npx";
constexpr const char* DEFAULT_PACKAGE = "@openai/codex";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_RUN_TIMEOUT_MS     = 600000;  // 10 min wall clock / PTY ceiling
constexpr int DEFAULT_IDLE_TIMEOUT_MS    = 30000;   // Unchanged output => reply complete
constexpr int DEFAULT_POLL_INTERVAL_MS   = 1000;    // Output buffer poll granularity
constexpr int KILL_GRACE_MS              = 5000;    // SIGTERM -> SIGKILL window
constexpr int PTY_SPAWN_GRACE_MS         = 2000;    // Exit inside this window = crash
constexpr int PTY_STARTUP_WAIT_MS        = 8000;    // Let the TUI settle before typing
constexpr int PTY_SUBMIT_SETTLE_MS       = 1000;    // After CR, before collecting
constexpr int PTY_KEY_DELAY_MS           = 50;      // Between control keystrokes
constexpr int PTY_CHAR_DELAY_MS          = 10;      // Between prompt characters
constexpr int PTY_KILL_WAIT_MS           = 500;     // Ctrl-C -> terminate
constexpr int VERSION_PROBE_TIMEOUT_MS   = 30000;

// ── PTY viewport ────────────────────────────────────────────
constexpr int PTY_COLS = 120;
constexpr int PTY_ROWS = 30;
constexpr const char* PTY_TERM = "xterm-256color";

// ── Keystrokes ──────────────────────────────────────────────
constexpr char KEY_ESC    = '\x1b';   // cancel edit
constexpr char KEY_CTRL_U = '\x15';   // clear line
constexpr char KEY_CTRL_C = '\x03';   // interrupt
constexpr char KEY_CR     = '\r';     // submit

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE = 4096;
constexpr int PTY_READ_BUF_SIZE  = 16384;

// ── Preflight ───────────────────────────────────────────────
constexpr const char* MIN_NODE_VERSION   = "22.0.0";
constexpr int PREFLIGHT_CACHE_TTL_HOURS  = 24;
constexpr const char* PREFLIGHT_CACHE_FILE = ".preflight_ok";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK          = 0;
constexpr int EXIT_RECOVERABLE = 1;
constexpr int EXIT_FATAL       = 2;
constexpr int EXIT_INTERRUPTED = 3;
