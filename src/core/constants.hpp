#pragma once

// ── Issue tracker ───────────────────────────────────────────
// Use fmt::format with this: fmt::format(ISSUE_NEW_URL, owner, repo)
constexpr const char* ISSUE_NEW_URL = "https://github.com/{}/{}/issues/new";

// ── Diagnostic layout ───────────────────────────────────────
constexpr const char* BUG_MARKER         = "\xf0\x9f\x90\x9b BUG ENCOUNTERED in";
constexpr const char* REPORT_LINK_TEXT   = "File a bug report";
constexpr const char* DIAG_INDENT        = "   ";
constexpr const char* DIAG_PARAM_INDENT  = "     ";

// ── Labels ──────────────────────────────────────────────────
constexpr char LABEL_SEPARATOR = ',';

// ── Convenience layer ───────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_FILE = "bugrep.yaml";
constexpr const char* CONFIG_ENV_VAR      = "BUGREP_CONFIG";
constexpr const char* DEBUG_LOG_FILE      = "bugrep_debug.log";
constexpr const char* BUGREP_VERSION      = "0.2.0";
