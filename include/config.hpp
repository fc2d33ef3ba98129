#pragma once

// Compiled-in defaults. Every value can be overridden at startup through
// ServerConfig (JSON file or environment).

#define FORMDROP_DEFAULT_PORT 3000
#define FORMDROP_DEFAULT_UPLOAD_DIR "uploads"
#define FORMDROP_DEFAULT_MAX_BODY_BYTES (16u * 1024u * 1024u)
#define FORMDROP_MAX_HEADER_BYTES (64u * 1024u)
#define FORMDROP_DEFAULT_READ_TIMEOUT_MS 30000
#define FORMDROP_DEFAULT_FIELD_NAME "myFile"
#define FORMDROP_DEFAULT_FILENAME "untitled"

#define FORMDROP_ENV_PORT "FORMDROP_PORT"
#define FORMDROP_ENV_UPLOAD_DIR "FORMDROP_UPLOAD_DIR"
