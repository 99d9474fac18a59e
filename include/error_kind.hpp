#pragma once

#include <string>

/**
 * Failure categories shared by the HTTP layer and transfer outcomes.
 * Decides how an operator should react, not whether the run continues:
 * every category is contained to the file that produced it.
 */
enum class ErrorKind
{
    None,
    MalformedInput,   // Bad period or URL, rejected before any network call
    TransientNetwork, // Connection error, DNS, timeout, truncated body, 5xx
    ServerRejection,  // 4xx other than 416, or a status we cannot use
    LocalIO,          // Cannot open/write the local file, disk full
    Interrupted,      // Stopped by the user (SIGINT/SIGTERM)
    Internal          // Unexpected exception inside a transfer
};

/**
 * Short lowercase name for logs and summaries (e.g. "transient-network").
 */
std::string errorKindName(ErrorKind kind);
