#pragma once
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ghg {

constexpr size_t kMaxInputLength = 100000;   // code points
constexpr const char* kCommentPlaceholder = "[COMMENT_REMOVED]";
constexpr const char* kTruncationMarker   = "\n[...TRUNCATED]";

// Ingress sanitization of one untrusted text field. Never throws.
//  1. strip invisible / zero-width / formatting code points
//  2. HTML comments      -> kCommentPlaceholder
//  3. [//]: # (...) lines -> kCommentPlaceholder
//  4. detection-only injection scan (tags, no mutation)
//  5. warning prefix when anything was tagged
//  6. hard cap at kMaxInputLength + kTruncationMarker
SanitizeResult sanitize(const std::string& text, const std::string& contextLabel = "unknown");

SanitizedIssue sanitizeIssue(const std::string& title, const std::string& body);

std::string wrapWithTrustBoundary(const std::string& content, const std::string& label);

// https only; host must equal a pattern or, for "*.domain", end with ".domain".
// Returns the normalized URL, or nullopt for anything else (malformed included).
std::optional<std::string> sanitizeUrl(const std::string& url,
                                       const std::vector<std::string>& allowedDomainPatterns);

// Deletes ` $ { } | ; & < > and backslash.
std::string stripShellMetacharacters(const std::string& text);

} // namespace ghg
