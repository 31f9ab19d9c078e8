#pragma once

#include <string_view>

namespace sigfix {

/// Source markers and generated snippets shared by the parser, the
/// detectors and the correction engine.
namespace markers {

// ============================================================================
// Sorbet constructs
// ============================================================================

/// Method that opens a signature block
inline constexpr std::string_view SIG = "sig";

/// Scope-level declaration that makes `sig` available
inline constexpr std::string_view EXTEND_T_SIG = "extend T::Sig";

/// Placeholder type used when nothing better can be inferred
inline constexpr std::string_view UNTYPED = "T.untyped";

/// Attribute declarations that Sorbet expects a signature for
inline constexpr std::string_view ATTR_READER = "attr_reader";
inline constexpr std::string_view ATTR_WRITER = "attr_writer";
inline constexpr std::string_view ATTR_ACCESSOR = "attr_accessor";

// ============================================================================
// Comment markers
// ============================================================================

/// Prefix of inline configuration comments: `# sigfix-KEY: VALUE`
inline constexpr std::string_view INLINE_CONFIG_PREFIX = "sigfix-";

} // namespace markers

// ============================================================================
// Messages
// ============================================================================

inline constexpr std::string_view DOCS_URL = "https://sorbet.org/docs/sigs";

/// Substituted when the buffer has no displayable file path
inline constexpr std::string_view DEFAULT_FILE_PATH = "<file path>";

inline constexpr std::string_view MISSING_SIGNATURE_DETECTOR = "missing-signature";
inline constexpr std::string_view STRAY_LINES_DETECTOR = "stray-lines";

// ============================================================================
// Formatting
// ============================================================================

/// Default indentation unit for generated multi-line signatures
inline constexpr std::string_view ONE_INDENT_LEVEL = "  ";

/// Maximum indentation spaces allowed
inline constexpr int MAX_INDENT_SPACES = 16;

} // namespace sigfix
