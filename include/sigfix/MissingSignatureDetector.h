#pragma once

#include <optional>
#include <string>

#include "CorrectionPlanner.h"
#include "Offense.h"
#include "Parser.h"

namespace sigfix {

/// Outcome of checking one definition.
enum class SignatureState {
    NoOffense,
    OffenseNoCapability,    ///< Needs `sig` and `extend T::Sig`
    OffenseHasCapability    ///< Scope already extends T::Sig, needs `sig` only
};

/// Reports definitions (`def`, `def self.x`, `attr_*`) without a preceding
/// `sig` block.
///
/// Files marked `# typed: strict` are never reported. Otherwise a definition
/// is checked when the file is `# typed: true` or its scope extends T::Sig.
class MissingSignatureDetector : public Detector {
public:
    MissingSignatureDetector(const SyntaxTree& tree, FileModes modes,
                             SignatureSynthesizer synthesizer = SignatureSynthesizer());

    [[nodiscard]] std::string_view name() const override;

    [[nodiscard]] std::optional<Offense> onCandidate(NodeId node) const override;

    [[nodiscard]] SignatureState classify(NodeId node) const;

    [[nodiscard]] std::string messageFor(NodeId node) const;

private:
    /// Buffer name when it names an existing file, else a placeholder
    [[nodiscard]] std::string displayPath() const;

    const SyntaxTree& tree_;
    FileModes modes_;
    PatternMatcher matcher_;
    SiblingLocator locator_;
    CorrectionPlanner planner_;
};

} // namespace sigfix
