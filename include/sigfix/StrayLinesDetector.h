#pragma once

#include "Offense.h"
#include "PatternMatcher.h"
#include "RangeEditor.h"
#include "SiblingLocator.h"

namespace sigfix {

/// Reports blank lines or comments between a `sig` block and the definition
/// it describes. The fix removes the lines and moves any comments above the
/// signature.
class StrayLinesDetector : public Detector {
public:
    explicit StrayLinesDetector(const SyntaxTree& tree);

    [[nodiscard]] std::string_view name() const override;

    [[nodiscard]] std::optional<Offense> onCandidate(NodeId node) const override;

private:
    PatternMatcher matcher_;
    SiblingLocator locator_;
    RangeEditor editor_;
};

} // namespace sigfix
