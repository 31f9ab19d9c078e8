#include "sigfix/StrayLinesDetector.h"

#include "sigfix/Constants.h"

namespace sigfix {

StrayLinesDetector::StrayLinesDetector(const SyntaxTree& tree)
    : matcher_(tree)
    , locator_(tree)
    , editor_(tree) {
}

std::string_view StrayLinesDetector::name() const {
    return STRAY_LINES_DETECTOR;
}

std::optional<Offense> StrayLinesDetector::onCandidate(NodeId node) const {
    if (!matcher_.matches(node, Pattern::SignatureBlock)) {
        return std::nullopt;
    }

    NodeId next = locator_.nextSibling(node);
    if (!matcher_.matches(next, Pattern::SignableDefinition) &&
        !matcher_.matches(next, Pattern::WrappingCall)) {
        return std::nullopt;
    }

    auto collapsed = editor_.collapse(node, next);
    if (!collapsed) {
        return std::nullopt;
    }

    Offense offense;
    offense.node = node;
    offense.location = collapsed->range;
    offense.detector = std::string(name());
    offense.message = "Extra empty line or comment detected";
    offense.corrections = collapsed->toEdits(editor_.wholeLineStart(node));
    return offense;
}

} // namespace sigfix
