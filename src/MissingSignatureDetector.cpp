#include "sigfix/MissingSignatureDetector.h"

#include <filesystem>
#include <system_error>

#include <fmt/format.h>

#include "sigfix/Constants.h"

namespace sigfix {

MissingSignatureDetector::MissingSignatureDetector(const SyntaxTree& tree, FileModes modes,
                                                   SignatureSynthesizer synthesizer)
    : tree_(tree)
    , modes_(modes)
    , matcher_(tree)
    , locator_(tree)
    , planner_(tree, std::move(synthesizer)) {
}

std::string_view MissingSignatureDetector::name() const {
    return MISSING_SIGNATURE_DETECTOR;
}

SignatureState MissingSignatureDetector::classify(NodeId node) const {
    if (modes_.strict || !matcher_.matches(node, Pattern::SignableDefinition)) {
        return SignatureState::NoOffense;
    }

    NodeId scope = locator_.enclosingScope(node);
    bool has_capability = planner_.scopeHasCapability(scope);
    if (!modes_.signatures_enabled && !has_capability) {
        return SignatureState::NoOffense;
    }

    NodeId preceding = locator_.previousSibling(planner_.nodeToDecorate(node));
    if (matcher_.matches(preceding, Pattern::SignatureBlock)) {
        return SignatureState::NoOffense;
    }

    return has_capability ? SignatureState::OffenseHasCapability
                          : SignatureState::OffenseNoCapability;
}

std::optional<Offense> MissingSignatureDetector::onCandidate(NodeId node) const {
    SignatureState state = classify(node);
    if (state == SignatureState::NoOffense) {
        return std::nullopt;
    }

    Offense offense;
    offense.node = node;
    offense.location = tree_.sourceRange(node);
    offense.detector = std::string(name());
    offense.message = messageFor(node);
    offense.corrections = planner_.plan(node, state == SignatureState::OffenseNoCapability);
    return offense;
}

std::string MissingSignatureDetector::messageFor(NodeId node) const {
    return fmt::format(
        "Methods should have Sorbet signatures. Please add a `sig` to method #{}. "
        "You can use `sigfix --only {} {}` to get a starting signature you can modify. "
        "See {} for more information.",
        matcher_.definitionName(node), MISSING_SIGNATURE_DETECTOR, displayPath(), DOCS_URL);
}

std::string MissingSignatureDetector::displayPath() const {
    const std::string& path = tree_.buffer().name();
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return std::string(DEFAULT_FILE_PATH);
    }
    return path;
}

} // namespace sigfix
