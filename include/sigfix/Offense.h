#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "RangeEditor.h"
#include "SyntaxTree.h"

namespace sigfix {

/// A detected problem plus the edits that repair it.
struct Offense {
    NodeId node = kNoNode;          ///< Anchoring node
    SourceRange location;           ///< Range reported to the user
    std::string detector;           ///< Detector name, e.g. "missing-signature"
    std::string message;
    std::vector<Edit> corrections;  ///< Against the original buffer, in application order
};

/// A detector is invoked once per candidate node by the traversal driver and
/// decides by itself whether the node is of interest.
class Detector {
public:
    virtual ~Detector() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual std::optional<Offense> onCandidate(NodeId node) const = 0;
};

} // namespace sigfix
