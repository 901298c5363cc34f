#include <notegraph/core/model.h>

namespace notegraph {

std::optional<ReferenceKind> referenceKindFromString(std::string_view name) {
    if (name == "wikilink") {
        return ReferenceKind::Wikilink;
    }
    if (name == "image") {
        return ReferenceKind::ImageEmbed;
    }
    if (name == "diagram") {
        return ReferenceKind::DiagramEmbed;
    }
    return std::nullopt;
}

std::optional<ResolutionStatus> resolutionStatusFromString(std::string_view name) {
    if (name == "resolved") {
        return ResolutionStatus::Resolved;
    }
    if (name == "ambiguous") {
        return ResolutionStatus::Ambiguous;
    }
    if (name == "broken") {
        return ResolutionStatus::Broken;
    }
    return std::nullopt;
}

} // namespace notegraph
