//! # Directive Registry
//!
//! Locates the directive on an item and rewrites the attributes that carry
//! it, so expanded output no longer names a macro that does not exist.

#include "derive/registry.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace vnc::derive {

namespace {

auto is_annotation(const std::string& path) -> bool {
    return last_segment(path) == ANNOTATION_NAME;
}

} // namespace

auto find_directive(const parser::Item& item) -> std::optional<Directive> {
    std::optional<Directive> attachment;
    std::optional<Directive> annotation;

    for (size_t i = 0; i < item.attributes.size(); ++i) {
        const auto& attr = item.attributes[i];
        if (attr.is_doc || attr.is_inner) {
            continue;
        }

        if (last_segment(attr.path) == ATTACHMENT_NAME) {
            if (attachment) {
                VNC_LOG_WARN("derive", "duplicate " << directive_display(DirectiveMode::Attachment)
                                                    << " on `" << item.name
                                                    << "`, expanding once");
                continue;
            }
            attachment = Directive{.mode = DirectiveMode::Attachment, .attribute_index = i};
            continue;
        }

        if (attr.path == "derive" && !annotation) {
            bool listed =
                std::any_of(attr.derive_paths.begin(), attr.derive_paths.end(), is_annotation);
            if (listed) {
                annotation = Directive{.mode = DirectiveMode::Annotation, .attribute_index = i};
            }
        }
    }

    if (attachment && annotation) {
        VNC_LOG_WARN("derive", "`" << item.name << "` carries both "
                                   << directive_display(DirectiveMode::Attachment) << " and "
                                   << directive_display(DirectiveMode::Annotation)
                                   << "; generating one accessor");
    }
    return attachment ? attachment : annotation;
}

auto consume_directive(const parser::Attribute& attr) -> std::optional<std::string> {
    if (attr.is_doc || attr.is_inner) {
        return std::nullopt;
    }
    if (last_segment(attr.path) == ATTACHMENT_NAME) {
        return std::string{};
    }
    if (attr.path != "derive" ||
        std::none_of(attr.derive_paths.begin(), attr.derive_paths.end(), is_annotation)) {
        return std::nullopt;
    }

    std::string kept;
    for (const auto& path : attr.derive_paths) {
        if (is_annotation(path)) {
            continue;
        }
        if (!kept.empty()) {
            kept += ", ";
        }
        kept += path;
    }
    if (kept.empty()) {
        return std::string{};
    }
    return "#[derive(" + kept + ")]";
}

} // namespace vnc::derive
