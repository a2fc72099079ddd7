#include "subsystem_registry.hpp"
#include "zf_log.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace fdr {

static constexpr std::string_view LINK_PREFIX = "COMM_";
static constexpr std::string_view LINK_SUFFIX = "_DB";
static constexpr std::string_view MARGIN_SUFFIX = "_MARGIN";
static constexpr std::string_view PAYLOAD_PREFIX = "PL";

static std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

static bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const char* to_str(LinkKind kind) {
    switch (kind) {
        case LinkKind::GEO: return "GEO";
        case LinkKind::LEO: return "LEO";
        case LinkKind::UHF: return "UHF";
        case LinkKind::Unknown: return "Unknown";
        default: return "Unknown";
    }
}

const char* to_str(SubsystemCategory category) {
    switch (category) {
        case SubsystemCategory::Subsystem: return "Subsystem";
        case SubsystemCategory::Payload: return "Payload";
        default: return "Subsystem";
    }
}

const std::string& descriptor_id(const Descriptor& descriptor) {
    return std::visit([](const auto& d) -> const std::string& { return d.id; }, descriptor);
}

const std::vector<std::string>& descriptor_fields(const Descriptor& descriptor) {
    return std::visit([](const auto& d) -> const std::vector<std::string>& { return d.fields; }, descriptor);
}

std::string SubsystemRegistry::link_name_for_column(std::string_view column) {
    const std::string upper = to_upper(column);
    if (!starts_with(upper, LINK_PREFIX) || !ends_with(upper, LINK_SUFFIX)) {
        return std::string();
    }
    if (upper.size() <= LINK_PREFIX.size() + LINK_SUFFIX.size()) {
        return std::string();
    }

    std::string name = upper.substr(LINK_PREFIX.size(), upper.size() - LINK_PREFIX.size() - LINK_SUFFIX.size());
    // COMM_TCDL_Margin_dB is the TCDL link; a bare COMM_Margin_dB keeps its name
    if (name.size() > MARGIN_SUFFIX.size() && ends_with(name, MARGIN_SUFFIX)) {
        name.resize(name.size() - MARGIN_SUFFIX.size());
    }
    if (name.empty() || name.front() == '_' || name.back() == '_') {
        return std::string();
    }
    return name;
}

LinkKind SubsystemRegistry::infer_link_kind(std::string_view link_name) {
    const std::string upper = to_upper(link_name);
    if (upper.find("GEO") != std::string::npos) return LinkKind::GEO;
    if (upper.find("LEO") != std::string::npos) return LinkKind::LEO;
    if (upper.find("UHF") != std::string::npos) return LinkKind::UHF;
    return LinkKind::Unknown;
}

SubsystemRegistry SubsystemRegistry::classify(const std::vector<std::string>& column_names) {
    // std::set gives order independence and drops repeated names
    const std::set<std::string> columns(column_names.begin(), column_names.end());

    std::map<std::string, SubsystemDescriptor> subsystems;
    std::map<std::string, LinkDescriptor> links;

    for (const auto& column : columns) {
        const std::string link_name = link_name_for_column(column);
        if (!link_name.empty()) {
            const std::string id = std::string(LINK_PREFIX) + link_name;
            LinkDescriptor& link = links[id];
            link.id = id;
            link.name = link_name;
            link.kind = infer_link_kind(link_name);
            link.fields.push_back(column);
            continue;
        }

        size_t underscore = column.find('_');
        // No usable prefix: the column is its own single-field subsystem
        std::string id = (underscore == std::string::npos || underscore == 0)
            ? column
            : column.substr(0, underscore);

        SubsystemDescriptor& subsystem = subsystems[id];
        subsystem.id = id;
        subsystem.category = starts_with(id, PAYLOAD_PREFIX)
            ? SubsystemCategory::Payload
            : SubsystemCategory::Subsystem;
        subsystem.fields.push_back(column);
    }

    // Fields arrive already sorted because `columns` is ordered
    std::map<std::string, Descriptor> merged;
    for (auto& entry : subsystems) {
        merged.emplace(entry.first, std::move(entry.second));
    }
    for (auto& entry : links) {
        const LinkDescriptor& link = entry.second;
        if (link.fields.size() > 1) {
            ZF_LOGW("Link %s has %zu margin columns, using %s",
                link.id.c_str(), link.fields.size(), link.margin_field().c_str());
        }
        merged.emplace(entry.first, std::move(entry.second));
    }

    SubsystemRegistry registry;
    registry._descriptors.reserve(merged.size());
    for (auto& entry : merged) {
        registry._descriptors.push_back(std::move(entry.second));
    }
    return registry;
}

std::vector<const SubsystemDescriptor*> SubsystemRegistry::subsystems() const {
    std::vector<const SubsystemDescriptor*> out;
    for (const auto& descriptor : _descriptors) {
        if (const auto* s = std::get_if<SubsystemDescriptor>(&descriptor)) {
            out.push_back(s);
        }
    }
    return out;
}

std::vector<const LinkDescriptor*> SubsystemRegistry::links() const {
    std::vector<const LinkDescriptor*> out;
    for (const auto& descriptor : _descriptors) {
        if (const auto* l = std::get_if<LinkDescriptor>(&descriptor)) {
            out.push_back(l);
        }
    }
    return out;
}

const LinkDescriptor* SubsystemRegistry::find_link(std::string_view id_or_name) const {
    const std::string wanted = to_upper(id_or_name);
    for (const auto* link : links()) {
        if (to_upper(link->id) == wanted || link->name == wanted) {
            return link;
        }
    }
    return nullptr;
}

const Descriptor* SubsystemRegistry::descriptor_for_field(std::string_view field) const {
    for (const auto& descriptor : _descriptors) {
        const auto& fields = descriptor_fields(descriptor);
        if (std::find(fields.begin(), fields.end(), field) != fields.end()) {
            return &descriptor;
        }
    }
    return nullptr;
}

std::vector<std::string> SubsystemRegistry::subsystem_ids() const {
    std::vector<std::string> ids;
    for (const auto* s : subsystems()) {
        if (s->category == SubsystemCategory::Subsystem) ids.push_back(s->id);
    }
    return ids;
}

std::vector<std::string> SubsystemRegistry::payload_ids() const {
    std::vector<std::string> ids;
    for (const auto* s : subsystems()) {
        if (s->category == SubsystemCategory::Payload) ids.push_back(s->id);
    }
    return ids;
}

std::vector<std::string> SubsystemRegistry::link_ids() const {
    std::vector<std::string> ids;
    for (const auto* l : links()) {
        ids.push_back(l->id);
    }
    return ids;
}

} // namespace fdr
