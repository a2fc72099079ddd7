#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fdr {

enum class LinkKind {
    GEO,
    LEO,
    UHF,
    Unknown
};

enum class SubsystemCategory {
    Subsystem,
    Payload      // prefix starts with "PL"
};

const char* to_str(LinkKind kind);
const char* to_str(SubsystemCategory category);

// Fields sharing a name prefix, e.g. GNC_Roll_deg + GNC_Pitch_deg -> "GNC"
struct SubsystemDescriptor {
    std::string id;
    SubsystemCategory category = SubsystemCategory::Subsystem;
    std::vector<std::string> fields;        // sorted

    bool operator==(const SubsystemDescriptor& other) const {
        return id == other.id && category == other.category && fields == other.fields;
    }
};

// COMM_<NAME>_dB margin columns, e.g. COMM_LEO_SATCOM_dB -> id "COMM_LEO_SATCOM", name "LEO_SATCOM"
struct LinkDescriptor {
    std::string id;
    std::string name;                       // upper-cased
    LinkKind kind = LinkKind::Unknown;
    std::vector<std::string> fields;        // sorted

    // Several columns can name one link (COMM_LEO_dB, COMM_LEO_Margin_dB, COMM_leo_dB).
    // The margin series is the first in byte order, so upper-case spellings
    // and the _Margin_dB form win over COMM_<Name>_dB. classify() warns when
    // a link has more than one candidate.
    const std::string& margin_field() const { return fields.front(); }

    bool operator==(const LinkDescriptor& other) const {
        return id == other.id && name == other.name && kind == other.kind && fields == other.fields;
    }
};

using Descriptor = std::variant<SubsystemDescriptor, LinkDescriptor>;

const std::string& descriptor_id(const Descriptor& descriptor);
const std::vector<std::string>& descriptor_fields(const Descriptor& descriptor);

class SubsystemRegistry {
public:
    SubsystemRegistry() = default;

    // Pure and total: every column lands in exactly one descriptor, and the
    // result depends only on the set of names, not on their order.
    static SubsystemRegistry classify(const std::vector<std::string>& column_names);

    // Parses COMM_<NAME>_dB (case-insensitive). Empty string when the column is not a link margin.
    static std::string link_name_for_column(std::string_view column);
    static LinkKind infer_link_kind(std::string_view link_name);

    const std::vector<Descriptor>& descriptors() const { return _descriptors; }
    size_t size() const { return _descriptors.size(); }
    bool empty() const { return _descriptors.empty(); }

    std::vector<const SubsystemDescriptor*> subsystems() const;
    std::vector<const LinkDescriptor*> links() const;

    // Accepts the descriptor id ("COMM_LEO") or the bare link name ("LEO"), case-insensitive
    const LinkDescriptor* find_link(std::string_view id_or_name) const;
    const Descriptor* descriptor_for_field(std::string_view field) const;

    std::vector<std::string> subsystem_ids() const;
    std::vector<std::string> payload_ids() const;
    std::vector<std::string> link_ids() const;

    bool operator==(const SubsystemRegistry& other) const { return _descriptors == other._descriptors; }
    bool operator!=(const SubsystemRegistry& other) const { return !(*this == other); }

private:
    std::vector<Descriptor> _descriptors;   // sorted by id
};

} // namespace fdr
