#include "core/provision.hpp"

#include <algorithm>
#include <iterator>

#include "util/fnv.hpp"

namespace core {
namespace {

void sort_unique(std::vector<std::string>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

} // namespace

std::optional<Polarity> parse_polarity(std::string_view s) noexcept {
    if (s == "requires") return Polarity::Requires;
    if (s == "prohibits") return Polarity::Prohibits;
    if (s == "permits") return Polarity::Permits;
    return std::nullopt;
}

std::optional<QuantityBound> parse_quantity_bound(std::string_view s) noexcept {
    if (s == "at_most") return QuantityBound::AtMost;
    if (s == "at_least") return QuantityBound::AtLeast;
    return std::nullopt;
}

void normalize_provision(NormativeProvision& p) {
    sort_unique(p.jurisdiction);
    sort_unique(p.topic_tags);
    sort_unique(p.qualifiers);
    sort_unique(p.context_flags);
}

std::optional<DayWindow> validity_window(const NormativeProvision& p) noexcept {
    if (!p.effective_date) {
        return std::nullopt;
    }
    return DayWindow{*p.effective_date, p.expiry_date};
}

std::optional<DayWindow> overlap_window(const NormativeProvision& a, const NormativeProvision& b) noexcept {
    const auto wa = validity_window(a);
    const auto wb = validity_window(b);
    if (!wa || !wb) {
        return std::nullopt;
    }
    DayWindow out{};
    out.start = std::max(wa->start, wb->start);
    if (wa->end && wb->end) {
        out.end = std::min(*wa->end, *wb->end);
    } else if (wa->end) {
        out.end = wa->end;
    } else if (wb->end) {
        out.end = wb->end;
    }
    if (out.end && *out.end <= out.start) {
        return std::nullopt;
    }
    return out;
}

bool windows_disjoint(const NormativeProvision& a, const NormativeProvision& b) noexcept {
    if (!a.effective_date || !b.effective_date) {
        return false;
    }
    return !overlap_window(a, b).has_value();
}

bool active_on(const NormativeProvision& p, util::CivilDay day) noexcept {
    if (!p.effective_date || day < *p.effective_date) {
        return false;
    }
    return !p.expiry_date || day < *p.expiry_date;
}

bool supersession_link(const NormativeProvision& a, const NormativeProvision& b) noexcept {
    return (a.superseded_by && *a.superseded_by == b.id) || (b.superseded_by && *b.superseded_by == a.id) ||
           (a.revision_of && *a.revision_of == b.id) || (b.revision_of && *b.revision_of == a.id);
}

bool is_narrower_scope(const NormativeProvision& a, const NormativeProvision& b) {
    if (a.jurisdiction.empty() || b.jurisdiction.empty()) {
        return false;
    }
    if (a.jurisdiction == b.jurisdiction) {
        return a.qualifiers.size() > b.qualifiers.size() && sorted_includes(a.qualifiers, b.qualifiers);
    }
    const bool strict_subset =
        a.jurisdiction.size() < b.jurisdiction.size() && sorted_includes(b.jurisdiction, a.jurisdiction);
    return strict_subset && sorted_includes(a.qualifiers, b.qualifiers);
}

bool same_scope(const NormativeProvision& a, const NormativeProvision& b) noexcept {
    return a.jurisdiction == b.jurisdiction && a.qualifiers == b.qualifiers;
}

std::uint64_t provision_fingerprint(const NormativeProvision& p) noexcept {
    util::Fnv1a64 h;
    h.add(p.id);
    h.add(p.framework_id);
    h.add_u64(p.jurisdiction.size());
    for (const auto& j : p.jurisdiction) h.add(j);
    h.add_i64(p.authority_level);
    h.add_i64(p.effective_date ? *p.effective_date : INT64_MIN);
    h.add_i64(p.expiry_date ? *p.expiry_date : INT64_MIN);
    h.add(p.superseded_by ? std::string_view(*p.superseded_by) : std::string_view("\x01"));
    h.add(p.revision_of ? std::string_view(*p.revision_of) : std::string_view("\x01"));
    h.add_u64(static_cast<std::uint64_t>(p.polarity));
    h.add_u64(p.topic_tags.size());
    for (const auto& t : p.topic_tags) h.add(t);
    h.add(p.obligation);
    if (p.quantity) {
        h.add_u64(1);
        h.add_double(p.quantity->value);
        h.add(p.quantity->unit);
        h.add_u64(static_cast<std::uint64_t>(p.quantity->bound));
    } else {
        h.add_u64(0);
    }
    h.add_u64(p.qualifiers.size());
    for (const auto& q : p.qualifiers) h.add(q);
    h.add_u64(p.context_flags.size());
    for (const auto& c : p.context_flags) h.add(c);
    h.add_u64(p.entity_count);
    return h.value();
}

std::vector<std::string> sorted_intersection(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<std::string> out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

std::vector<std::string> sorted_union(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<std::string> out;
    std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

bool sorted_includes(const std::vector<std::string>& outer, const std::vector<std::string>& inner) {
    return std::includes(outer.begin(), outer.end(), inner.begin(), inner.end());
}

bool sorted_intersects(const std::vector<std::string>& a, const std::vector<std::string>& b) noexcept {
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            return true;
        }
    }
    return false;
}

} // namespace core
