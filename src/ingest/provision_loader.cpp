#include "ingest/provision_loader.hpp"

#include <algorithm>
#include <cstdint>
#include <new>
#include <optional>
#include <set>
#include <utility>

#include "persist/json_cursor.hpp"
#include "util/time.hpp"

namespace ingest {
namespace {

using persist::JsonCursor;

bool read_optional_day(JsonCursor& cur, std::optional<util::CivilDay>& out, std::string& error) {
    if (cur.consume_null()) {
        out.reset();
        return true;
    }
    auto s = cur.parse_string(error);
    if (!s) {
        return false;
    }
    auto day = util::parse_civil_day(*s);
    if (!day) {
        error = cur.at("invalid date '" + *s + "'");
        return false;
    }
    out = *day;
    return true;
}

bool read_optional_id(JsonCursor& cur, std::optional<core::ProvisionId>& out, std::string& error) {
    if (cur.consume_null()) {
        out.reset();
        return true;
    }
    auto s = cur.parse_string(error);
    if (!s) {
        return false;
    }
    out = std::move(*s);
    return true;
}

bool read_quantity(JsonCursor& cur, std::optional<core::Quantity>& out, std::string& error) {
    if (cur.consume_null()) {
        out.reset();
        return true;
    }
    core::Quantity q{};
    bool have_value = false;
    const bool ok = persist::parse_object(cur, error, [&](const std::string& key) {
        if (key == "value") {
            auto v = cur.parse_double(error);
            if (!v) return false;
            q.value = *v;
            have_value = true;
            return true;
        }
        if (key == "unit") {
            auto v = cur.parse_string(error);
            if (!v) return false;
            q.unit = std::move(*v);
            return true;
        }
        if (key == "bound") {
            auto v = cur.parse_string(error);
            if (!v) return false;
            auto bound = core::parse_quantity_bound(*v);
            if (!bound) {
                error = "unknown quantity bound: " + *v;
                return false;
            }
            q.bound = *bound;
            return true;
        }
        error = "unknown quantity field: " + key;
        return false;
    });
    if (!ok) {
        return false;
    }
    if (!have_value) {
        error = "quantity missing value";
        return false;
    }
    out = std::move(q);
    return true;
}

bool parse_provision_field(JsonCursor& cur, const std::string& key, core::NormativeProvision& p, bool& have_polarity,
                           std::string& error) {
    if (key == "id" || key == "framework_id" || key == "obligation") {
        auto v = cur.parse_string(error);
        if (!v) return false;
        (key == "id" ? p.id : key == "framework_id" ? p.framework_id : p.obligation) = std::move(*v);
        return true;
    }
    if (key == "jurisdiction") return persist::parse_string_array(cur, p.jurisdiction, error);
    if (key == "topic_tags") return persist::parse_string_array(cur, p.topic_tags, error);
    if (key == "qualifiers") return persist::parse_string_array(cur, p.qualifiers, error);
    if (key == "context_flags") return persist::parse_string_array(cur, p.context_flags, error);
    if (key == "authority_level") {
        auto v = cur.parse_int64(error);
        if (!v) return false;
        p.authority_level = static_cast<std::int32_t>(*v);
        return true;
    }
    if (key == "effective_date") return read_optional_day(cur, p.effective_date, error);
    if (key == "expiry_date") return read_optional_day(cur, p.expiry_date, error);
    if (key == "superseded_by") return read_optional_id(cur, p.superseded_by, error);
    if (key == "revision_of") return read_optional_id(cur, p.revision_of, error);
    if (key == "polarity") {
        auto v = cur.parse_string(error);
        if (!v) return false;
        auto pol = core::parse_polarity(*v);
        if (!pol) {
            error = "unknown polarity: " + *v;
            return false;
        }
        p.polarity = *pol;
        have_polarity = true;
        return true;
    }
    if (key == "quantity") return read_quantity(cur, p.quantity, error);
    if (key == "entity_count") {
        auto v = cur.parse_uint64(error);
        if (!v) return false;
        p.entity_count = *v;
        return true;
    }
    error = "unknown provision field: " + key;
    return false;
}

bool parse_provision(JsonCursor& cur, core::NormativeProvision& p, std::string& error) {
    bool have_polarity = false;
    const bool ok = persist::parse_object(cur, error, [&](const std::string& key) {
        return parse_provision_field(cur, key, p, have_polarity, error);
    });
    if (!ok) {
        return false;
    }
    if (p.id.empty()) {
        error = "provision missing id";
        return false;
    }
    if (!have_polarity) {
        error = "provision " + p.id + " missing polarity";
        return false;
    }
    if (p.effective_date && p.expiry_date && *p.expiry_date <= *p.effective_date) {
        error = "provision " + p.id + " expires before it takes effect";
        return false;
    }
    core::normalize_provision(p);
    return true;
}

} // namespace

bool parse_provisions(std::string_view json, std::vector<core::NormativeProvision>& out, std::string& error) noexcept {
    try {
        std::vector<core::NormativeProvision> parsed;
        std::set<core::ProvisionId> seen;
        JsonCursor cur(json);
        bool have_list = false;
        const bool ok = persist::parse_object(cur, error, [&](const std::string& key) {
            if (key != "provisions") {
                error = "unknown field: " + key;
                return false;
            }
            have_list = true;
            return persist::parse_array(cur, error, [&] {
                core::NormativeProvision p{};
                if (!parse_provision(cur, p, error)) {
                    return false;
                }
                if (!seen.insert(p.id).second) {
                    error = "duplicate provision id: " + p.id;
                    return false;
                }
                parsed.push_back(std::move(p));
                return true;
            });
        });
        if (!ok) {
            return false;
        }
        if (!have_list) {
            error = "missing provisions array";
            return false;
        }
        if (!cur.eof()) {
            error = cur.at("trailing content");
            return false;
        }
        out = std::move(parsed);
        return true;
    } catch (const std::bad_alloc&) {
        error = "out of memory";
        return false;
    }
}

bool load_provisions(const std::filesystem::path& path, std::vector<core::NormativeProvision>& out,
                     std::string& error) noexcept {
    std::string contents;
    if (!persist::read_text_file(path, contents, error)) {
        return false;
    }
    if (!parse_provisions(contents, out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

} // namespace ingest
