#include "notify/publication_notifier.hpp"

#include "notify/escalation_notice.hpp"

namespace notify {

bool PublicationNotifier::notify(const std::string& stakeholder_ref, const core::EscalationCase& escalation_case) {
    if (!publication_) {
        counters_.rejected.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    NoticeBuffer buf{};
    if (!encode_notice(stakeholder_ref, escalation_case, buf)) {
        counters_.stakeholder_truncated.fetch_add(1, std::memory_order_relaxed);
    }
    const std::int64_t result = publication_->offer(reinterpret_cast<const std::uint8_t*>(buf.data()), buf.size());
    if (result <= 0) {
        counters_.rejected.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    counters_.published.fetch_add(1, std::memory_order_relaxed);
    return true;
}

} // namespace notify
