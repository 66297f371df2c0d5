#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "core/notifier.hpp"

namespace notify {

// Transport seam for outbound notices. offer() follows Aeron's convention: a
// positive value is the new stream position, zero or negative means the
// message was not accepted (back pressure, not connected, closed).
class PublicationView {
public:
    virtual ~PublicationView() = default;
    virtual std::int64_t offer(const std::uint8_t* data, std::size_t length) = 0;
};

struct PublicationCounters {
    std::atomic<std::uint64_t> published{0};
    std::atomic<std::uint64_t> rejected{0};
    std::atomic<std::uint64_t> stakeholder_truncated{0};
};

// Encodes each notice into the fixed wire layout and offers it once. A
// rejected offer is reported as a failed delivery; retrying is the
// dispatcher's job.
class PublicationNotifier final : public core::Notifier {
public:
    explicit PublicationNotifier(std::shared_ptr<PublicationView> publication) noexcept
        : publication_(std::move(publication)) {}

    bool notify(const std::string& stakeholder_ref, const core::EscalationCase& escalation_case) override;

    const PublicationCounters& counters() const noexcept { return counters_; }

private:
    std::shared_ptr<PublicationView> publication_;
    PublicationCounters counters_{};
};

} // namespace notify
