#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <Aeron.h>

#include "notify/publication_notifier.hpp"

namespace notify {

class AeronPublicationView final : public PublicationView {
public:
    explicit AeronPublicationView(std::shared_ptr<aeron::Publication> pub) : pub_(std::move(pub)) {}

    std::int64_t offer(const std::uint8_t* data, std::size_t length) override;

private:
    std::shared_ptr<aeron::Publication> pub_;
};

// Registers a publication and waits for the driver to make it available.
// Returns null when the timeout expires or stop_flag is raised first.
std::shared_ptr<PublicationView> make_aeron_publication(const std::shared_ptr<aeron::Aeron>& client,
                                                        const std::string& channel, std::int32_t stream_id,
                                                        std::chrono::milliseconds timeout,
                                                        const std::atomic<bool>& stop_flag);

} // namespace notify
