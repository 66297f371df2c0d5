#include "notify/aeron_publication.hpp"

#include <thread>

#include <concurrent/AtomicBuffer.h>

namespace notify {

std::int64_t AeronPublicationView::offer(const std::uint8_t* data, std::size_t length) {
    aeron::concurrent::AtomicBuffer buffer(const_cast<std::uint8_t*>(data), length);
    return pub_->offer(buffer, 0, static_cast<aeron::util::index_t>(length));
}

std::shared_ptr<PublicationView> make_aeron_publication(const std::shared_ptr<aeron::Aeron>& client,
                                                        const std::string& channel, std::int32_t stream_id,
                                                        std::chrono::milliseconds timeout,
                                                        const std::atomic<bool>& stop_flag) {
    const auto registration_id = client->addPublication(channel, stream_id);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::shared_ptr<aeron::Publication> publication;
    while (!stop_flag.load(std::memory_order_acquire) && !publication) {
        publication = client->findPublication(registration_id);
        if (!publication) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return nullptr;
            }
            std::this_thread::yield();
        }
    }
    if (!publication) {
        return nullptr;
    }
    return std::make_shared<AeronPublicationView>(std::move(publication));
}

} // namespace notify
