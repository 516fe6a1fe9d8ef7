#include "ConversationId.hpp"

namespace DupFinder
{

std::int64_t toDisplayId(std::int64_t internalId) {
    if (internalId > -100) {
        return internalId;
    }

    // Negate in unsigned arithmetic so INT64_MIN has a magnitude too
    const std::uint64_t magnitude = 0 - static_cast<std::uint64_t>(internalId);

    // Largest power of ten that leaves exactly three leading digits
    std::uint64_t divisor = 1;
    while (magnitude / divisor >= 1000) {
        divisor *= 10;
    }

    if (magnitude / divisor == 100) {
        return static_cast<std::int64_t>(magnitude % divisor);
    }
    return internalId;
}

std::string messageLink(std::int64_t conversationId, std::int64_t messageId) {
    return "https://t.me/c/" + std::to_string(toDisplayId(conversationId)) + "/" + std::to_string(messageId);
}

} // namespace DupFinder
