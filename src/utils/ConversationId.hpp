#pragma once

#include <cstdint>
#include <string>

namespace DupFinder
{

/**
 * @brief Converts an internal chat id to the id used in public message links.
 *
 * Large group chats are reported with a "-100" decimal prefix; the link form
 * drops it. Ids above -100, or whose absolute value does not start with the
 * digits "100", are returned unchanged. Total over the whole int64 range.
 */
std::int64_t toDisplayId(std::int64_t internalId);

/**
 * @brief Link to a message, e.g. "https://t.me/c/1234567890/10".
 */
std::string messageLink(std::int64_t conversationId, std::int64_t messageId);

} // namespace DupFinder
