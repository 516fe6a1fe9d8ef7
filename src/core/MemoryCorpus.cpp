#include "MemoryCorpus.hpp"

#include <algorithm>
#include <mutex>

namespace DupFinder
{

bool MemoryCorpus::insert(const CorpusEntry& entry) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto& entries = m_entries[entry.conversationId];

    auto existing = std::find_if(entries.begin(), entries.end(),
        [&](const CorpusEntry& e) { return e.messageId == entry.messageId; });
    if (existing != entries.end()) {
        return false;
    }

    CorpusEntry stored = entry;
    stored.sequence = m_nextSequence++;
    entries.push_back(std::move(stored));
    return true;
}

std::vector<CorpusEntry> MemoryCorpus::snapshot(ConversationId conversationId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(conversationId);
    if (it == m_entries.end()) return {};
    return it->second;
}

void MemoryCorpus::scan(ConversationId conversationId, const Visitor& visitor) const {
    for (const auto& entry : snapshot(conversationId)) {
        visitor(entry);
    }
}

std::optional<CorpusEntry> MemoryCorpus::find(ConversationId conversationId, MessageId messageId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(conversationId);
    if (it == m_entries.end()) return std::nullopt;

    for (const auto& entry : it->second) {
        if (entry.messageId == messageId) return entry;
    }
    return std::nullopt;
}

std::size_t MemoryCorpus::count(ConversationId conversationId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(conversationId);
    return it == m_entries.end() ? 0 : it->second.size();
}

} // namespace DupFinder
