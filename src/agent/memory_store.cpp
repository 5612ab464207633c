#include "agent/memory_store.hpp"

#include <sstream>

#include "utils/common.hpp"

namespace kestrel::agent {

MemoryStore::MemoryStore(workspace::WorkspaceState& workspace, const utils::Clock& clock)
    : workspace_(workspace)
    , clock_(clock) {}

std::string MemoryStore::GetMemoryContext() const {
    const auto long_term = ReadLongTerm();
    if (utils::Trim(long_term).empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "## Long-term Memory\n" << long_term;
    return oss.str();
}

std::string MemoryStore::ReadLongTerm() const {
    return workspace_.Read(kMemoryFile);
}

void MemoryStore::WriteLongTerm(const std::string& content) {
    workspace_.Replace(kMemoryFile, content);
}

void MemoryStore::UpdateLongTerm(const workspace::WorkspaceState::Transform& fn) {
    workspace_.ReadModifyWrite(kMemoryFile, fn);
}

void MemoryStore::AppendHistory(const std::string& entry) {
    auto text = utils::Trim(entry);
    if (text.empty()) {
        return;
    }
    // One entry per line keeps the log grep-friendly.
    for (auto& ch : text) {
        if (ch == '\n' || ch == '\r') {
            ch = ' ';
        }
    }
    workspace_.Append(kHistoryFile, "[" + utils::FormatLocalTime(clock_.NowMs()) + "] " + text + "\n");
}

std::string MemoryStore::ReadHistory() const {
    return workspace_.Read(kHistoryFile);
}

}  // namespace kestrel::agent
