#pragma once

#include <string>

#include "utils/clock.hpp"
#include "workspace/workspace_state.hpp"

namespace kestrel::agent {

// memory/MEMORY.md holds long-term facts (read-modify-write);
// memory/HISTORY.md is an append-only event log.
class MemoryStore {
public:
    explicit MemoryStore(workspace::WorkspaceState& workspace,
                         const utils::Clock& clock = utils::SystemClock::Instance());

    std::string GetMemoryContext() const;
    std::string ReadLongTerm() const;
    void WriteLongTerm(const std::string& content);
    void UpdateLongTerm(const workspace::WorkspaceState::Transform& fn);
    void AppendHistory(const std::string& entry);
    std::string ReadHistory() const;

    static constexpr const char* kMemoryFile = "memory/MEMORY.md";
    static constexpr const char* kHistoryFile = "memory/HISTORY.md";

private:
    workspace::WorkspaceState& workspace_;
    const utils::Clock& clock_;
};

}  // namespace kestrel::agent
