#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kestrel::heartbeat {

struct ChecklistItem {
    std::size_t line = 0;
    std::string text;
    bool done = false;
};

// Task lines of HEARTBEAT.md: "- [ ] text", "- [x] text" (also "*" bullets,
// any indentation). Every other line is left alone.
class Checklist {
public:
    static Checklist Parse(const std::string& content);

    const std::vector<ChecklistItem>& Items() const { return items_; }
    std::vector<ChecklistItem> Pending() const;

    // Checks off the unchecked item with this text closest to hint_line.
    // Returns the content unchanged when no such item remains.
    static std::string MarkDone(const std::string& content,
                                const std::string& text,
                                std::size_t hint_line,
                                bool* marked = nullptr);

    // True when nothing but headings, comments and empty items remain.
    static bool IsEffectivelyEmpty(const std::string& content);

private:
    std::vector<ChecklistItem> items_;
};

}  // namespace kestrel::heartbeat
