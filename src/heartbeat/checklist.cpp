#include "heartbeat/checklist.hpp"

#include <optional>

#include "utils/common.hpp"

namespace kestrel::heartbeat {
namespace {

struct ParsedLine {
    std::size_t box = 0;
    bool done = false;
    std::string text;
};

std::vector<std::string> SplitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= content.size()) {
        const auto end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::optional<ParsedLine> ParseItem(const std::string& line) {
    const auto bullet = line.find_first_not_of(" \t");
    if (bullet == std::string::npos || (line[bullet] != '-' && line[bullet] != '*')) {
        return std::nullopt;
    }
    const auto box = bullet + 2;
    if (line.size() < box + 3 || line[bullet + 1] != ' ' || line[box] != '[' || line[box + 2] != ']') {
        return std::nullopt;
    }
    const char mark = line[box + 1];
    if (mark != ' ' && mark != 'x' && mark != 'X') {
        return std::nullopt;
    }
    ParsedLine parsed;
    parsed.box = box;
    parsed.done = mark != ' ';
    parsed.text = utils::Trim(line.substr(box + 3));
    if (parsed.text.empty()) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

Checklist Checklist::Parse(const std::string& content) {
    Checklist checklist;
    const auto lines = SplitLines(content);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (const auto parsed = ParseItem(lines[i])) {
            checklist.items_.push_back(ChecklistItem{i, parsed->text, parsed->done});
        }
    }
    return checklist;
}

std::vector<ChecklistItem> Checklist::Pending() const {
    std::vector<ChecklistItem> pending;
    for (const auto& item : items_) {
        if (!item.done) {
            pending.push_back(item);
        }
    }
    return pending;
}

std::string Checklist::MarkDone(const std::string& content,
                                const std::string& text,
                                std::size_t hint_line,
                                bool* marked) {
    if (marked) {
        *marked = false;
    }
    auto lines = SplitLines(content);
    std::optional<std::size_t> best;
    std::size_t best_distance = 0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto parsed = ParseItem(lines[i]);
        if (!parsed || parsed->done || parsed->text != text) {
            continue;
        }
        const auto distance = i > hint_line ? i - hint_line : hint_line - i;
        if (!best || distance < best_distance) {
            best = i;
            best_distance = distance;
        }
    }
    if (!best) {
        return content;
    }
    const auto parsed = ParseItem(lines[*best]);
    lines[*best][parsed->box + 1] = 'x';
    if (marked) {
        *marked = true;
    }
    return utils::Join(lines, "\n");
}

bool Checklist::IsEffectivelyEmpty(const std::string& content) {
    for (const auto& raw : SplitLines(content)) {
        const auto line = utils::Trim(raw);
        if (line.empty() || line.rfind("#", 0) == 0 || line.rfind("<!--", 0) == 0) {
            continue;
        }
        if (line == "- [ ]" || line == "* [ ]" || line == "- [x]" || line == "* [x]") {
            continue;
        }
        return false;
    }
    return true;
}

}  // namespace kestrel::heartbeat
