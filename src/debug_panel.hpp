#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — extensible provider registry for the debug overlay.
//
// Stored as a World resource. Modules call watch(section, label, fn) at
// install time; DebugSystem calls every provider each render frame while the
// overlay is visible. Providers capture the World by reference and must only
// read from it.
//
// Zero engine dependencies — safe to include in any target.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    bool visible = false;

    // Register a named provider under a section heading.
    // Creates the section if it does not already exist.
    void watch(const std::string& section,
               const std::string& label,
               Provider fn) {
        if (Section* s = find_mut(section)) {
            s->rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    const std::vector<Section>& sections() const { return sections_; }

    const Section* find(const std::string& title) const {
        for (const auto& s : sections_)
            if (s.title == title) return &s;
        return nullptr;
    }

private:
    Section* find_mut(const std::string& title) {
        for (auto& s : sections_)
            if (s.title == title) return &s;
        return nullptr;
    }

    std::vector<Section> sections_;
};
