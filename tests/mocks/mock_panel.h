// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_panel.h"

#include <map>
#include <string>
#include <vector>

namespace printdeck {

/**
 * @brief Ordered record of surface and panel lifecycle calls
 *
 * Entries look like "detach:splash", "hide:splash", "attach:idle",
 * "show:idle". Root handles are fake pointers registered by MockPanel.
 */
struct UiEventLog {
    std::vector<std::string> events;
    std::map<const lv_obj_t*, std::string> root_names;

    void record(const std::string& op, const std::string& name) {
        events.push_back(op + ":" + name);
    }

    std::string name_of(const lv_obj_t* node) const {
        auto it = root_names.find(node);
        return it != root_names.end() ? it->second : "?";
    }

    size_t count(const std::string& op) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.compare(0, op.size() + 1, op + ":") == 0) {
                n++;
            }
        }
        return n;
    }

    void clear() {
        events.clear();
    }
};

/**
 * @brief IPanel test double with a fake root handle
 */
class MockPanel : public virtual IPanel {
  public:
    MockPanel(std::string name, UiEventLog& log, IPanel* parent = nullptr)
        : name_(std::move(name)), log_(log), parent_(parent) {
        log_.root_names[get_root()] = name_;
    }

    ~MockPanel() override {
        log_.root_names.erase(get_root());
        log_.record("destroy", name_);
    }

    void show() override {
        visible_ = true;
        show_count++;
        log_.record("show", name_);
    }

    void hide() override {
        visible_ = false;
        hide_count++;
        log_.record("hide", name_);
    }

    lv_obj_t* get_root() const override {
        // Address of a member byte; never dereferenced
        return reinterpret_cast<lv_obj_t*>(const_cast<char*>(&root_tag_));
    }

    IPanel* get_parent() const override {
        return parent_;
    }

    const char* get_name() const override {
        return name_.c_str();
    }

    bool is_visible() const {
        return visible_;
    }

    int show_count = 0;
    int hide_count = 0;

  private:
    std::string name_;
    UiEventLog& log_;
    IPanel* parent_;
    bool visible_ = false;
    char root_tag_ = 0;
};

/**
 * @brief Splash test double that remembers its message
 */
class MockMessagePanel : public MockPanel, public IMessagePanel {
  public:
    MockMessagePanel(std::string name, UiEventLog& log) : MockPanel(std::move(name), log) {}

    void set_message(const std::string& message) override {
        message_ = message;
        set_count++;
    }

    std::string get_message() const override {
        return message_;
    }

    int set_count = 0;

  private:
    std::string message_;
};

} // namespace printdeck
