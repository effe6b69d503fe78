#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "relay/session.h"

/// In-memory Session that records every frame sent to it.
class FakeSession : public Session {
public:
    explicit FakeSession(std::string name = "fake") : name_(std::move(name)) {}

    void send(const nlohmann::json& frame) override {
        if (open_) sent.push_back(frame);
    }
    void close() override {
        open_ = false;
        ++close_calls;
    }
    void abort() override {
        open_ = false;
        ++abort_calls;
    }
    bool is_open() const override { return open_; }
    std::string peer() const override { return name_; }

    /// Frames of one type, in send order.
    std::vector<nlohmann::json> of_type(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (const auto& f : sent) {
            if (f.value("type", "") == type) out.push_back(f);
        }
        return out;
    }

    std::vector<nlohmann::json> sent;
    int close_calls = 0;
    int abort_calls = 0;

private:
    std::string name_;
    bool open_ = true;
};

/// Settable clock for deterministic timestamps.
struct FakeClock {
    int64_t now = 1'700'000'000'000;
    int64_t operator()() const { return now; }
};
