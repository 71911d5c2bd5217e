#pragma once
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>
#include <string>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace terrascope {

struct RunRecord {
    long long timestamp = 0;      // seconds since epoch
    std::string command;          // "terraform plan -no-color"
    int exit_code = 0;
    double duration_ms = 0.0;
    std::string output;           // stdout on success, stderr otherwise
};

// Bounded history of terraform executions, persisted as JSON.
class RunLog {
public:
    static constexpr size_t kMaxRecords = 50;

    // An empty path keeps the history in memory only.
    explicit RunLog(std::string history_file = "") : history_file_(std::move(history_file)) {
        load_from_disk();
    }

    void add(const RunRecord& record) {
        std::lock_guard<std::mutex> lock(mtx_);
        records_.push_back(record);
        if (records_.size() > kMaxRecords) records_.pop_front();
        save_to_disk();
    }

    std::vector<RunRecord> records() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return std::vector<RunRecord>(records_.begin(), records_.end());
    }

    // Newest first.
    nlohmann::json to_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"command", it->command},
                {"exit_code", it->exit_code},
                {"duration_ms", it->duration_ms},
                {"output", it->output}
            });
        }
        return j_list;
    }

private:
    std::string history_file_;
    std::deque<RunRecord> records_;
    mutable std::mutex mtx_;

    void save_to_disk() {
        if (history_file_.empty()) return;

        nlohmann::json j = nlohmann::json::array();
        for (const auto& r : records_) {
            j.push_back({
                {"t", r.timestamp},
                {"c", r.command},
                {"x", r.exit_code},
                {"d", r.duration_ms},
                {"o", r.output}
            });
        }

        try {
            // Terraform output is not guaranteed to be UTF-8
            std::string text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

            std::filesystem::path p(history_file_);
            if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
            std::filesystem::path tmp = p;
            tmp += ".tmp";
            {
                std::ofstream o(tmp, std::ios::trunc);
                o << text;
                if (!o) throw std::runtime_error("cannot write " + tmp.string());
            }
            std::filesystem::rename(tmp, p);
        } catch (const std::exception& e) {
            spdlog::error("❌ Failed to save run history to {}: {}", history_file_, e.what());
        }
    }

    void load_from_disk() {
        if (history_file_.empty() || !std::filesystem::exists(history_file_)) return;
        try {
            std::ifstream i(history_file_);
            nlohmann::json j;
            i >> j;
            for (const auto& item : j) {
                RunRecord r;
                r.timestamp = item.value("t", 0LL);
                r.command = item.value("c", "");
                r.exit_code = item.value("x", 0);
                r.duration_ms = item.value("d", 0.0);
                r.output = item.value("o", "");
                records_.push_back(r);
                if (records_.size() > kMaxRecords) records_.pop_front();
            }
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Failed to load run history ({}). Starting fresh.", e.what());
            records_.clear();
        }
    }
};

}
