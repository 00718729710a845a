#pragma once

// Scripted in-memory backend for driving elements and commands in tests.
// Every tree is keyed by its absolute path; checkout creates the directory.

#include <quilt/vcs/client.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace quilt_test {

struct FakeTree {
    bool present = false;
    std::string url;
    std::string status_text;
    std::string diff_text;
    bool fail_checkout = false;
    bool fail_update = false;
    bool fail_status = false;
    int delay_ms = 0;
    std::atomic<int> checkouts{0};
    std::atomic<int> updates{0};
    std::string checked_out_version;
};

class FakeBackend {
public:
    std::shared_ptr<FakeTree> tree(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& t = trees_[path.lexically_normal().string()];
        if (!t) t = std::make_shared<FakeTree>();
        return t;
    }

    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    std::vector<std::string> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    bool was_called(const std::string& call) {
        for (const auto& c : calls()) {
            if (c == call) return true;
        }
        return false;
    }

    quilt::vcs::VcsRegistry registry(quilt::ScmType type = quilt::ScmType::Git);

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeTree>> trees_;
    std::vector<std::string> calls_;
};

class FakeClient : public quilt::vcs::VcsClient {
public:
    FakeClient(const std::filesystem::path& path, quilt::ScmType type, FakeBackend& backend)
        : VcsClient(path, 60), type_(type), backend_(backend),
          tree_(backend.tree(path)) {}

    quilt::ScmType type() const override { return type_; }

    bool detect_presence() const override {
        backend_.record("detect:" + path().filename().string());
        return tree_->present;
    }

    quilt::Result<std::string> get_url() const override {
        return quilt::Result<std::string>::ok(tree_->url);
    }

    quilt::Status checkout(const std::string& uri,
                           const std::optional<std::string>& version) const override {
        pause();
        backend_.record("checkout:" + path().filename().string());
        tree_->checkouts++;
        if (tree_->fail_checkout) {
            return quilt::QuiltError{quilt::QuiltError::Vcs, "scripted checkout failure"};
        }
        std::error_code ec;
        std::filesystem::create_directories(path(), ec);
        tree_->present = true;
        tree_->url = uri;
        tree_->checked_out_version = version.value_or("");
        return quilt::ok_status();
    }

    quilt::Status update(const std::optional<std::string>&) const override {
        pause();
        backend_.record("update:" + path().filename().string());
        tree_->updates++;
        if (tree_->fail_update) {
            return quilt::QuiltError{quilt::QuiltError::Vcs, "scripted update failure"};
        }
        return quilt::ok_status();
    }

    quilt::Result<std::string> get_version() const override {
        return quilt::Result<std::string>::ok("fake-rev");
    }

    quilt::Result<std::string> get_status(const std::filesystem::path&, bool) const override {
        pause();
        if (tree_->fail_status) {
            return quilt::QuiltError{quilt::QuiltError::Vcs, "scripted status failure"};
        }
        return quilt::Result<std::string>::ok(tree_->status_text);
    }

    quilt::Result<std::string> get_diff(const std::filesystem::path&) const override {
        pause();
        return quilt::Result<std::string>::ok(tree_->diff_text);
    }

private:
    quilt::ScmType type_;
    FakeBackend& backend_;
    std::shared_ptr<FakeTree> tree_;

    void pause() const {
        if (tree_->delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(tree_->delay_ms));
        }
    }
};

inline quilt::vcs::VcsRegistry FakeBackend::registry(quilt::ScmType type) {
    quilt::vcs::VcsRegistry reg;
    reg.register_backend(type, [this, type](const std::filesystem::path& p) {
        return std::make_unique<FakeClient>(p, type, *this);
    });
    return reg;
}

} // namespace quilt_test
