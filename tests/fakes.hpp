#pragma once

// =============================================================================
// Test doubles for the worker's engine, archive reader and fetcher, and for
// the dispatcher's progress sink
// =============================================================================

#include <gmock/gmock.h>
#include "common/errors.hpp"
#include "common/message.hpp"
#include "common/source_fetcher.hpp"
#include "dispatcher/dispatcher.hpp"
#include "worker/archive.hpp"
#include "worker/engine.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <chrono>

inline std::vector<u8> bytes_of(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

inline std::string text_of(const std::vector<u8>& v) {
    return std::string(v.begin(), v.end());
}

// Binary content with NULs and high bytes
inline std::vector<u8> pattern_bytes(size_t n, u8 seed = 0) {
    std::vector<u8> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = (u8)((i * 131 + seed) & 0xFF);
    return v;
}

class MockEngine : public ConversionEngine {
public:
    MOCK_METHOD(void, load, (), (override));
    MOCK_METHOD(bool, loaded, (), (const, override));
    MOCK_METHOD(std::vector<u8>, run, (const EngineJob& job, const ProgressFn& progress), (override));
};

// "Transcodes" by prefixing the input; reports half-way and done
class PrefixEngine : public ConversionEngine {
public:
    void load() override { loaded_ = true; }
    bool loaded() const override { return loaded_; }

    std::vector<u8> run(const EngineJob& job, const ProgressFn& progress) override {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            jobs_.push_back(job.input_name + " -> " + job.output_name);
        }
        if (progress) {
            progress(0.5);
            progress(1.0);
        }
        std::vector<u8> out = bytes_of("MP4:");
        out.insert(out.end(), job.input.begin(), job.input.end());
        return out;
    }

    std::vector<std::string> jobs() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return jobs_;
    }

private:
    mutable std::mutex       mutex_;
    std::vector<std::string> jobs_;
    bool                     loaded_{false};
};

// Ignores the archive bytes and serves a fixed list of entries
class FakeArchiveReader : public ArchiveReader {
public:
    void add(const std::string& name, const std::vector<u8>& data, bool is_dir = false) {
        entries_.push_back({name, data, is_dir});
    }

    std::unique_ptr<OpenArchive> open(std::vector<u8> bytes) override {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            opened_.push_back(std::move(bytes));
        }
        if (fail_) throw RelayError(ErrorKind::ENGINE_FAILURE, "End of central directory not found");
        auto a = std::make_unique<Archive>();
        for (const auto& e : entries_) {
            ArchiveEntry entry;
            entry.name   = e.name;
            entry.is_dir = e.is_dir;
            std::vector<u8> data = e.data;
            entry.read = [data] { return data; };
            a->list.push_back(std::move(entry));
        }
        return a;
    }

    void set_fail(bool fail) { fail_ = fail; }

    std::vector<std::vector<u8>> opened() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return opened_;
    }

private:
    struct Stored {
        std::string     name;
        std::vector<u8> data;
        bool            is_dir;
    };

    struct Archive : OpenArchive {
        std::vector<ArchiveEntry> list;
        const std::vector<ArchiveEntry>& entries() const override { return list; }
    };

    std::vector<Stored>          entries_;
    bool                         fail_{false};
    mutable std::mutex           mutex_;
    std::vector<std::vector<u8>> opened_;
};

class FakeFetcher : public SourceFetcher {
public:
    void serve(const std::string& url, std::vector<u8> data) { content_[url] = std::move(data); }

    std::vector<u8> fetch(const std::string& url, const ProgressFn& progress) override {
        auto it = content_.find(url);
        if (it == content_.end()) {
            throw RelayError(ErrorKind::NETWORK_FAILURE, "Fetch failed: 404");
        }
        if (progress) progress(it->second.size(), it->second.size());
        return it->second;
    }

private:
    std::map<std::string, std::vector<u8>> content_;
};

class RecordingProgressSink : public ProgressSink {
public:
    void relay(const Progress& p) override {
        std::lock_guard<std::mutex> lk(mutex_);
        seen_.push_back(p);
    }

    std::vector<Progress> seen() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return seen_;
    }

private:
    mutable std::mutex    mutex_;
    std::vector<Progress> seen_;
};

// Collects messages delivered on a port
class MessageCollector {
public:
    void push(Message msg) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            messages_.push_back(std::move(msg));
        }
        cv_.notify_all();
    }

    void disconnected() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Wait until pred holds over the collected messages
    template<typename Pred>
    bool wait_for(Pred pred, int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                            [&] { return pred(messages_); });
    }

    template<typename T>
    bool wait_for_type(int timeout_ms = 5000) {
        return wait_for([](const std::vector<Message>& ms) {
            for (const auto& m : ms) {
                if (std::holds_alternative<T>(m)) return true;
            }
            return false;
        }, timeout_ms);
    }

    bool wait_closed(int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return closed_; });
    }

    std::vector<Message> messages() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return messages_;
    }

    template<typename T>
    std::vector<T> of_type() const {
        std::lock_guard<std::mutex> lk(mutex_);
        std::vector<T> out;
        for (const auto& m : messages_) {
            if (auto* t = std::get_if<T>(&m)) out.push_back(*t);
        }
        return out;
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::vector<Message>    messages_;
    bool                    closed_{false};
};
