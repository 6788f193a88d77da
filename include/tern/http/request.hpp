#pragma once

#include <tern/http/extensions.hpp>
#include <tern/http/http_common.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tern::http {

/// Lazy request body. next_chunk() is called on engine threads, one call
/// at a time; std::nullopt ends the body.
class body_producer {
public:
    virtual ~body_producer() = default;

    virtual std::optional<std::string> next_chunk() = 0;

    /// Rewind for another attempt. Producers that cannot replay return
    /// false and the request is not retried.
    virtual bool restart() { return false; }

    /// Total length if known up front (sent as Content-Length).
    virtual std::optional<uint64_t> size_hint() const { return std::nullopt; }
};

/// Adapts a one-shot generator function
class function_producer : public body_producer {
public:
    explicit function_producer(std::function<std::optional<std::string>()> fn)
        : fn_(std::move(fn)) {}

    std::optional<std::string> next_chunk() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fn_) return std::nullopt;
        return fn_();
    }

private:
    std::mutex mutex_;
    std::function<std::optional<std::string>()> fn_;
};

/// Replayable producer over chunks held in memory
class chunk_list_producer : public body_producer {
public:
    explicit chunk_list_producer(std::vector<std::string> chunks)
        : chunks_(std::move(chunks)) {}

    std::optional<std::string> next_chunk() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pos_ >= chunks_.size()) return std::nullopt;
        return chunks_[pos_++];
    }

    bool restart() override {
        std::lock_guard<std::mutex> lock(mutex_);
        pos_ = 0;
        return true;
    }

    std::optional<uint64_t> size_hint() const override {
        uint64_t total = 0;
        for (const auto& c : chunks_) total += c.size();
        return total;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> chunks_;
    size_t pos_ = 0;
};

/// absent | fixed buffer | lazy producer. Copies share the storage.
class request_body {
public:
    enum class kind : uint8_t { empty, fixed, streaming };

    request_body() = default;

    static request_body from_bytes(std::string bytes) {
        request_body b;
        b.kind_ = kind::fixed;
        b.fixed_ = std::make_shared<const std::string>(std::move(bytes));
        return b;
    }

    static request_body from_producer(std::shared_ptr<body_producer> producer) {
        request_body b;
        if (producer) {
            b.kind_ = kind::streaming;
            b.producer_ = std::move(producer);
        }
        return b;
    }

    kind type() const noexcept { return kind_; }
    bool empty() const noexcept { return kind_ == kind::empty; }

    std::string_view bytes() const noexcept {
        return fixed_ ? std::string_view(*fixed_) : std::string_view{};
    }

    const std::shared_ptr<body_producer>& producer() const noexcept { return producer_; }

    std::optional<uint64_t> length() const {
        switch (kind_) {
            case kind::empty: return 0;
            case kind::fixed: return fixed_->size();
            case kind::streaming: return producer_->size_hint();
        }
        return std::nullopt;
    }

    /// Prepare for a further attempt. Fixed and absent bodies always can.
    bool rewind() const {
        return kind_ != kind::streaming || producer_->restart();
    }

private:
    kind kind_ = kind::empty;
    std::shared_ptr<const std::string> fixed_;
    std::shared_ptr<body_producer> producer_;
};

/// Per-request overrides of configured defaults
struct request_overrides {
    std::optional<std::chrono::milliseconds> total_timeout;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> read_timeout;
    std::optional<std::chrono::milliseconds> write_timeout;
    std::optional<uint32_t> max_attempts;
    std::optional<bool> allow_non_idempotent_retry;
};

/// What the pipeline carries. Treated as immutable once handed to it;
/// stages that add headers work on a copy (bodies are shared, not copied).
struct request_descriptor {
    http::method method;
    http::url target;
    header_list headers;
    request_body body;
    request_overrides overrides;
    http::extensions extensions;

    request_descriptor with_header(std::string_view name, std::string_view value) const {
        request_descriptor copy = *this;
        copy.headers.set(name, value);
        return copy;
    }
};

} // namespace tern::http
