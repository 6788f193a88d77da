#pragma once

#include "io_backend.hpp"

#include <tern/log/macros.hpp>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace tern::io {

/// epoll reactor with one-shot registrations.
///
/// Every fd with pending waiters is armed EPOLLONESHOT for the union of
/// the requested directions and re-armed after each dispatch. All
/// bookkeeping is behind one mutex so waits may be submitted and
/// cancelled from any thread while another thread sits in poll().
class epoll_backend : public io_backend {
public:
    static constexpr size_t MAX_EVENTS = 256;

    epoll_backend() {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::runtime_error(std::string("epoll_create1 failed: ") + strerror(errno));
        }
        wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) {
            int err = errno;
            ::close(epoll_fd_);
            throw std::runtime_error(std::string("eventfd failed: ") + strerror(err));
        }
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = wake_fd_;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
            int err = errno;
            ::close(wake_fd_);
            ::close(epoll_fd_);
            throw std::runtime_error(std::string("epoll_ctl(wake) failed: ") + strerror(err));
        }
        events_.resize(MAX_EVENTS);
        TERN_LOG_DEBUG("epoll_backend initialized (epoll_fd={})", epoll_fd_);
    }

    ~epoll_backend() override {
        std::vector<completion_fn> orphans;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [fd, entry] : fds_) {
                for (auto& w : entry.readers) orphans.push_back(std::move(w.fn));
                for (auto& w : entry.writers) orphans.push_back(std::move(w.fn));
            }
            for (auto& [key, fn] : timers_) orphans.push_back(std::move(fn));
            fds_.clear();
            timers_.clear();
            index_.clear();
        }
        for (auto& fn : orphans) {
            fn(-ECANCELED);
        }
        if (wake_fd_ >= 0) ::close(wake_fd_);
        if (epoll_fd_ >= 0) ::close(epoll_fd_);
    }

    epoll_backend(const epoll_backend&) = delete;
    epoll_backend& operator=(const epoll_backend&) = delete;

    wait_id next_id() noexcept override {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

    void submit_wait(wait_id id, int fd, readiness dir,
                     const coro::cancel_token& token, completion_fn fn) override {
        int arm_error = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!token.is_cancelled()) {
                auto& entry = fds_[fd];
                auto& list = dir == readiness::readable ? entry.readers : entry.writers;
                list.push_back(waiter{id, std::move(fn)});
                index_[id] = location{fd, dir, {}};
                arm_error = arm(fd, entry);
                if (arm_error == 0) {
                    return;
                }
                fn = std::move(list.back().fn);
                list.pop_back();
                index_.erase(id);
                if (entry.readers.empty() && entry.writers.empty()) {
                    fds_.erase(fd);
                }
            }
        }
        if (arm_error != 0) {
            TERN_LOG_ERROR("epoll_ctl failed for fd={}: {}", fd, strerror(arm_error));
            fn(-arm_error);
            return;
        }
        fn(-ECANCELED);
    }

    void submit_timer(wait_id id, clock::time_point deadline,
                      const coro::cancel_token& token, completion_fn fn) override {
        bool earliest = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!token.is_cancelled()) {
                timer_key key{deadline, id};
                earliest = timers_.empty() || key < timers_.begin()->first;
                timers_.emplace(key, std::move(fn));
                index_[id] = location{-1, readiness::readable, deadline};
                fn = nullptr;
            }
        }
        if (fn) {
            fn(-ECANCELED);
            return;
        }
        if (earliest) {
            notify();
        }
    }

    bool cancel(wait_id id) override {
        completion_fn fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(id);
            if (it == index_.end()) {
                return false;
            }
            location loc = it->second;
            index_.erase(it);
            if (loc.fd < 0) {
                auto t = timers_.find(timer_key{loc.deadline, id});
                if (t != timers_.end()) {
                    fn = std::move(t->second);
                    timers_.erase(t);
                }
            } else {
                fn = take_waiter(loc.fd, loc.dir, id);
            }
        }
        if (fn) {
            fn(-ECANCELED);
            return true;
        }
        return false;
    }

    void forget(int fd) override {
        std::vector<completion_fn> orphans;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = fds_.find(fd);
            if (it == fds_.end()) {
                return;
            }
            for (auto* list : {&it->second.readers, &it->second.writers}) {
                for (auto& w : *list) {
                    index_.erase(w.id);
                    orphans.push_back(std::move(w.fn));
                }
            }
            if (it->second.registered) {
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            }
            fds_.erase(it);
        }
        for (auto& fn : orphans) {
            fn(-ECANCELED);
        }
    }

    int poll(std::chrono::milliseconds max_wait) override {
        int timeout_ms = static_cast<int>(max_wait.count());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!timers_.empty()) {
                auto until = timers_.begin()->first.deadline - clock::now();
                auto ms = std::chrono::ceil<std::chrono::milliseconds>(until).count();
                ms = std::max<long long>(ms, 0);
                if (timeout_ms < 0 || ms < timeout_ms) {
                    timeout_ms = static_cast<int>(ms);
                }
            }
        }

        int nfds = epoll_wait(epoll_fd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
        if (nfds < 0 && errno != EINTR) {
            TERN_LOG_ERROR("epoll_wait failed: {}", strerror(errno));
            return -errno;
        }

        std::vector<completion_fn> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int i = 0; i < nfds; ++i) {
                int fd = events_[i].data.fd;
                uint32_t ev = events_[i].events;
                if (fd == wake_fd_) {
                    uint64_t value;
                    while (::read(wake_fd_, &value, sizeof(value)) > 0) {}
                    continue;
                }
                auto it = fds_.find(fd);
                if (it == fds_.end()) {
                    continue;
                }
                auto& entry = it->second;
                entry.registered_events = 0;
                bool failed = (ev & (EPOLLERR | EPOLLHUP)) != 0;
                if (failed || (ev & (EPOLLIN | EPOLLRDHUP))) {
                    drain_list(entry.readers, ready);
                }
                if (failed || (ev & EPOLLOUT)) {
                    drain_list(entry.writers, ready);
                }
                if (entry.readers.empty() && entry.writers.empty()) {
                    fds_.erase(it);
                } else if (int err = arm(fd, entry); err != 0) {
                    TERN_LOG_ERROR("epoll re-arm failed for fd={}: {}", fd, strerror(err));
                }
            }

            auto now = clock::now();
            while (!timers_.empty() && timers_.begin()->first.deadline <= now) {
                auto node = timers_.extract(timers_.begin());
                index_.erase(node.key().id);
                ready.push_back(std::move(node.mapped()));
            }
        }

        for (auto& fn : ready) {
            fn(0);
        }
        return static_cast<int>(ready.size());
    }

    void notify() override {
        uint64_t one = 1;
        ssize_t n = ::write(wake_fd_, &one, sizeof(one));
        (void)n;  // EAGAIN means a wake is already pending
    }

    size_t pending() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

private:
    struct waiter {
        wait_id id;
        completion_fn fn;
    };

    struct fd_entry {
        std::deque<waiter> readers;
        std::deque<waiter> writers;
        bool registered = false;
        uint32_t registered_events = 0;
    };

    struct timer_key {
        clock::time_point deadline;
        wait_id id;
        bool operator<(const timer_key& o) const noexcept {
            return deadline < o.deadline || (deadline == o.deadline && id < o.id);
        }
    };

    struct location {
        int fd;
        readiness dir;
        clock::time_point deadline;
    };

    // Called with mutex_ held. Returns errno on failure.
    int arm(int fd, fd_entry& entry) {
        uint32_t want = EPOLLONESHOT;
        if (!entry.readers.empty()) want |= EPOLLIN | EPOLLRDHUP;
        if (!entry.writers.empty()) want |= EPOLLOUT;
        if (entry.registered && entry.registered_events == want) {
            return 0;
        }
        epoll_event ev{};
        ev.events = want;
        ev.data.fd = fd;
        int rc;
        if (entry.registered) {
            rc = epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
            if (rc < 0 && errno == ENOENT) {
                // fd was closed and its number reused
                rc = epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev);
            }
        } else {
            rc = epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev);
            if (rc < 0 && errno == EEXIST) {
                rc = epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
            }
        }
        if (rc < 0) {
            return errno;
        }
        entry.registered = true;
        entry.registered_events = want;
        return 0;
    }

    void drain_list(std::deque<waiter>& list, std::vector<completion_fn>& out) {
        for (auto& w : list) {
            index_.erase(w.id);
            out.push_back(std::move(w.fn));
        }
        list.clear();
    }

    // Called with mutex_ held.
    completion_fn take_waiter(int fd, readiness dir, wait_id id) {
        auto it = fds_.find(fd);
        if (it == fds_.end()) {
            return nullptr;
        }
        auto& list = dir == readiness::readable ? it->second.readers : it->second.writers;
        auto w = std::find_if(list.begin(), list.end(), [id](const waiter& x) { return x.id == id; });
        if (w == list.end()) {
            return nullptr;
        }
        completion_fn fn = std::move(w->fn);
        list.erase(w);
        if (it->second.readers.empty() && it->second.writers.empty()) {
            if (it->second.registered) {
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            }
            fds_.erase(it);
        } else {
            arm(fd, it->second);
        }
        return fn;
    }

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::vector<epoll_event> events_;
    mutable std::mutex mutex_;
    std::unordered_map<int, fd_entry> fds_;
    std::map<timer_key, completion_fn> timers_;
    std::unordered_map<wait_id, location> index_;
    std::atomic<wait_id> next_id_{1};
};

} // namespace tern::io
