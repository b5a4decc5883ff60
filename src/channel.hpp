#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Unbounded multi-producer / single-consumer queue. recv() returns nullopt
// once the queue is empty and every Sender has been destroyed or closed.
// The Channel must outlive all of its Senders.
template<typename T>
class Channel {
public:
    class Sender {
    public:
        Sender(const Sender& o) : ch(o.ch) { if (ch) ch->add_sender(); }
        Sender(Sender&& o) noexcept : ch(o.ch) { o.ch = nullptr; }
        Sender& operator=(const Sender&) = delete;
        Sender& operator=(Sender&&)      = delete;
        ~Sender() { close(); }

        void send(T value) { ch->push(std::move(value)); }

        void close()
        {
            if (ch) {
                ch->release_sender();
                ch = nullptr;
            }
        }

    private:
        friend class Channel;
        explicit Sender(Channel* c) : ch(c) { ch->add_sender(); }

        Channel* ch;
    };

    Channel() = default;
    Channel(const Channel&)            = delete;
    Channel& operator=(const Channel&) = delete;

    Sender sender() { return Sender(this); }

    std::optional<T> recv()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return !items.empty() || senders == 0; });
        if (items.empty()) return std::nullopt;
        T value = std::move(items.front());
        items.pop_front();
        return value;
    }

private:
    void push(T value)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            items.push_back(std::move(value));
        }
        cv.notify_one();
    }

    void add_sender()
    {
        std::lock_guard<std::mutex> lock(mtx);
        ++senders;
    }

    void release_sender()
    {
        bool last;
        {
            std::lock_guard<std::mutex> lock(mtx);
            last = (--senders == 0);
        }
        if (last) cv.notify_all();
    }

    std::deque<T>           items;
    std::mutex              mtx;
    std::condition_variable cv;
    int                     senders = 0;
};
