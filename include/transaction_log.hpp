#ifndef TXLOG_TRANSACTION_LOG_HPP
#define TXLOG_TRANSACTION_LOG_HPP

#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace txlog {

class Node;

// Shared owning reference. Neighbours hold each other through next_ and prev_,
// so a linked chain is a reference cycle until pop() breaks it.
using Link = std::shared_ptr<Node>;

class Node {
public:
    explicit Node(std::string value) : value_(std::move(value)) {}
    Node(std::string value, Link next, Link prev)
        : value_(std::move(value)), next_(std::move(next)), prev_(std::move(prev)) {}

    // Releases an exclusively owned next_ chain in a loop instead of letting
    // each node's destructor release the next one.
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    static Link make(std::string value) { return std::make_shared<Node>(std::move(value)); }
    static Link make(std::string value, Link next, Link prev) {
        return std::make_shared<Node>(std::move(value), std::move(next), std::move(prev));
    }

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] const Link& next() const noexcept { return next_; }
    [[nodiscard]] const Link& prev() const noexcept { return prev_; }
    [[nodiscard]] bool has_next() const noexcept { return next_ != nullptr; }
    [[nodiscard]] bool has_prev() const noexcept { return prev_ != nullptr; }

    // Shallow: same value and same links present. Neighbours are never compared.
    friend bool operator==(const Node& a, const Node& b) noexcept {
        return a.value_ == b.value_ && a.has_next() == b.has_next() && a.has_prev() == b.has_prev();
    }

private:
    std::string value_;
    Link next_;
    Link prev_;

    friend class TransactionLog;
    friend std::string reclaim(Link node);
};

// Thrown when a detached node is still referenced by someone other than the
// caller of reclaim(). Indicates a missing unlink step; not meant to be handled.
class OwnershipViolation : public std::logic_error {
public:
    OwnershipViolation(const std::string& value, long use_count);

    [[nodiscard]] long use_count() const noexcept { return use_count_; }

private:
    long use_count_;
};

// Moves the value out of a node the caller owns exclusively and releases the node.
// Throws OwnershipViolation if any other owner remains, std::invalid_argument on an empty link.
std::string reclaim(Link node);

// Walks a chain from a starting link without touching the nodes. Each step copies
// the current value out and moves to the neighbour in the requested direction.
class Cursor {
public:
    explicit Cursor(Link start) noexcept : current_(std::move(start)) {}

    std::optional<std::string> next();
    std::optional<std::string> next_back();

    [[nodiscard]] bool exhausted() const noexcept { return current_ == nullptr; }

    std::vector<std::string> collect();
    std::vector<std::string> collect_back();

private:
    Link current_;
};

class TransactionLog {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        Iterator() noexcept = default;
        explicit Iterator(Link node) noexcept : current_(std::move(node)) {}

        reference operator*() const noexcept { return current_->value(); }
        pointer operator->() const noexcept { return &current_->value(); }

        Iterator& operator++() noexcept {
            current_ = current_->next();
            return *this;
        }

        Iterator operator++(int) noexcept {
            Iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const Iterator& other) const noexcept {
            return current_ == other.current_;
        }

    private:
        Link current_;
    };

    TransactionLog() = default;
    ~TransactionLog();

    TransactionLog(const TransactionLog&) = delete;
    TransactionLog& operator=(const TransactionLog&) = delete;

    TransactionLog(TransactionLog&& other) noexcept;
    TransactionLog& operator=(TransactionLog&& other) noexcept;

    void append(std::string value);
    std::optional<std::string> pop();
    void clear();

    [[nodiscard]] std::uint64_t length() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    [[nodiscard]] const Link& head() const noexcept { return head_; }
    [[nodiscard]] const Link& tail() const noexcept { return tail_; }

    [[nodiscard]] Cursor cursor_front() const { return Cursor(head_); }
    [[nodiscard]] Cursor cursor_back() const { return Cursor(tail_); }

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(head_); }
    [[nodiscard]] Iterator end() const noexcept { return Iterator(); }

private:
    Link head_;
    Link tail_;
    std::uint64_t length_{0};
};

// Only local fields are printed; links show up as presence flags.
std::string to_string(const Node& node);
std::string to_string(const TransactionLog& log);

std::ostream& operator<<(std::ostream& os, const Node& node);
std::ostream& operator<<(std::ostream& os, const TransactionLog& log);

} // namespace txlog

template<>
struct std::formatter<txlog::Node> : std::formatter<std::string> {
    auto format(const txlog::Node& node, std::format_context& ctx) const {
        return std::formatter<std::string>::format(txlog::to_string(node), ctx);
    }
};

template<>
struct std::formatter<txlog::TransactionLog> : std::formatter<std::string> {
    auto format(const txlog::TransactionLog& log, std::format_context& ctx) const {
        return std::formatter<std::string>::format(txlog::to_string(log), ctx);
    }
};

#endif // TXLOG_TRANSACTION_LOG_HPP
