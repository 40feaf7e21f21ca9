#include "transaction_log.hpp"

#include <utility>

#include "common.hpp"
#include "logging.hpp"

namespace txlog {

Node::~Node() {
    Link next = std::move(next_);
    while (next && next.use_count() == 1) {
        next = std::move(next->next_);
    }
}

OwnershipViolation::OwnershipViolation(const std::string& value, long use_count)
    : std::logic_error(std::format("node \"{}\" reclaimed while held by {} owners", value, use_count)),
      use_count_(use_count) {}

std::string reclaim(Link node) {
    if (!node) {
        throw std::invalid_argument("reclaim called with an empty link");
    }

    const long owners = node.use_count();
    if constexpr (TRACE_OWNERSHIP) {
        log_message("reclaiming node \"{}\" with {} owner(s)", node->value_, owners);
    }
    if (owners != RECLAIM_USE_COUNT) {
        log_message("ownership violation: node \"{}\" still has {} owners", node->value_, owners);
        throw OwnershipViolation(node->value_, owners);
    }

    std::string value = std::move(node->value_);
    node.reset();
    return value;
}

std::optional<std::string> Cursor::next() {
    if (!current_) {
        return std::nullopt;
    }
    std::string value = current_->value();
    current_ = current_->next();
    return value;
}

std::optional<std::string> Cursor::next_back() {
    if (!current_) {
        return std::nullopt;
    }
    std::string value = current_->value();
    current_ = current_->prev();
    return value;
}

std::vector<std::string> Cursor::collect() {
    std::vector<std::string> values;
    while (auto value = next()) {
        values.push_back(std::move(*value));
    }
    return values;
}

std::vector<std::string> Cursor::collect_back() {
    std::vector<std::string> values;
    while (auto value = next_back()) {
        values.push_back(std::move(*value));
    }
    return values;
}

// A long chain would otherwise be released one destructor inside the next.
TransactionLog::~TransactionLog() {
    clear();
}

TransactionLog::TransactionLog(TransactionLog&& other) noexcept
    : head_(std::move(other.head_)),
      tail_(std::move(other.tail_)),
      length_(std::exchange(other.length_, 0)) {}

TransactionLog& TransactionLog::operator=(TransactionLog&& other) noexcept {
    if (this != &other) {
        clear();
        head_ = std::move(other.head_);
        tail_ = std::move(other.tail_);
        length_ = std::exchange(other.length_, 0);
    }
    return *this;
}

void TransactionLog::append(std::string value) {
    Link node = Node::make(std::move(value));
    if (tail_) {
        tail_->next_ = node;
        node->prev_ = std::move(tail_);
    } else {
        head_ = node;
    }
    tail_ = std::move(node);
    ++length_;
}

std::optional<std::string> TransactionLog::pop() {
    if (!head_) {
        return std::nullopt;
    }

    Link head = std::move(head_);
    if (Link next = std::move(head->next_)) {
        // the successor's back-reference is the only other owner left
        next->prev_.reset();
        head_ = std::move(next);
    } else {
        tail_.reset();
    }
    --length_;

    return reclaim(std::move(head));
}

void TransactionLog::clear() {
    while (pop()) {
    }
}

std::string to_string(const Node& node) {
    return std::format("Node {{ value: \"{}\", has_prev: {}, has_next: {} }}",
                       node.value(), node.has_prev(), node.has_next());
}

std::string to_string(const TransactionLog& log) {
    return std::format("TransactionLog {{ length: {}, head: {}, tail: {} }}",
                       log.length(),
                       log.head() ? to_string(*log.head()) : std::string("none"),
                       log.tail() ? to_string(*log.tail()) : std::string("none"));
}

std::ostream& operator<<(std::ostream& os, const Node& node) {
    return os << to_string(node);
}

std::ostream& operator<<(std::ostream& os, const TransactionLog& log) {
    return os << to_string(log);
}

} // namespace txlog
