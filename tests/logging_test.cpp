#include <gtest/gtest.h>
#include "../include/logging.hpp"
#include "../include/transaction_log.hpp"
#include <iostream>
#include <sstream>
#include <string>

namespace {

// Swaps std::cerr's buffer for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }

    [[nodiscard]] std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

} // namespace

TEST(LoggingTest, PrefixNamesCallerFile) {
    CerrCapture capture;
    txlog::log_message("appended {} entries", 3);

    const std::string out = capture.str();
    EXPECT_EQ(out.front(), '[');
    EXPECT_NE(out.find("logging_test.cpp:"), std::string::npos);
    EXPECT_NE(out.find(" - appended 3 entries\n"), std::string::npos);
}

TEST(LoggingTest, FormatsNodesShallowly) {
    txlog::TransactionLog log;
    log.append("a");
    log.append("b");

    CerrCapture capture;
    txlog::log_message("head is {}", *log.head());

    EXPECT_NE(capture.str().find("head is Node { value: \"a\", has_prev: false, has_next: true }"),
              std::string::npos);
}

TEST(LoggingTest, OwnershipViolationIsLogged) {
    txlog::Link node = txlog::Node::make("held");
    txlog::Link extra = node;

    CerrCapture capture;
    EXPECT_THROW(txlog::reclaim(std::move(node)), txlog::OwnershipViolation);
    EXPECT_NE(capture.str().find("ownership violation: node \"held\" still has 2 owners"),
              std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
