#include <gtest/gtest.h>
#include <smartcalc/session.hpp>

#include <sstream>
#include <string>

namespace {

using smartcalc::Session;
using smartcalc::SessionOptions;

struct Transcript {
    std::string out;
    std::string diag;
    std::size_t failures{0};
};

Transcript run_session(const std::string& input, SessionOptions opts = {}) {
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream diag;
    Session session(in, out, diag, opts);
    Transcript t;
    t.failures = session.run();
    t.out = out.str();
    t.diag = diag.str();
    return t;
}

TEST(Session, ExpressionsAndAssignments) {
    auto t = run_session("a = 5\na + 3\nb + 1\n/exit\n1\n");
    EXPECT_EQ(t.out, "8\nUnknown variable\nBye!\n");
    EXPECT_EQ(t.failures, 1u);
    EXPECT_EQ(t.diag, "");
}

TEST(Session, EveryFailureHasAMessageAndTheSessionContinues) {
    auto t = run_session(
        "1 + \n"
        "5 / 0\n"
        "2 ^ 100\n"
        "a1 = 5\n"
        "a = 1a\n"
        "x\n"
        "1 + 1\n");
    EXPECT_EQ(t.out,
              "Invalid expression\n"
              "Division by zero\n"
              "Result out of range\n"
              "Invalid identifier\n"
              "Invalid assignment\n"
              "Unknown variable\n"
              "2\n");
    EXPECT_EQ(t.failures, 6u);
}

TEST(Session, BlankLinesAndSurroundingSpaceAreIgnored) {
    auto t = run_session("\n   \n  7 - 2  \n\t\n");
    EXPECT_EQ(t.out, "5\n");
    EXPECT_EQ(t.failures, 0u);
}

TEST(Session, EndOfInputStopsQuietly) {
    auto t = run_session("2 * 21");
    EXPECT_EQ(t.out, "42\n");
}

TEST(Session, Commands) {
    auto t = run_session("/help\n/frobnicate\n/exit\n");
    EXPECT_NE(t.out.find("/exit"), std::string::npos);
    EXPECT_NE(t.out.find("Unknown command\n"), std::string::npos);
    EXPECT_EQ(t.out.substr(t.out.size() - 5), "Bye!\n");
    EXPECT_EQ(t.failures, 1u);
}

TEST(Session, ListsVariablesInNameOrder) {
    auto t = run_session("b = 7\na = 5\nc = b\n/vars\n");
    EXPECT_EQ(t.out, "a = 5\nb = 7\nc = 7\n");
}

TEST(Session, VerboseExplainsFailures) {
    SessionOptions opts;
    opts.verbose = true;
    auto t = run_session("b + 1\n/nope\n", opts);
    EXPECT_EQ(t.out, "Unknown variable\nUnknown command\n");
    EXPECT_NE(t.diag.find("smartcalc: Unknown variable: b\n"), std::string::npos) << t.diag;
    EXPECT_NE(t.diag.find("/nope"), std::string::npos) << t.diag;
}

TEST(Session, TracePrintsPostfix) {
    SessionOptions opts;
    opts.echo_tokens = true;
    auto t = run_session("1 + 2 * 3\n", opts);
    EXPECT_EQ(t.out, "7\n");
    EXPECT_EQ(t.diag, "postfix: 1 2 3 * +\n");
}

TEST(Session, PromptBeforeEachRead) {
    SessionOptions opts;
    opts.prompt = "> ";
    auto t = run_session("1\n/exit\n", opts);
    EXPECT_EQ(t.out, "> 1\n> Bye!\n");
}

TEST(Session, HandleLineKeepsScope) {
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream diag;
    Session session(in, out, diag);

    EXPECT_TRUE(session.handle_line("n = 3"));
    EXPECT_TRUE(session.handle_line("n ^ n"));
    EXPECT_FALSE(session.handle_line("/exit"));
    EXPECT_EQ(session.scope().get("n"), 3);
    EXPECT_EQ(out.str(), "27\nBye!\n");
    EXPECT_EQ(session.failures(), 0u);
}

} // namespace
