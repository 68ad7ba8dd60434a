#include <gtest/gtest.h>
#include "client/console_frontend.hpp"
#include <memory>
#include <sstream>

using namespace peerdrop;

class ConsoleFrontendTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.session.nickname = "alice";
        config_.session.event_queue_capacity = 2;
    }

    std::unique_ptr<Session> make_session() {
        auto session = std::make_unique<Session>(ioc_.get_executor(), config_, SessionConnectors{},
                                                 frontend_.callbacks());
        frontend_.attach(*session);
        return session;
    }

    net::io_context ioc_;
    PeerDropConfig config_;
    std::ostringstream out_;
    ConsoleFrontend frontend_{out_};
};

TEST_F(ConsoleFrontendTest, QuitAndExitStop) {
    EXPECT_FALSE(frontend_.execute("quit"));
    EXPECT_FALSE(frontend_.execute("  exit  "));
    EXPECT_TRUE(frontend_.execute(""));
}

TEST_F(ConsoleFrontendTest, HelpListsCommands) {
    EXPECT_TRUE(frontend_.execute("help"));
    auto text = out_.str();
    EXPECT_NE(text.find("select <path>"), std::string::npos);
    EXPECT_NE(text.find("send <nickname>"), std::string::npos);
    EXPECT_NE(text.find("disconnect"), std::string::npos);
}

TEST_F(ConsoleFrontendTest, CommandsNeedSession) {
    EXPECT_TRUE(frontend_.execute("roster"));
    EXPECT_NE(out_.str().find("! no session"), std::string::npos);
}

TEST_F(ConsoleFrontendTest, VerbsBecomeCommands) {
    auto session = make_session();

    EXPECT_TRUE(frontend_.execute("select /tmp/report.pdf"));
    EXPECT_TRUE(frontend_.execute("roster"));
    EXPECT_EQ(session->pending_events(), 2u);

    // Event bus holds two; the third is refused and printed
    EXPECT_TRUE(frontend_.execute("send bob"));
    EXPECT_NE(out_.str().find("! QUEUE_FULL"), std::string::npos);
    EXPECT_EQ(session->pending_events(), 2u);
}

TEST_F(ConsoleFrontendTest, ArgumentRequired) {
    auto session = make_session();

    EXPECT_TRUE(frontend_.execute("select"));
    EXPECT_TRUE(frontend_.execute("send   "));
    EXPECT_EQ(session->pending_events(), 0u);
    EXPECT_NE(out_.str().find("! unknown command"), std::string::npos);
}

TEST_F(ConsoleFrontendTest, StatusShowsState) {
    auto session = make_session();

    EXPECT_TRUE(frontend_.execute("status"));
    auto text = out_.str();
    EXPECT_NE(text.find("state:    STARTING"), std::string::npos) << text;
    EXPECT_NE(text.find("nickname: -"), std::string::npos) << text;
    EXPECT_NE(text.find("tasks:"), std::string::npos) << text;
}

TEST_F(ConsoleFrontendTest, CallbacksPrintEvents) {
    auto cb = frontend_.callbacks();
    cb.on_roster_updated({"alice", "bob"});
    cb.on_error(SessionError{ErrorKind::TRANSFER, "no file selected"});
    cb.on_file_received("/downloads/abc");

    auto text = out_.str();
    EXPECT_NE(text.find("* online (2): alice bob"), std::string::npos) << text;
    EXPECT_NE(text.find("! TRANSFER: no file selected"), std::string::npos) << text;
    EXPECT_NE(text.find("* received /downloads/abc"), std::string::npos) << text;
}

TEST(InputBridgeTest, PostRunsOnIoContext) {
    net::io_context ioc;
    InputBridge bridge(ioc);
    int runs = 0;

    EXPECT_TRUE(bridge.post([&runs]() { ++runs; }));
    EXPECT_EQ(runs, 0);
    ioc.poll();
    EXPECT_EQ(runs, 1);
}

TEST(InputBridgeTest, PostAfterCloseIsDropped) {
    int runs = 0;
    auto bridge = [&]() {
        net::io_context ioc;
        auto b = std::make_shared<InputBridge>(ioc);
        ioc.run();
        b->close();
        return b;
    }();

    // The io_context is gone; a late line must not reach it
    EXPECT_FALSE(bridge->post([&runs]() { ++runs; }));
    EXPECT_EQ(runs, 0);
}
