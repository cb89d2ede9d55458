#include <gtest/gtest.h>
#include "chat_hub.hpp"
#include "fake_completion_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace chathub;
using chathub::test_support::FakeCompletionServer;
namespace json = boost::json;
namespace http = boost::beast::http;

namespace {

// A connected client whose send loop is the test itself.
struct Peer {
    std::shared_ptr<OutboundQueue> queue;
    std::shared_ptr<Client> client;

    const std::string& id() const { return client->id(); }

    std::vector<json::object> drain() {
        std::vector<json::object> out;
        while (auto payload = queue->pop()) {
            out.push_back(json::parse(*payload).as_object());
        }
        return out;
    }

    json::object only() {
        auto messages = drain();
        EXPECT_EQ(messages.size(), 1u);
        return messages.empty() ? json::object{} : messages.front();
    }
};

std::string str(const json::object& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || !it->value().is_string()) return "<missing>";
    return std::string(it->value().as_string());
}

}

class ChatHubTest : public ::testing::Test {
protected:
    ServerConfig config_;
    net::io_context ioc_;
    ssl::context tls_{ssl::context::tls_client};
    AiGateway ai_{ioc_.get_executor(), tls_, config_.ai};
    ChatHub hub_{config_, ai_};

    Peer join(const std::string& ip = "10.0.0.1", size_t capacity = 256) {
        Peer peer;
        peer.queue = std::make_shared<OutboundQueue>(capacity);
        peer.client = hub_.connect(ip, peer.queue);
        return peer;
    }

    void send(const Peer& peer, const std::string& frame) {
        hub_.handle_text(peer.id(), frame);
    }

    void run_pending() {
        ioc_.run();
        ioc_.restart();
    }
};

TEST_F(ChatHubTest, NewcomerGetsGuestNameAndOthersAreTold) {
    auto a = join();
    auto ack = a.only();
    EXPECT_EQ(str(ack, "type"), "ackName");
    EXPECT_EQ(str(ack, "name"), "guest-" + a.id().substr(0, 6));
    EXPECT_EQ(a.id().size(), 36u);

    auto b = join();
    EXPECT_EQ(str(b.only(), "type"), "ackName");

    auto notice = a.only();
    EXPECT_EQ(str(notice, "type"), "system");
    EXPECT_EQ(str(notice, "text"), b.client->name() + " heeft de chat betreden.");

    EXPECT_EQ(hub_.connections().connection_count(), 2u);
    EXPECT_EQ(hub_.stats().connections_total(), 2u);
    EXPECT_EQ(hub_.stats().peak_users(), 2u);
}

TEST_F(ChatHubTest, RenameThenChatReachesEveryone) {
    auto a = join();
    auto b = join();
    std::string old_name = a.client->name();
    a.drain();
    b.drain();

    send(a, R"({"type":"setName","name":"  alice "})");
    auto ack = a.only();
    EXPECT_EQ(str(ack, "type"), "ackName");
    EXPECT_EQ(str(ack, "name"), "alice");
    EXPECT_EQ(str(b.only(), "text"), old_name + " heet nu alice.");

    send(a, R"({"type":"chat","text":" hoi allemaal "})");
    for (Peer* p : {&a, &b}) {
        auto chat = p->only();
        EXPECT_EQ(str(chat, "type"), "chat");
        EXPECT_EQ(str(chat, "from"), "alice");
        EXPECT_EQ(str(chat, "text"), "hoi allemaal");
        EXPECT_TRUE(chat.at("at").is_int64());
    }
    EXPECT_EQ(hub_.stats().messages_sent(), 1u);
}

TEST_F(ChatHubTest, InvalidChatIsAnsweredToSenderOnly) {
    auto a = join();
    auto b = join();
    a.drain();
    b.drain();

    send(a, R"({"type":"chat","text":")" + std::string(501, 'x') + R"("})");
    auto error = a.only();
    EXPECT_EQ(str(error, "type"), "error");
    EXPECT_EQ(str(error, "message"), "Message is too long (max 500 characters).");

    send(a, R"({"type":"chat","text":"   "})");
    EXPECT_EQ(str(a.only(), "message"), "Message cannot be empty.");

    EXPECT_TRUE(b.drain().empty());
    EXPECT_EQ(hub_.stats().messages_sent(), 0u);
}

TEST_F(ChatHubTest, RejectedNameLeavesNameUnchanged) {
    auto a = join();
    auto b = join();
    std::string original = a.client->name();
    a.drain();
    b.drain();

    send(a, R"({"type":"setName","name":"x"})");
    EXPECT_EQ(str(a.only(), "message"), "Naam moet tussen 2 en 32 tekens zijn.");

    send(a, R"({"type":"setName","name":"<script>"})");
    EXPECT_EQ(str(a.only(), "message"), "Naam mag alleen letters, cijfers, spaties, - en _ bevatten.");

    EXPECT_EQ(a.client->name(), original);
    EXPECT_TRUE(b.drain().empty());
}

TEST_F(ChatHubTest, ProtocolErrorsAreReported) {
    auto a = join();
    a.drain();

    send(a, "{not json");
    EXPECT_EQ(str(a.only(), "message"), "Bericht moet geldig JSON zijn.");

    send(a, R"({"type":"dance"})");
    EXPECT_EQ(str(a.only(), "message"), "Onbekend berichttype.");

    send(a, R"({"type":"chat"})");
    EXPECT_EQ(str(a.only(), "message"), "Onvolledig bericht.");
}

TEST_F(ChatHubTest, PingEchoesToken) {
    auto a = join();
    a.drain();

    send(a, R"({"type":"ping","token":"abc"})");
    auto pong = a.only();
    EXPECT_EQ(str(pong, "type"), "pong");
    EXPECT_EQ(str(pong, "token"), "abc");

    send(a, R"({"type":"ping"})");
    EXPECT_TRUE(a.only().at("token").is_null());
}

TEST_F(ChatHubTest, StatusAndListUsers) {
    auto a = join("10.0.0.1");
    auto b = join("10.0.0.2");
    a.drain();
    b.drain();

    send(a, R"({"type":"chat","text":"een"})");
    a.drain();
    b.drain();

    send(a, R"({"type":"status"})");
    auto status = a.only();
    EXPECT_EQ(str(status, "type"), "status");
    EXPECT_EQ(status.at("userCount").to_number<int>(), 2);
    EXPECT_EQ(status.at("peakUsers").to_number<int>(), 2);
    EXPECT_EQ(status.at("connectionsTotal").to_number<int>(), 2);
    EXPECT_EQ(status.at("messagesSent").to_number<int>(), 1);
    EXPECT_EQ(str(status, "version"), CHATHUB_VERSION);
    EXPECT_FALSE(status.at("aiEnabled").as_bool());
    EXPECT_FALSE(status.contains("aiModel"));
    EXPECT_TRUE(b.drain().empty());

    send(b, R"({"type":"listUsers"})");
    auto list = b.only();
    const auto& users = list.at("users").as_array();
    ASSERT_EQ(users.size(), 2u);
    bool saw_b = false;
    for (const auto& u : users) {
        if (str(u.as_object(), "id") == b.id()) {
            saw_b = true;
            EXPECT_EQ(str(u.as_object(), "ip"), "10.0.0.2");
        }
    }
    EXPECT_TRUE(saw_b);
}

TEST_F(ChatHubTest, ChatRateLimitPerConnection) {
    config_.chat_rate_limit_enabled = true;
    config_.chat_messages_per_minute = 2;

    auto a = join();
    auto b = join();
    a.drain();
    b.drain();

    send(a, R"({"type":"chat","text":"1"})");
    send(a, R"({"type":"chat","text":"2"})");
    send(a, R"({"type":"chat","text":"3"})");

    auto messages = a.drain();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(str(messages[2], "type"), "error");
    std::string text = str(messages[2], "message");
    EXPECT_EQ(text.rfind("Rate limit exceeded. Please wait ", 0), 0u) << text;
    EXPECT_NE(text.find(" seconds."), std::string::npos) << text;

    EXPECT_EQ(b.drain().size(), 2u);
    EXPECT_EQ(hub_.stats().messages_sent(), 2u);

    // The other connection has its own window.
    send(b, R"({"type":"chat","text":"b1"})");
    EXPECT_EQ(str(b.only(), "type"), "chat");
}

TEST_F(ChatHubTest, FullQueueDoesNotStallOthers) {
    auto slow = join("10.0.0.9", 1);
    auto a = join();
    auto b = join();
    a.drain();
    b.drain();
    // slow still holds its own ackName, every later notice was dropped for it.
    EXPECT_EQ(slow.queue->size(), 1u);

    for (int i = 0; i < 5; ++i) {
        send(a, R"({"type":"chat","text":"burst"})");
    }

    EXPECT_EQ(a.drain().size(), 5u);
    EXPECT_EQ(b.drain().size(), 5u);
    EXPECT_EQ(slow.drain().size(), 1u);
    EXPECT_TRUE(hub_.connections().is_online(slow.id()));
}

TEST_F(ChatHubTest, DisconnectAnnouncesFinalNameOnce) {
    auto a = join();
    auto b = join();
    send(b, R"({"type":"setName","name":"bob"})");
    a.drain();

    hub_.disconnect(b.id());
    hub_.disconnect(b.id());

    EXPECT_TRUE(b.queue->is_closed());
    auto notices = a.drain();
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(str(notices[0], "text"), "bob heeft de chat verlaten.");
    EXPECT_EQ(hub_.connections().connection_count(), 1u);
    EXPECT_EQ(hub_.stats().peak_users(), 2u);

    // Frames racing with cleanup are ignored.
    hub_.handle_text(b.id(), R"({"type":"chat","text":"ghost"})");
    EXPECT_TRUE(a.drain().empty());
}

TEST_F(ChatHubTest, CloseAllClosesQueuesWithoutNotice) {
    auto a = join();
    auto b = join();
    a.drain();
    b.drain();

    hub_.close_all();

    EXPECT_TRUE(a.queue->is_closed());
    EXPECT_TRUE(b.queue->is_closed());
    EXPECT_TRUE(a.drain().empty());
}

TEST_F(ChatHubTest, ConnectIsRefusedAfterCloseAll) {
    auto a = join();
    a.drain();

    hub_.close_all();
    EXPECT_TRUE(hub_.is_closing());

    auto late = std::make_shared<OutboundQueue>(16);
    EXPECT_THROW(hub_.connect("10.0.0.9", late), std::runtime_error);

    EXPECT_TRUE(late->is_closed());
    EXPECT_EQ(late->pop(), nullptr);
    EXPECT_EQ(hub_.connections().connection_count(), 1u);
    EXPECT_EQ(hub_.stats().connections_total(), 1u);
    EXPECT_TRUE(a.drain().empty());
}

TEST_F(ChatHubTest, ClientRecordsConnectTime) {
    auto before = std::chrono::system_clock::now();
    auto a = join();
    auto after = std::chrono::system_clock::now();

    EXPECT_LE(before, a.client->connected_at());
    EXPECT_GE(after, a.client->connected_at());

    hub_.disconnect(a.id());
    EXPECT_EQ(hub_.connections().connection_count(), 0u);
}

TEST_F(ChatHubTest, AiDisabledIsReportedAsynchronously) {
    auto a = join();
    a.drain();

    send(a, R"({"type":"ai","prompt":"hallo"})");
    EXPECT_TRUE(a.drain().empty());

    run_pending();
    auto error = a.only();
    EXPECT_EQ(str(error, "type"), "error");
    EXPECT_EQ(str(error, "message"), "AI is niet geactiveerd op deze server.");
}

TEST(ChatHubAiTest, CompletionIsBroadcastToEveryone) {
    FakeCompletionServer server([](const auto&) {
        return FakeCompletionServer::json_reply(http::status::ok,
            R"({"choices":[{"message":{"content":"Vier."}}],"usage":{"total_tokens":9}})");
    });

    ServerConfig config;
    config.ai.enabled = true;
    config.ai.api_key = "sk-test";
    config.ai.api_url = server.url();

    net::io_context ioc;
    ssl::context tls{ssl::context::tls_client};
    AiGateway ai(ioc.get_executor(), tls, config.ai);
    ChatHub hub(config, ai);

    auto qa = std::make_shared<OutboundQueue>(16);
    auto qb = std::make_shared<OutboundQueue>(16);
    auto a = hub.connect("10.0.0.1", qa);
    auto b = hub.connect("10.0.0.2", qb);
    hub.handle_text(a->id(), R"({"type":"setName","name":"alice"})");
    while (qa->pop()) {}
    while (qb->pop()) {}

    hub.handle_text(a->id(), R"({"type":"ai","prompt":"wat is 2+2?"})");
    ioc.run();
    server.join();

    for (auto* queue : {qa.get(), qb.get()}) {
        auto payload = queue->pop();
        ASSERT_NE(payload, nullptr);
        auto obj = json::parse(*payload).as_object();
        EXPECT_EQ(str(obj, "type"), "ai");
        EXPECT_EQ(str(obj, "from"), "alice");
        EXPECT_EQ(str(obj, "prompt"), "wat is 2+2?");
        EXPECT_EQ(str(obj, "response"), "Vier.");
        EXPECT_EQ(obj.at("tokens").to_number<int>(), 9);
        EXPECT_FALSE(obj.contains("cost"));
        EXPECT_EQ(queue->pop(), nullptr);
    }

    hub.handle_text(a->id(), R"({"type":"status"})");
    auto status = json::parse(*qa->pop()).as_object();
    EXPECT_TRUE(status.at("aiEnabled").as_bool());
    EXPECT_EQ(str(status, "aiModel"), "openai/gpt-4o");
}
