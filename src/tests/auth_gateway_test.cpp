#include <gtest/gtest.h>
#include <functional>
#include "server/auth_gateway.hpp"
#include "test_utils.hpp"

using namespace histvault;
using namespace histvault::server;

class AuthGatewayTest : public ::testing::Test {
protected:
    ServerDatabase database{":memory:"};
    AuthGateway auth{database, true};

    void SetUp() override {
        test::init_test_logging();
    }

    static unsigned status_of(const std::function<void()>& call) {
        try {
            call();
        } catch (const ApiError& e) {
            return e.status();
        }
        return 200;
    }
};

TEST_F(AuthGatewayTest, RegisterIssuesSession) {
    const auto registered = auth.register_user(api::RegisterRequest{"alice", "alice@example.com", "hunter2"});

    EXPECT_EQ(registered.session.size(), AuthGateway::TOKEN_SIZE * 2);
    EXPECT_EQ(auth.authenticate("Token " + registered.session).username, "alice");

    // stored password is hashed
    EXPECT_NE(database.get_user("alice")->password, "hunter2");
}

TEST_F(AuthGatewayTest, LoginIssuesNewSession) {
    const auto registered = auth.register_user(api::RegisterRequest{"alice", "alice@example.com", "hunter2"});
    const auto logged_in = auth.login(api::LoginRequest{"alice", "hunter2"});

    EXPECT_NE(logged_in.session, registered.session);
    EXPECT_EQ(auth.authenticate("Token " + logged_in.session).username, "alice");
    EXPECT_EQ(auth.authenticate("Token " + registered.session).username, "alice");
}

TEST_F(AuthGatewayTest, RegistrationFailures) {
    auth.register_user(api::RegisterRequest{"alice", "alice@example.com", "hunter2"});

    EXPECT_EQ(status_of([&] { auth.register_user({"alice", "other@example.com", "pw"}); }), 409u);
    EXPECT_EQ(status_of([&] { auth.register_user({"carol", "alice@example.com", "pw"}); }), 409u);
    EXPECT_EQ(status_of([&] { auth.register_user({"", "x@example.com", "pw"}); }), 400u);
    EXPECT_EQ(status_of([&] { auth.register_user({"dave", "dave@example.com", ""}); }), 400u);

    AuthGateway closed(database, false);
    EXPECT_EQ(status_of([&] { closed.register_user({"erin", "erin@example.com", "pw"}); }), 403u);
}

TEST_F(AuthGatewayTest, LoginFailures) {
    auth.register_user(api::RegisterRequest{"alice", "alice@example.com", "hunter2"});

    EXPECT_EQ(status_of([&] { auth.login({"alice", "wrong"}); }), 401u);
    EXPECT_EQ(status_of([&] { auth.login({"nobody", "hunter2"}); }), 401u);
}

TEST_F(AuthGatewayTest, AuthenticateRejectsBadHeaders) {
    EXPECT_EQ(status_of([&] { auth.authenticate(""); }), 401u);
    EXPECT_EQ(status_of([&] { auth.authenticate("Token "); }), 401u);
    EXPECT_EQ(status_of([&] { auth.authenticate("Bearer abc"); }), 401u);
    EXPECT_EQ(status_of([&] { auth.authenticate("Token not-a-session"); }), 401u);
}

TEST_F(AuthGatewayTest, PasswordHashFormat) {
    const auto encoded = AuthGateway::hash_password("correct horse");

    EXPECT_EQ(encoded.rfind("pbkdf2-sha256$100000$", 0), 0u) << encoded;
    EXPECT_NE(encoded, AuthGateway::hash_password("correct horse"));
    EXPECT_TRUE(AuthGateway::verify_password("correct horse", encoded));
    EXPECT_FALSE(AuthGateway::verify_password("correct horse!", encoded));
}

TEST_F(AuthGatewayTest, CorruptHashNeverVerifies) {
    EXPECT_FALSE(AuthGateway::verify_password("pw", ""));
    EXPECT_FALSE(AuthGateway::verify_password("pw", "plaintext"));
    EXPECT_FALSE(AuthGateway::verify_password("pw", "md5$1$AAAA$AAAA"));
    EXPECT_FALSE(AuthGateway::verify_password("pw", "pbkdf2-sha256$abc$AAAA$AAAA"));
    EXPECT_FALSE(AuthGateway::verify_password("pw", "pbkdf2-sha256$1000$!!!$AAAA"));
}
