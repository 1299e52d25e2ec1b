#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/HttpAuthClient.hpp"
#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>

using namespace invoicing;
using namespace invoicing::adapters::secondary;
using ::testing::_;

// ============================================================================
// Mocks
// ============================================================================

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class HttpAuthClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<MockHttpClient>();
        client_ = std::make_shared<HttpAuthClient>(mockHttpClient_, std::make_shared<settings::AuthClientSettings>());
    }

    void expectValidate(int status, const std::string& body) {
        EXPECT_CALL(*mockHttpClient_, send(_, _))
            .WillOnce([status, body](const IRequest& req, IResponse& res) {
                EXPECT_EQ(req.getPath(), "/api/v1/auth/validate");
                EXPECT_EQ(req.getMethod(), "POST");

                auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
                simpleRes.setStatus(status);
                simpleRes.setBody(body);
                return true;
            });
    }

    std::shared_ptr<MockHttpClient> mockHttpClient_;
    std::shared_ptr<HttpAuthClient> client_;
};

TEST_F(HttpAuthClientTest, ResolveActor_ValidToken) {
    expectValidate(200, R"({"valid": true, "user_id": "u-acc", "role": "accountant"})");

    auto actor = client_->resolveActor("token");

    ASSERT_TRUE(actor.has_value());
    EXPECT_EQ(actor->userId, "u-acc");
    EXPECT_EQ(actor->role, domain::UserRole::ACCOUNTANT);
}

TEST_F(HttpAuthClientTest, ResolveActor_InvalidToken) {
    expectValidate(200, R"({"valid": false, "message": "expired"})");

    EXPECT_FALSE(client_->resolveActor("token").has_value());
}

TEST_F(HttpAuthClientTest, ResolveActor_UnknownRole) {
    expectValidate(200, R"({"valid": true, "user_id": "u-x", "role": "janitor"})");

    EXPECT_FALSE(client_->resolveActor("token").has_value());
}

TEST_F(HttpAuthClientTest, Validate_ServiceError) {
    expectValidate(503, "");

    auto result = client_->validateAccessToken("token");

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.message, "Auth service returned 503");
}

TEST_F(HttpAuthClientTest, Validate_GarbageBody) {
    expectValidate(200, "<html>");

    auto result = client_->validateAccessToken("token");

    EXPECT_FALSE(result.valid);
}
