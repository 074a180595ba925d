#include "vidup/events/event_bus.hpp"
#include "vidup/network/http_router.hpp"
#include "vidup/server/upload_routes.hpp"
#include "vidup/server/upload_service.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using vidup::events::EventBus;
using vidup::network::HttpMethod;
using vidup::network::HttpRequest;
using vidup::network::HttpResponse;
using vidup::network::HttpRouter;
using vidup::server::UploadService;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() / fs::path("vidup_routes_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

class UploadRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        service_ = std::make_unique<UploadService>(root_, bus_);
        vidup::server::register_upload_routes(router_, *service_);
    }

    void TearDown() override {
        service_.reset();
        fs::remove_all(root_);
    }

    HttpResponse send(HttpMethod method, const std::string& url, const std::string& body = "",
                      const std::string& offset = "") {
        HttpRequest request;
        request.method = method;
        request.url = url;
        if (!offset.empty()) {
            request.set_header("Upload-Offset", offset);
        }
        if (!body.empty()) {
            request.set_body(body);
        }
        return router_.handle_request(request);
    }

    std::string open_session(std::uint64_t total) {
        auto response = send(HttpMethod::POST, "/api/uploads",
                             json{{"total_size", total}, {"file_name", "clip.mp4"}, {"title", "T"}}.dump());
        EXPECT_EQ(response.status_code, 201);
        return json::parse(response.body_as_string()).at("session_id").get<std::string>();
    }

    fs::path root_;
    EventBus bus_;
    std::unique_ptr<UploadService> service_;
    HttpRouter router_;
};

json body_of(const HttpResponse& response) {
    return json::parse(response.body_as_string());
}

} // namespace

TEST_F(UploadRoutesTest, FullProtocolOverRouter) {
    const std::string id = open_session(8);

    auto first = send(HttpMethod::PUT, "/api/uploads/" + id + "/chunk", "abcd", "0");
    EXPECT_EQ(first.status_code, 200);
    EXPECT_EQ(body_of(first).at("start_offset").get<std::uint64_t>(), 4u);

    auto status = send(HttpMethod::GET, "/api/uploads/" + id);
    EXPECT_EQ(status.status_code, 200);
    EXPECT_EQ(body_of(status).at("start_offset").get<std::uint64_t>(), 4u);
    EXPECT_EQ(body_of(status).at("file_size").get<std::uint64_t>(), 8u);
    EXPECT_EQ(body_of(status).at("file_name").get<std::string>(), "clip.mp4");

    auto second = send(HttpMethod::PUT, "/api/uploads/" + id + "/chunk", "efgh", "4");
    EXPECT_EQ(body_of(second).at("start_offset").get<std::uint64_t>(), 8u);

    auto finished = send(HttpMethod::POST, "/api/uploads/" + id + "/finish",
                         json{{"title", "Final"}, {"description", "D"}}.dump());
    EXPECT_EQ(finished.status_code, 200);
    EXPECT_TRUE(body_of(finished).at("success").get<bool>());
    EXPECT_FALSE(body_of(finished).at("video_id").get<std::string>().empty());

    auto processing = send(HttpMethod::GET, "/api/uploads/" + id + "/processing");
    EXPECT_EQ(processing.status_code, 200);
    EXPECT_EQ(body_of(processing).at("status").get<std::string>(), "READY");
}

TEST_F(UploadRoutesTest, FinishWithoutBodyIsAccepted) {
    const std::string id = open_session(2);
    ASSERT_EQ(send(HttpMethod::PUT, "/api/uploads/" + id + "/chunk", "ok", "0").status_code, 200);

    auto finished = send(HttpMethod::POST, "/api/uploads/" + id + "/finish");

    EXPECT_EQ(finished.status_code, 200);
}

TEST_F(UploadRoutesTest, MapsServiceErrorsToStatusCodes) {
    const std::string id = open_session(4);

    auto mismatch = send(HttpMethod::PUT, "/api/uploads/" + id + "/chunk", "ab", "2");
    EXPECT_EQ(mismatch.status_code, 409);
    EXPECT_TRUE(body_of(mismatch).contains("error"));

    auto missing_header = send(HttpMethod::PUT, "/api/uploads/" + id + "/chunk", "ab");
    EXPECT_EQ(missing_header.status_code, 400);

    auto bad_header = send(HttpMethod::PUT, "/api/uploads/" + id + "/chunk", "ab", "-1");
    EXPECT_EQ(bad_header.status_code, 400);

    auto unknown = send(HttpMethod::GET, "/api/uploads/nope");
    EXPECT_EQ(unknown.status_code, 404);

    auto incomplete = send(HttpMethod::POST, "/api/uploads/" + id + "/finish");
    EXPECT_EQ(incomplete.status_code, 409);

    auto not_finished = send(HttpMethod::GET, "/api/uploads/" + id + "/processing");
    EXPECT_EQ(not_finished.status_code, 409);
}

TEST_F(UploadRoutesTest, RejectsMalformedStartRequests) {
    EXPECT_EQ(send(HttpMethod::POST, "/api/uploads", "not json").status_code, 400);
    EXPECT_EQ(send(HttpMethod::POST, "/api/uploads", "[1,2]").status_code, 400);
    EXPECT_EQ(send(HttpMethod::POST, "/api/uploads", json{{"file_name", "a.mp4"}}.dump()).status_code, 400);
    EXPECT_EQ(send(HttpMethod::POST, "/api/uploads",
                   json{{"total_size", -5}, {"file_name", "a.mp4"}}.dump()).status_code, 400);
    EXPECT_EQ(send(HttpMethod::POST, "/api/uploads",
                   json{{"total_size", 5}, {"file_name", "../a.mp4"}}.dump()).status_code, 400);
}

TEST_F(UploadRoutesTest, NonStringTextFieldsAreBadRequest) {
    auto start = send(HttpMethod::POST, "/api/uploads",
                      json{{"total_size", 5}, {"file_name", "a.mp4"}, {"title", nullptr}}.dump());
    EXPECT_EQ(start.status_code, 400);
    EXPECT_EQ(body_of(start).at("error").get<std::string>(), "title must be a string");
    EXPECT_EQ(send(HttpMethod::POST, "/api/uploads",
                   json{{"total_size", 5}, {"file_name", 12}}.dump()).status_code, 400);

    const std::string id = open_session(2);
    ASSERT_EQ(send(HttpMethod::PUT, "/api/uploads/" + id + "/chunk", "ok", "0").status_code, 200);
    auto finish = send(HttpMethod::POST, "/api/uploads/" + id + "/finish", json{{"description", 3}}.dump());
    EXPECT_EQ(finish.status_code, 400);
    EXPECT_EQ(send(HttpMethod::POST, "/api/uploads/" + id + "/finish").status_code, 200);
}

TEST_F(UploadRoutesTest, QuotaIsPayloadTooLarge) {
    UploadService limited(root_ / "limited", bus_, 10);
    HttpRouter router;
    vidup::server::register_upload_routes(router, limited);

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/api/uploads";
    request.set_body(json{{"total_size", 11}, {"file_name", "a.mp4"}}.dump());

    EXPECT_EQ(router.handle_request(request).status_code, 413);
}
