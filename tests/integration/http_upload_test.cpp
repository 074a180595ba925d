#include "vidup/core/config.hpp"
#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include "vidup/network/http_router.hpp"
#include "vidup/network/http_server_asio.hpp"
#include "vidup/network/http_upload_api.hpp"
#include "vidup/network/socket.hpp"
#include "vidup/server/upload_routes.hpp"
#include "vidup/server/upload_service.hpp"
#include "vidup/upload/media_source.hpp"
#include "vidup/upload/resume_negotiator.hpp"
#include "vidup/upload/upload_controller.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
namespace asio = boost::asio;
using vidup::events::ChunkAcknowledgedEvent;
using vidup::events::EventBus;
using vidup::events::UploadFailedEvent;
using vidup::network::HttpContext;
using vidup::network::HttpMethod;
using vidup::network::HttpRequest;
using vidup::network::HttpResponse;
using vidup::network::HttpRouter;
using vidup::network::HttpServerAsio;
using vidup::network::HttpStatus;
using vidup::network::HttpUploadApi;
using vidup::server::UploadService;
using vidup::upload::ErrorKind;
using vidup::upload::MemoryMediaSource;
using vidup::upload::ProcessingState;
using vidup::upload::ResumeNegotiator;
using vidup::upload::UploadConfig;
using vidup::upload::UploadController;
using vidup::upload::UploadMetadata;
using vidup::upload::UploadStatus;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() / fs::path("vidup_http_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::shared_ptr<MemoryMediaSource> make_source(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xff);
    }
    return std::make_shared<MemoryMediaSource>("lecture.mp4", std::move(data));
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * Upload server on an ephemeral loopback port, driven by a background thread
 */
class HttpUploadTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        service_ = std::make_unique<UploadService>(root_, server_bus_);
        vidup::server::register_upload_routes(router_, *service_);

        // Replaces finish and status replies with type-mismatched fields
        router_.use([this](const HttpContext& ctx, HttpResponse& response) {
            if (!mistyped_replies_.load()) {
                return true;
            }
            const std::string& url = ctx.request.url;
            if (ctx.request.method == HttpMethod::POST && ends_with(url, "/finish")) {
                response = vidup::network::json_response(HttpStatus::OK, R"({"success":true,"video_id":null})");
                return false;
            }
            if (ctx.request.method == HttpMethod::GET && !ends_with(url, "/processing")) {
                response = vidup::network::json_response(
                    HttpStatus::OK, R"({"start_offset":0,"file_size":2048,"file_name":7})");
                return false;
            }
            return true;
        });

        server_ = std::make_unique<HttpServerAsio>(io_context_, 0, "127.0.0.1");
        server_->set_handler([this](const HttpRequest& request) {
            return router_.handle_request(request);
        });
        io_thread_ = std::thread([this] { io_context_.run(); });

        config_.host = "127.0.0.1";
        config_.port = server_->get_port();
        config_.request_timeout = std::chrono::seconds(10);
    }

    void TearDown() override {
        io_context_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        server_.reset();
        service_.reset();
        fs::remove_all(root_);
    }

    fs::path root_;
    EventBus server_bus_;
    EventBus client_bus_;
    HttpRouter router_;
    std::unique_ptr<UploadService> service_;
    asio::io_context io_context_;
    std::unique_ptr<HttpServerAsio> server_;
    std::thread io_thread_;
    std::atomic<bool> mistyped_replies_{false};
    vidup::ClientConfig config_;
    const UploadConfig upload_config_{64 * 1024, 1024};
};

} // namespace

TEST_F(HttpUploadTest, UploadsFileEndToEnd) {
    HttpUploadApi api(config_);
    UploadController controller(api, client_bus_, upload_config_);
    auto source = make_source(200 * 1024);

    auto result = controller.start_upload(source, UploadMetadata{"Lecture", "Week 1"});

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(controller.status(), UploadStatus::Completed);
    EXPECT_EQ(controller.chunks_sent(), 4u);
    EXPECT_FALSE(controller.video_id().empty());

    const std::string session_id = controller.session().session_id;
    auto record = service_->record(session_id);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().title, "Lecture");
    EXPECT_EQ(record.value().video_id, controller.video_id());
    const auto& data = source->data();
    EXPECT_EQ(read_file(record.value().published_path), std::string(data.begin(), data.end()));

    auto processing = api.query_processing(session_id);
    ASSERT_TRUE(processing.is_ok()) << processing.error();
    EXPECT_EQ(processing.value(), ProcessingState::Ready);
}

TEST_F(HttpUploadTest, PausedUploadResumesThroughNewController) {
    HttpUploadApi api(config_);
    auto source = make_source(200 * 1024);
    std::string session_id;
    {
        UploadController first(api, client_bus_, upload_config_);
        auto id = client_bus_.subscribe<ChunkAcknowledgedEvent>([&](const ChunkAcknowledgedEvent& e) {
            if (e.chunk_index == 2) {
                first.pause();
            }
        });
        ASSERT_TRUE(first.start_upload(source).is_ok());
        client_bus_.unsubscribe<ChunkAcknowledgedEvent>(id);

        EXPECT_EQ(first.status(), UploadStatus::Paused);
        EXPECT_EQ(first.session().offset, 128u * 1024);
        session_id = first.session().session_id;
    }

    auto status = api.query_session(session_id);
    ASSERT_TRUE(status.is_ok()) << status.error();
    EXPECT_EQ(status.value().start_offset, 128u * 1024);
    EXPECT_EQ(status.value().file_size, 200u * 1024);
    EXPECT_EQ(status.value().file_name, "lecture.mp4");

    ResumeNegotiator negotiator(api, client_bus_, upload_config_);
    auto resumed = negotiator.resume(session_id, source);
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().describe();

    auto result = resumed.value()->resume();

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(resumed.value()->status(), UploadStatus::Completed);
    EXPECT_EQ(resumed.value()->chunks_sent(), 2u);

    auto record = service_->record(session_id);
    ASSERT_TRUE(record.is_ok());
    const auto& data = source->data();
    EXPECT_EQ(read_file(record.value().published_path), std::string(data.begin(), data.end()));
}

TEST_F(HttpUploadTest, ServerErrorsSurfaceAsCallErrors) {
    HttpUploadApi api(config_);

    auto unknown = api.query_session("does-not-exist");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_NE(unknown.error().find("HTTP 404"), std::string::npos);

    vidup::upload::StartRequest start;
    start.total_size = 10;
    start.file_name = "clip.mp4";
    auto opened = api.start_session(start);
    ASSERT_TRUE(opened.is_ok()) << opened.error();

    vidup::upload::ChunkRequest stale;
    stale.session_id = opened.value().session_id;
    stale.start_offset = 5;
    stale.data = {1, 2, 3};
    auto rejected = api.transfer_chunk(stale);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_NE(rejected.error().find("HTTP 409"), std::string::npos);

    auto bad_id = api.query_session("a/b");
    EXPECT_TRUE(bad_id.is_error());
}

TEST_F(HttpUploadTest, NonStringVideoIdFailsFinalization) {
    mistyped_replies_.store(true);
    HttpUploadApi api(config_);
    UploadController controller(api, client_bus_, upload_config_);
    std::vector<ErrorKind> failures;
    client_bus_.subscribe<UploadFailedEvent>([&](const UploadFailedEvent& e) {
        failures.push_back(e.error.kind);
    });

    auto result = controller.start_upload(make_source(4096));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Finalization);
    EXPECT_NE(result.error().message.find("video_id"), std::string::npos);
    EXPECT_EQ(result.error().offset, 4096u);
    EXPECT_EQ(controller.status(), UploadStatus::Failed);
    EXPECT_EQ(failures, (std::vector<ErrorKind>{ErrorKind::Finalization}));
}

TEST_F(HttpUploadTest, NonStringFileNameIsQueryError) {
    mistyped_replies_.store(true);
    HttpUploadApi api(config_);

    auto status = api.query_session("session-7");
    ASSERT_TRUE(status.is_error());
    EXPECT_NE(status.error().find("file_name"), std::string::npos);

    ResumeNegotiator negotiator(api, client_bus_, upload_config_);
    auto resumed = negotiator.resume("session-7", make_source(2048));
    ASSERT_TRUE(resumed.is_error());
    EXPECT_EQ(resumed.error().kind, ErrorKind::ResumeQuery);
}

TEST_F(HttpUploadTest, ResumeOfUnknownSessionIsResumeQueryError) {
    HttpUploadApi api(config_);
    ResumeNegotiator negotiator(api, client_bus_, upload_config_);

    auto resumed = negotiator.resume("does-not-exist", make_source(4096));

    ASSERT_TRUE(resumed.is_error());
    EXPECT_EQ(resumed.error().kind, ErrorKind::ResumeQuery);
}

TEST_F(HttpUploadTest, UnreachableServerFailsSessionCreation) {
    // Bind and release a port so that nothing listens on it
    asio::io_context scratch;
    asio::ip::tcp::acceptor listener(scratch, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    vidup::ClientConfig closed = config_;
    closed.port = listener.local_endpoint().port();
    listener.close();

    HttpUploadApi api(closed);
    UploadController controller(api, client_bus_, upload_config_);

    auto result = controller.start_upload(make_source(4096));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SessionCreation);
    EXPECT_EQ(controller.status(), UploadStatus::Failed);
}

TEST_F(HttpUploadTest, MalformedRequestGetsBadRequest) {
    vidup::network::Socket socket;
    ASSERT_TRUE(socket.connect("127.0.0.1", server_->get_port()).is_ok());
    ASSERT_TRUE(socket.set_timeout(std::chrono::milliseconds(5000)).is_ok());

    const std::string garbage = "not-http\r\n\r\n";
    ASSERT_TRUE(socket.send_all(std::vector<uint8_t>(garbage.begin(), garbage.end())).is_ok());

    std::string received;
    while (true) {
        auto chunk = socket.receive(4096);
        ASSERT_TRUE(chunk.is_ok()) << chunk.error();
        if (chunk.value().empty()) {
            break;
        }
        received.append(chunk.value().begin(), chunk.value().end());
    }

    EXPECT_EQ(received.rfind("HTTP/1.1 400", 0), 0u);
}
