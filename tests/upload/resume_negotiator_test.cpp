#include "fake_upload_api.hpp"

#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include "vidup/upload/media_source.hpp"
#include "vidup/upload/resume_negotiator.hpp"
#include "vidup/upload/session_journal.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using vidup::events::EventBus;
using vidup::events::UploadProgressEvent;
using vidup::events::UploadResumedEvent;
using vidup::test::FakeUploadApi;
using vidup::upload::ErrorKind;
using vidup::upload::kMiB;
using vidup::upload::MemoryMediaSource;
using vidup::upload::ResumeNegotiator;
using vidup::upload::SessionJournal;
using vidup::upload::UploadConfig;
using vidup::upload::UploadMetadata;
using vidup::upload::UploadSession;
using vidup::upload::UploadStatus;

namespace {

std::shared_ptr<MemoryMediaSource> make_source(std::uint64_t size, const std::string& name = "talk.mp4") {
    std::vector<std::uint8_t> data(size);
    for (std::uint64_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i / kMiB) & 0xff);
    }
    return std::make_shared<MemoryMediaSource>(name, std::move(data));
}

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() / fs::path("vidup_resume_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

class ResumeNegotiatorTest : public ::testing::Test {
protected:
    EventBus bus;
    FakeUploadApi api;
    UploadConfig config{4 * kMiB, 1 * kMiB};
};

} // namespace

TEST_F(ResumeNegotiatorTest, ResumesFromServerOffset) {
    api.seed_session("abc", 10 * kMiB, 6 * kMiB, "talk.mp4");
    std::vector<UploadResumedEvent> resumed;
    std::vector<int> percents;
    bus.subscribe<UploadResumedEvent>([&](const UploadResumedEvent& e) { resumed.push_back(e); });
    bus.subscribe<UploadProgressEvent>([&](const UploadProgressEvent& e) { percents.push_back(e.percent); });

    ResumeNegotiator negotiator(api, bus, config);
    auto controller = negotiator.resume("abc", make_source(10 * kMiB), UploadMetadata{"Keynote", ""});

    ASSERT_TRUE(controller.is_ok()) << controller.error().describe();
    auto& active = *controller.value();
    EXPECT_EQ(active.status(), UploadStatus::Paused);
    EXPECT_EQ(active.session().session_id, "abc");
    EXPECT_EQ(active.session().offset, 6 * kMiB);
    EXPECT_EQ(active.percent(), 60);
    ASSERT_EQ(resumed.size(), 1u);
    EXPECT_EQ(resumed[0].offset, 6 * kMiB);
    EXPECT_EQ(resumed[0].resume_percent, 60);
    EXPECT_EQ(api.query_calls, (std::vector<std::string>{"abc"}));
    EXPECT_TRUE(api.chunk_calls.empty());

    auto result = active.resume();

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(active.status(), UploadStatus::Completed);
    ASSERT_EQ(api.chunk_calls.size(), 1u);
    EXPECT_EQ(api.chunk_calls[0].start_offset, 6 * kMiB);
    EXPECT_EQ(api.chunk_calls[0].length, 4 * kMiB);
    EXPECT_EQ(api.chunk_calls[0].first_byte, 6);
    ASSERT_EQ(api.finish_calls.size(), 1u);
    EXPECT_EQ(api.finish_calls[0].session_id, "abc");
    EXPECT_EQ(api.finish_calls[0].title, "Keynote");
    EXPECT_EQ(percents, (std::vector<int>{60, 100}));
}

TEST_F(ResumeNegotiatorTest, FullyCommittedSessionOnlyFinalizes) {
    api.seed_session("done", 10 * kMiB, 10 * kMiB, "talk.mp4");
    ResumeNegotiator negotiator(api, bus, config);

    auto controller = negotiator.resume("done", make_source(10 * kMiB));
    ASSERT_TRUE(controller.is_ok());
    ASSERT_TRUE(controller.value()->resume().is_ok());

    EXPECT_TRUE(api.chunk_calls.empty());
    EXPECT_EQ(api.finish_calls.size(), 1u);
    EXPECT_EQ(controller.value()->status(), UploadStatus::Completed);
}

TEST_F(ResumeNegotiatorTest, ServerTotalWinsOverSourceSize) {
    // A different local file is still accepted; the server's total bounds the transfer
    api.seed_session("abc", 10 * kMiB, 8 * kMiB, "talk.mp4");
    ResumeNegotiator negotiator(api, bus, config);

    auto controller = negotiator.resume("abc", make_source(12 * kMiB, "other.mp4"));

    ASSERT_TRUE(controller.is_ok());
    EXPECT_EQ(controller.value()->session().total_size, 10 * kMiB);
    EXPECT_EQ(controller.value()->session().file_name, "talk.mp4");

    ASSERT_TRUE(controller.value()->resume().is_ok());
    ASSERT_EQ(api.chunk_calls.size(), 1u);
    EXPECT_EQ(api.chunk_calls[0].length, 2 * kMiB);
}

TEST_F(ResumeNegotiatorTest, QueryFailureIsResumeQueryError) {
    api.query_error = "HTTP 404: Unknown session";
    ResumeNegotiator negotiator(api, bus, config);

    auto controller = negotiator.resume("gone", make_source(10 * kMiB));

    ASSERT_TRUE(controller.is_error());
    EXPECT_EQ(controller.error().kind, ErrorKind::ResumeQuery);
    EXPECT_EQ(controller.error().session_id, "gone");
    EXPECT_NE(controller.error().message.find("404"), std::string::npos);
}

TEST_F(ResumeNegotiatorTest, RejectsInconsistentServerState) {
    ResumeNegotiator negotiator(api, bus, config);

    api.query_override = vidup::upload::SessionStatusResponse{12 * kMiB, 10 * kMiB, "talk.mp4"};
    auto past_end = negotiator.resume("abc", make_source(10 * kMiB));
    ASSERT_TRUE(past_end.is_error());
    EXPECT_EQ(past_end.error().kind, ErrorKind::ResumeQuery);

    api.query_override = vidup::upload::SessionStatusResponse{0, 0, "talk.mp4"};
    auto empty = negotiator.resume("abc", make_source(10 * kMiB));
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().kind, ErrorKind::ResumeQuery);
}

TEST_F(ResumeNegotiatorTest, RejectsMissingArgumentsWithoutQuerying) {
    ResumeNegotiator negotiator(api, bus, config);

    auto no_id = negotiator.resume("", make_source(10 * kMiB));
    ASSERT_TRUE(no_id.is_error());
    EXPECT_EQ(no_id.error().kind, ErrorKind::ResumeQuery);

    auto no_source = negotiator.resume("abc", nullptr);
    ASSERT_TRUE(no_source.is_error());
    EXPECT_EQ(no_source.error().kind, ErrorKind::ResumeQuery);

    EXPECT_TRUE(api.query_calls.empty());
}

TEST_F(ResumeNegotiatorTest, ResumedTransferFailureReportsServerOffset) {
    api.seed_session("abc", 10 * kMiB, 2 * kMiB, "talk.mp4");
    api.fail_chunk_number = 2;
    ResumeNegotiator negotiator(api, bus, config);

    auto controller = negotiator.resume("abc", make_source(10 * kMiB));
    ASSERT_TRUE(controller.is_ok());
    auto result = controller.value()->resume();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Transfer);
    EXPECT_EQ(result.error().offset, 6 * kMiB);
    EXPECT_EQ(controller.value()->status(), UploadStatus::Failed);
}

TEST_F(ResumeNegotiatorTest, ResumeFromJournalUsesStoredSessionAndMetadata) {
    const auto dir = create_temp_dir();
    SessionJournal journal(dir);

    UploadSession stored;
    stored.session_id = "abc";
    stored.file_name = "talk.mp4";
    stored.total_size = 10 * kMiB;
    stored.offset = 4 * kMiB;
    stored.status = UploadStatus::Paused;
    stored.metadata = UploadMetadata{"Keynote", "Day one"};
    ASSERT_TRUE(journal.save("keynote", stored).is_ok());

    // The server has moved further than the journal recorded
    api.seed_session("abc", 10 * kMiB, 8 * kMiB, "talk.mp4");

    ResumeNegotiator negotiator(api, bus, config, &journal);
    auto controller = negotiator.resume_from_journal("keynote", make_source(10 * kMiB),
                                                     UploadMetadata{"", "Edited"});

    ASSERT_TRUE(controller.is_ok()) << controller.error().describe();
    EXPECT_EQ(controller.value()->session().offset, 8 * kMiB);
    EXPECT_EQ(controller.value()->session().metadata.title, "Keynote");
    EXPECT_EQ(controller.value()->session().metadata.description, "Edited");

    ASSERT_TRUE(controller.value()->resume().is_ok());
    ASSERT_EQ(api.finish_calls.size(), 1u);
    EXPECT_EQ(api.finish_calls[0].title, "Keynote");
    EXPECT_EQ(api.finish_calls[0].description, "Edited");
    EXPECT_FALSE(journal.contains("keynote"));

    fs::remove_all(dir);
}

TEST_F(ResumeNegotiatorTest, ResumeFromJournalNeedsJournalAndEntry) {
    ResumeNegotiator without_journal(api, bus, config);
    auto no_journal = without_journal.resume_from_journal("keynote", make_source(10 * kMiB));
    ASSERT_TRUE(no_journal.is_error());
    EXPECT_EQ(no_journal.error().kind, ErrorKind::ResumeQuery);

    const auto dir = create_temp_dir();
    SessionJournal journal(dir);
    ResumeNegotiator negotiator(api, bus, config, &journal);
    auto missing = negotiator.resume_from_journal("unknown", make_source(10 * kMiB));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::ResumeQuery);
    EXPECT_TRUE(api.query_calls.empty());

    fs::remove_all(dir);
}
