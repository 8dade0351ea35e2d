#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include <unistd.h>

#include "lw/watch/location_watcher.hpp"

namespace fs = std::filesystem;
using namespace lw::watch;
using namespace std::chrono_literals;
using lw::foundation::ErrorCode;
using lw::foundation::ReceiveStatus;

namespace {

// Long enough for the worker to settle its watches.
constexpr auto kQuietWindow = 100ms;
constexpr auto kEventTimeout = 2s;

}  // namespace

class LocationWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = fs::temp_directory_path() / (std::string("lw_test_") + info->name());
        fs::remove_all(tmpDir_);
        fs::create_directories(tmpDir_);
    }

    void TearDown() override {
        watcher_.reset();
        std::error_code ec;
        fs::remove_all(tmpDir_, ec);
    }

    fs::path expand(const fs::path& relative) const { return tmpDir_ / relative; }

    void createFile(const fs::path& relative) {
        auto path = expand(relative);
        fs::create_directories(path.parent_path());
        std::ofstream ofs(path);
    }

    void appendToFile(const fs::path& relative, const std::string& data) {
        std::ofstream ofs(expand(relative), std::ios::app);
        ofs << data;
    }

    void openWatcher(const fs::path& relative, std::stop_token cancel = {}) {
        auto opened = LocationWatcher::open(expand(relative), std::move(cancel));
        ASSERT_TRUE(opened.hasValue()) << opened.error().message();
        watcher_ = std::move(opened).value();
        events_ = watcher_->events();
    }

    /// Next event, or std::nullopt on timeout or a closed stream.
    std::optional<WatchEvent> nextEvent(std::chrono::milliseconds timeout) {
        std::optional<WatchEvent> out;
        lastStatus_ = events_.receiveFor(timeout, out);
        return out;
    }

    void expectQuiet() {
        auto event = nextEvent(kQuietWindow);
        EXPECT_EQ(lastStatus_, ReceiveStatus::Timeout)
            << "unexpected " << (event ? toString(*event) : "close");
    }

    void expectEvent(WatchEvent expected) {
        auto event = nextEvent(kEventTimeout);
        ASSERT_TRUE(event.has_value()) << "expected " << toString(expected);
        EXPECT_EQ(*event, expected) << "got " << toString(*event);
    }

    /// Close the watcher and check the stream ends.
    void closeAndExpectEnd() {
        watcher_->close();
        EXPECT_TRUE(watcher_->isClosed());
        for (int i = 0; i < 16; ++i) {
            nextEvent(kEventTimeout);
            if (lastStatus_ != ReceiveStatus::Value) {
                break;
            }
        }
        EXPECT_EQ(lastStatus_, ReceiveStatus::Closed);
    }

    fs::path tmpDir_;
    std::unique_ptr<LocationWatcher> watcher_;
    lw::foundation::Receiver<WatchEvent> events_;
    ReceiveStatus lastStatus_ = ReceiveStatus::Timeout;
};

// --- Construction ---

TEST_F(LocationWatcherTest, EmptyPathIsResolutionError) {
    auto opened = LocationWatcher::open("");
    ASSERT_TRUE(opened.hasError());
    EXPECT_EQ(opened.error().code(), ErrorCode::ResolutionFailed);
}

TEST_F(LocationWatcherTest, RelativePathIsMadeAbsolute) {
    auto opened = LocationWatcher::open("relative/config.yaml");
    ASSERT_TRUE(opened.hasValue());
    auto watcher = std::move(opened).value();
    EXPECT_TRUE(watcher->target().is_absolute());
    EXPECT_EQ(watcher->target(), fs::current_path() / "relative/config.yaml");
}

TEST_F(LocationWatcherTest, TrailingSeparatorIsDropped) {
    auto opened = LocationWatcher::open(tmpDir_ / "dir/");
    ASSERT_TRUE(opened.hasValue());
    EXPECT_EQ(opened.value()->target(), tmpDir_ / "dir");
}

// --- Transitions of an existing file ---

TEST_F(LocationWatcherTest, ModifyingExistingFileEmitsUpdated) {
    createFile("path/to/file.yaml");
    openWatcher("path/to/file.yaml");
    expectQuiet();

    appendToFile("path/to/file.yaml", "aaa\n");
    expectEvent(WatchEvent::Updated);

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, EachSeparateWriteEmitsOneUpdated) {
    createFile("path/to/file.yaml");
    openWatcher("path/to/file.yaml");
    expectQuiet();

    for (int i = 0; i < 3; ++i) {
        appendToFile("path/to/file.yaml", "line " + std::to_string(i) + "\n");
        expectEvent(WatchEvent::Updated);
        expectQuiet();
    }

    createFile("path/to/sibling.yaml");
    appendToFile("path/to/sibling.yaml", "unrelated\n");
    expectQuiet();

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, DeletingExistingFileEmitsDeleted) {
    createFile("path/to/file.yaml");
    openWatcher("path/to/file.yaml");
    expectQuiet();

    fs::remove(expand("path/to/file.yaml"));
    expectEvent(WatchEvent::Deleted);
    expectQuiet();

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, DeletingParentEmitsDeletedOnce) {
    createFile("path/to/file.yaml");
    openWatcher("path/to/file.yaml");
    expectQuiet();

    fs::remove_all(expand("path/to"));
    expectEvent(WatchEvent::Deleted);
    expectQuiet();

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, DeletingGrandparentEmitsDeletedOnce) {
    createFile("path/to/intermediate/file.yaml");
    openWatcher("path/to/intermediate/file.yaml");
    expectQuiet();

    fs::remove_all(expand("path/to"));
    expectEvent(WatchEvent::Deleted);
    expectQuiet();

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, ReplacingFileByRenameEmitsUpdated) {
    createFile("path/file.yaml");
    openWatcher("path/file.yaml");
    expectQuiet();

    createFile("path/file.yaml.tmp");
    expectQuiet();
    fs::rename(expand("path/file.yaml.tmp"), expand("path/file.yaml"));
    expectEvent(WatchEvent::Updated);

    closeAndExpectEnd();
}

// --- Appearance of a missing target ---

TEST_F(LocationWatcherTest, CreateInExistingFolder) {
    fs::create_directories(expand("path/to"));
    openWatcher("path/to/file.yaml");
    expectQuiet();

    createFile("path/to/other_file.yaml");
    expectQuiet();

    createFile("path/to/file.yaml");
    expectEvent(WatchEvent::Created);

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, CreateBelowMissingFolders) {
    openWatcher("path/to/file.yaml");
    expectQuiet();

    fs::create_directories(expand("path/to"));
    expectQuiet();

    createFile("path/to/file.yaml");
    expectEvent(WatchEvent::Created);

    appendToFile("path/to/file.yaml", "x");
    expectEvent(WatchEvent::Updated);

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, MovingParentFolderIntoPlaceEmitsCreated) {
    createFile("path/not_to/file.yaml");
    openWatcher("path/to/file.yaml");
    expectQuiet();

    fs::rename(expand("path/not_to"), expand("path/to"));
    expectEvent(WatchEvent::Created);

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, MovingParentFolderOutOfPlaceEmitsDeleted) {
    createFile("path/to/file.yaml");
    openWatcher("path/to/file.yaml");
    expectQuiet();

    fs::rename(expand("path/to"), expand("path/not_to"));
    expectEvent(WatchEvent::Deleted);

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, MovingGrandparentOutOfPlaceEmitsDeleted) {
    createFile("path/to/intermediate/file.yaml");
    openWatcher("path/to/intermediate/file.yaml");
    expectQuiet();

    fs::rename(expand("path/to"), expand("path/not_to"));
    expectEvent(WatchEvent::Deleted);
    expectQuiet();

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, DeleteThenRecreateEmitsCreatedAgain) {
    createFile("path/file.yaml");
    openWatcher("path/file.yaml");
    expectQuiet();

    fs::remove_all(expand("path"));
    expectEvent(WatchEvent::Deleted);
    expectQuiet();

    createFile("path/file.yaml");
    expectEvent(WatchEvent::Created);

    closeAndExpectEnd();
}

// --- Recovery ---

TEST_F(LocationWatcherTest, RecoversOnceAnchorBecomesWatchable) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    fs::create_directories(expand("locked"));
    fs::permissions(expand("locked"), fs::perms::none);

    WatcherOptions options;
    options.initialBackoff = 5ms;
    options.maxBackoff = 20ms;
    auto opened = LocationWatcher::open(expand("locked/file.yaml"), {}, options);
    ASSERT_TRUE(opened.hasValue());
    watcher_ = std::move(opened).value();
    events_ = watcher_->events();

    // Registration keeps failing while the directory is unreadable.
    expectQuiet();

    fs::permissions(expand("locked"), fs::perms::owner_all);
    createFile("locked/file.yaml");
    expectEvent(WatchEvent::Created);
    expectQuiet();

    appendToFile("locked/file.yaml", "x");
    expectEvent(WatchEvent::Updated);

    closeAndExpectEnd();
}

// --- Metadata and lifecycle ---

TEST_F(LocationWatcherTest, CurrentInfoFollowsTarget) {
    openWatcher("file.yaml");
    EXPECT_FALSE(watcher_->currentInfo().has_value());
    expectQuiet();

    createFile("file.yaml");
    appendToFile("file.yaml", "hello");
    auto event = nextEvent(kEventTimeout);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, WatchEvent::Created);

    auto info = watcher_->currentInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->path, expand("file.yaml"));

    fs::remove(expand("file.yaml"));
    // A trailing Updated for the write may precede the deletion.
    for (int i = 0; i < 4; ++i) {
        event = nextEvent(kEventTimeout);
        if (!event || *event == WatchEvent::Deleted) {
            break;
        }
    }
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, WatchEvent::Deleted);
    EXPECT_FALSE(watcher_->currentInfo().has_value());

    closeAndExpectEnd();
}

TEST_F(LocationWatcherTest, CloseIsIdempotent) {
    openWatcher("file.yaml");
    watcher_->close();
    watcher_->close();
    EXPECT_TRUE(watcher_->isClosed());
    EXPECT_EQ(nextEvent(kEventTimeout), std::nullopt);
    EXPECT_EQ(lastStatus_, ReceiveStatus::Closed);
}

TEST_F(LocationWatcherTest, StopTokenClosesStream) {
    std::stop_source stop;
    openWatcher("file.yaml", stop.get_token());
    expectQuiet();

    stop.request_stop();
    EXPECT_EQ(nextEvent(kEventTimeout), std::nullopt);
    EXPECT_EQ(lastStatus_, ReceiveStatus::Closed);
    EXPECT_TRUE(watcher_->isClosed());
}

TEST_F(LocationWatcherTest, AlreadyStoppedTokenClosesImmediately) {
    std::stop_source stop;
    stop.request_stop();
    openWatcher("file.yaml", stop.get_token());

    EXPECT_EQ(nextEvent(kEventTimeout), std::nullopt);
    EXPECT_EQ(lastStatus_, ReceiveStatus::Closed);
}

TEST_F(LocationWatcherTest, StalledConsumerDoesNotBlockClose) {
    createFile("file.yaml");
    openWatcher("file.yaml");
    expectQuiet();

    // Nobody reads: the worker blocks handing over the second event.
    for (int i = 0; i < 5; ++i) {
        appendToFile("file.yaml", "x");
        std::this_thread::sleep_for(20ms);
    }

    auto start = std::chrono::steady_clock::now();
    watcher_->close();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}
