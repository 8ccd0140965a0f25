// =============================================================================
// Session Store Unit Tests
// Validates persistence round trips, corrupt-file tolerance and write-through
// =============================================================================

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "session_store.hpp"
#include "test_helpers.hpp"

using namespace maxwire;
using namespace maxwire::test;
using nlohmann::json;

namespace {

auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in{path};
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out{path, std::ios::trunc};
    out << text;
}

}  // namespace

// -----------------------------------------------------------------------------
// Create_FillsDeviceFieldsAndRandomId
// -----------------------------------------------------------------------------
TEST(SessionTest, Create_FillsDeviceFieldsAndRandomId) {
    svckit::DeviceProfile device;
    auto a = Session::create(device);
    auto b = Session::create(device);

    EXPECT_EQ(a.device_id.size(), 36u);
    EXPECT_EQ(a.device_id[14], '4');
    EXPECT_NE(a.device_id, b.device_id);
    EXPECT_EQ(a.device_type, "ANDROID");
    EXPECT_EQ(a.locale, "ru");
    EXPECT_EQ(a.protocol_version, 11);
    EXPECT_FALSE(a.token.has_value());
}

// -----------------------------------------------------------------------------
// UserAgentPayload_UsesWireFieldNames
// -----------------------------------------------------------------------------
TEST(SessionTest, UserAgentPayload_UsesWireFieldNames) {
    auto session = Session::create(svckit::DeviceProfile{});
    auto payload = session.user_agent_payload();

    EXPECT_EQ(payload.at("deviceType"), "ANDROID");
    EXPECT_EQ(payload.at("appVersion"), "25.12.3");
    EXPECT_EQ(payload.at("headerUserAgent"), session.user_agent);
    EXPECT_EQ(payload.at("timezone"), "Europe/Moscow");
    EXPECT_TRUE(payload.contains("deviceLocale"));
}

// -----------------------------------------------------------------------------
// SaveLoad_WithoutToken_RoundTrips
// -----------------------------------------------------------------------------
TEST(SessionStoreTest, SaveLoad_WithoutToken_RoundTrips) {
    TempDir dir;
    auto path = dir.file("session.json");
    auto session = Session::create(svckit::DeviceProfile{});

    SessionStore::save(path, session);

    auto on_disk = json::parse(read_file(path));
    EXPECT_TRUE(on_disk.at("token").is_null());

    auto loaded = SessionStore::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, session);
    EXPECT_FALSE(loaded->token.has_value());
}

// -----------------------------------------------------------------------------
// SaveLoad_WithTokenAndPhone_RoundTrips
// -----------------------------------------------------------------------------
TEST(SessionStoreTest, SaveLoad_WithTokenAndPhone_RoundTrips) {
    TempDir dir;
    auto path = dir.file("session.json");
    auto session = Session::create(svckit::DeviceProfile{});
    session.token = "An_tok3n";
    session.phone = "+79990000000";

    SessionStore::save(path, session);
    auto loaded = SessionStore::load(path);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, session.token);
    EXPECT_EQ(loaded->phone, session.phone);
}

// -----------------------------------------------------------------------------
// Load_MissingFile_ReturnsNullopt
// -----------------------------------------------------------------------------
TEST(SessionStoreTest, Load_MissingFile_ReturnsNullopt) {
    TempDir dir;
    EXPECT_FALSE(SessionStore::load(dir.file("absent.json")).has_value());
}

// -----------------------------------------------------------------------------
// Load_CorruptFile_ReturnsNullopt
// -----------------------------------------------------------------------------
TEST(SessionStoreTest, Load_CorruptFile_ReturnsNullopt) {
    TempDir dir;
    auto path = dir.file("session.json");

    write_file(path, "{ this is not json");
    EXPECT_FALSE(SessionStore::load(path).has_value());

    write_file(path, R"({"device_id": 42})");
    EXPECT_FALSE(SessionStore::load(path).has_value());

    auto partial = Session::create(svckit::DeviceProfile{}).to_json();
    partial.erase("version");
    write_file(path, partial.dump());
    EXPECT_FALSE(SessionStore::load(path).has_value());
}

// -----------------------------------------------------------------------------
// FromJson_BadField_ThrowsSessionCorrupt
// -----------------------------------------------------------------------------
TEST(SessionStoreTest, FromJson_BadField_ThrowsSessionCorrupt) {
    auto j = Session::create(svckit::DeviceProfile{}).to_json();
    j["token"] = 17;
    EXPECT_THROW((void)Session::from_json(j), protocol::SessionCorruptError);
    EXPECT_THROW((void)Session::from_json(json::array()), protocol::SessionCorruptError);
}

// -----------------------------------------------------------------------------
// Save_CreatesDirectoriesAndLeavesNoTempFile
// -----------------------------------------------------------------------------
TEST(SessionStoreTest, Save_CreatesDirectoriesAndLeavesNoTempFile) {
    TempDir dir;
    auto path = dir.path() / "nested" / "state" / "session.json";

    SessionStore::save(path, Session::create(svckit::DeviceProfile{}));

    EXPECT_TRUE(std::filesystem::exists(path));
    auto tmp = path;
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

// -----------------------------------------------------------------------------
// Save_ReplacesPreviousContent
// -----------------------------------------------------------------------------
TEST(SessionStoreTest, Save_ReplacesPreviousContent) {
    TempDir dir;
    auto path = dir.file("session.json");
    auto session = Session::create(svckit::DeviceProfile{});

    session.token = "first";
    SessionStore::save(path, session);
    session.token = "second";
    SessionStore::save(path, session);

    auto loaded = SessionStore::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, std::optional<std::string>{"second"});
}

// -----------------------------------------------------------------------------
// Keeper_LoadOrCreate_PersistsNewSession
// -----------------------------------------------------------------------------
TEST(SessionKeeperTest, Keeper_LoadOrCreate_PersistsNewSession) {
    TempDir dir;
    auto path = dir.file("session.json");

    SessionKeeper keeper{path};
    EXPECT_FALSE(keeper.loaded());
    keeper.load_or_create(svckit::DeviceProfile{});
    ASSERT_TRUE(keeper.loaded());

    auto on_disk = SessionStore::load(path);
    ASSERT_TRUE(on_disk.has_value());
    EXPECT_EQ(on_disk->device_id, keeper.snapshot().device_id);
}

// -----------------------------------------------------------------------------
// Keeper_LoadOrCreate_ReusesExistingDevice
// -----------------------------------------------------------------------------
TEST(SessionKeeperTest, Keeper_LoadOrCreate_ReusesExistingDevice) {
    TempDir dir;
    auto path = dir.file("session.json");
    auto existing = Session::create(svckit::DeviceProfile{});
    existing.token = "stored";
    SessionStore::save(path, existing);

    SessionKeeper keeper{path};
    keeper.load_or_create(svckit::DeviceProfile{});
    EXPECT_EQ(keeper.snapshot(), existing);
}

// -----------------------------------------------------------------------------
// Keeper_SetToken_WritesThrough
// -----------------------------------------------------------------------------
TEST(SessionKeeperTest, Keeper_SetToken_WritesThrough) {
    TempDir dir;
    auto path = dir.file("session.json");

    SessionKeeper keeper{path};
    keeper.load_or_create(svckit::DeviceProfile{});
    keeper.set_token(std::string{"fresh"});
    keeper.set_phone(std::string{"+70000000000"});

    auto loaded = SessionStore::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token, std::optional<std::string>{"fresh"});
    EXPECT_EQ(loaded->phone, std::optional<std::string>{"+70000000000"});

    keeper.set_token(std::nullopt);
    loaded = SessionStore::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->token.has_value());
}

// -----------------------------------------------------------------------------
// Keeper_SnapshotBeforeLoad_Throws
// -----------------------------------------------------------------------------
TEST(SessionKeeperTest, Keeper_SnapshotBeforeLoad_Throws) {
    TempDir dir;
    SessionKeeper keeper{dir.file("session.json")};
    EXPECT_THROW((void)keeper.snapshot(), protocol::Error);
}
