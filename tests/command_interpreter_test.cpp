#include "network/command_interpreter.hpp"
#include "network/session.hpp"
#include "storage/store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace flatkv::network {

// ── Fixture ───────────────────────────────────────────────────────────────────

class CommandInterpreterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("interpreter_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        store_ = std::make_shared<Store>(test_dir_ / "store.txt");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<Store> store_;
};

TEST_F(CommandInterpreterTest, RequiresStore) {
    EXPECT_THROW(CommandInterpreter{nullptr}, std::invalid_argument);
}

TEST_F(CommandInterpreterTest, FullScenario) {
    CommandInterpreter interp{store_};
    EXPECT_EQ(interp.execute("SET a 1"), "Added key 'a' with value '1'\n");
    EXPECT_EQ(interp.execute("GET a"), "1");
    EXPECT_EQ(interp.execute("REMOVE a"), "Removed key 'a'.\n");
    EXPECT_EQ(interp.execute("GET a"), "Key 'a' not found.");
    EXPECT_EQ(interp.execute("PRINT"), "Store is empty.\n");
}

TEST_F(CommandInterpreterTest, ArityErrorLeavesStoreUntouched) {
    CommandInterpreter interp{store_};
    EXPECT_EQ(interp.execute("SET onlykey"),
              "ERROR: SET command requires 2 arguments: key and value\n");
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_FALSE(std::filesystem::exists(store_->path()));
}

TEST_F(CommandInterpreterTest, UnknownVerb) {
    CommandInterpreter interp{store_};
    EXPECT_EQ(interp.execute("FOO bar"), "ERROR: Unknown command 'FOO'\n");
}

TEST_F(CommandInterpreterTest, EmptyLine) {
    CommandInterpreter interp{store_};
    EXPECT_EQ(interp.execute("   \n"), "ERROR: Empty command\n");
}

TEST_F(CommandInterpreterTest, RemoveMissingKey) {
    CommandInterpreter interp{store_};
    EXPECT_EQ(interp.execute("REMOVE ghost"), "Key 'ghost' not found.");
}

TEST_F(CommandInterpreterTest, PrintListsEntries) {
    CommandInterpreter interp{store_};
    (void)interp.execute("set b 2");
    (void)interp.execute("set a 1");
    EXPECT_EQ(interp.execute("print"),
              "[KEY]: a\t[VALUE]: 1\n[KEY]: b\t[VALUE]: 2\n");
}

TEST_F(CommandInterpreterTest, InstancesShareOneStore) {
    CommandInterpreter first{store_};
    CommandInterpreter second{store_};
    (void)first.execute("SET shared 42");
    EXPECT_EQ(second.execute("GET shared"), "42");
}

TEST_F(CommandInterpreterTest, DispatchParsedCommand) {
    CommandInterpreter interp{store_};
    EXPECT_EQ(interp.dispatch(SetCmd{"k", "v"}), "Added key 'k' with value 'v'\n");
    EXPECT_EQ(interp.dispatch(GetCmd{"k"}), "v");
}

// ── Session::respond ──────────────────────────────────────────────────────────

class SessionRespondTest : public CommandInterpreterTest {
protected:
    boost::asio::io_context ioc_;
};

TEST_F(SessionRespondTest, QuitEndsSessionWithoutTouchingStore) {
    Session session{boost::asio::ip::tcp::socket{ioc_}, store_};
    EXPECT_FALSE(session.respond("quit").has_value());
    EXPECT_FALSE(session.respond("QUIT\r\n").has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(SessionRespondTest, OtherChunksAreInterpreted) {
    Session session{boost::asio::ip::tcp::socket{ioc_}, store_};
    auto response = session.respond("SET x 9\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(*response, "Added key 'x' with value '9'\n");

    response = session.respond("\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(*response, "ERROR: Empty command\n");
}

} // namespace flatkv::network
