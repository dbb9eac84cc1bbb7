#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/BuildCommand.hpp"
#include "cli/commands/CleanCommand.hpp"
#include "cli/commands/HelpCommand.hpp"

using namespace folio;

class HelpCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        // The factory is process-wide; earlier tests may have registered these
        auto& f = CommandFactory::instance();
        if (!f.contains("help")) f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
        if (!f.contains("build")) f.registerCreator("build", [] { return std::make_unique<BuildCommand>(); });
        if (!f.contains("clean")) f.registerCreator("clean", [] { return std::make_unique<CleanCommand>(); });
    }

    AppContext ctx;
};

// Test: Overview lists registered commands
TEST_F(HelpCommandTest, ListsCommands) {
    HelpCommand cmd;
    ::testing::internal::CaptureStdout();
    auto result = cmd.execute(ctx, {});
    std::string out = ::testing::internal::GetCapturedStdout();
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(out.find("usage: folio <command> [options]"), std::string::npos);
    EXPECT_NE(out.find("build"), std::string::npos);
    EXPECT_NE(out.find("clean"), std::string::npos);
}

// Test: Detail for one command shows its options
TEST_F(HelpCommandTest, CommandDetail) {
    HelpCommand cmd;
    ::testing::internal::CaptureStdout();
    auto result = cmd.execute(ctx, {"build"});
    std::string out = ::testing::internal::GetCapturedStdout();
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(out.find("SYNOPSIS:"), std::string::npos);
    EXPECT_NE(out.find("--jobs"), std::string::npos);
}

// Test: Invoker turns exceptions into InternalError
TEST_F(HelpCommandTest, InvokerCatchesExceptions) {
    class ThrowingCommand : public HelpCommand {
    public:
        Expected<void> execute(AppContext&, const std::vector<std::string>&) override {
            throw std::runtime_error("boom");
        }
    };
    ThrowingCommand cmd;
    CommandInvoker invoker;
    auto result = invoker.invoke(cmd, ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InternalError);
    EXPECT_NE(result.error().message.find("boom"), std::string::npos);
}

// Test: A name can only be registered once, and lookups of unknown names fail
TEST_F(HelpCommandTest, FactoryRejectsDuplicates) {
    auto& f = CommandFactory::instance();
    EXPECT_THROW(f.registerCreator("build", [] { return std::make_unique<CleanCommand>(); }),
                 std::logic_error);
    EXPECT_STREQ(f.create("build")->name(), "build");
    EXPECT_EQ(f.create("deploy"), nullptr);
    EXPECT_FALSE(f.contains("deploy"));
}

// Test: Commands are listed in name order
TEST_F(HelpCommandTest, FactoryListsByName) {
    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);
    ASSERT_GE(cmds.size(), 3u);
    for (size_t i = 1; i < cmds.size(); ++i) {
        EXPECT_LT(std::string(cmds[i - 1]->name()), std::string(cmds[i]->name()));
    }
}
