#include "Logger.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

TEST(LoggerTest, RootLoggerWorks) {
    auto rootLogger = bz::logging::getRootLogger();
    EXPECT_EQ(rootLogger.getFullName(), "");
    EXPECT_NO_THROW({
        rootLogger.debug << "Debug message";
        rootLogger.info << "Info message";
        rootLogger.warning << "Warning message";
        rootLogger.error << "Error message";
        rootLogger.critical << "Critical message";
    });
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
    auto namedLogger = bz::logging::getLogger("bazaar_test");
    EXPECT_EQ(namedLogger.getName(), "bazaar_test");
    EXPECT_NO_THROW(namedLogger.info << "Test message");
}

TEST(LoggerTest, SameNameReturnsSameLogger) {
    auto first = bz::logging::getLogger("same.name");
    auto second = bz::logging::getLogger("same.name");
    EXPECT_EQ(first, second);
    EXPECT_EQ(bz::logging::getLogger(".same.name"), first);
}

TEST(LoggerTest, ParseLevelIsCaseInsensitive) {
    bz::logging::Level level = bz::logging::Level::INFO;
    EXPECT_TRUE(bz::logging::parseLevel("debug", level));
    EXPECT_EQ(level, bz::logging::Level::DEBUG);
    EXPECT_TRUE(bz::logging::parseLevel("Warning", level));
    EXPECT_EQ(level, bz::logging::Level::WARNING);
    EXPECT_TRUE(bz::logging::parseLevel("CRITICAL", level));
    EXPECT_EQ(level, bz::logging::Level::CRITICAL);

    EXPECT_FALSE(bz::logging::parseLevel("verbose", level));
    EXPECT_EQ(level, bz::logging::Level::CRITICAL);
    EXPECT_EQ(bz::logging::levelToString(bz::logging::Level::ERROR), "ERROR");
}

TEST(LoggerTest, FileHandlerReceivesFilteredMessages) {
    const std::string path = "bazaar_logger_test.log";
    std::remove(path.c_str());

    auto fileLogger = bz::logging::getLogger("file_test");
    fileLogger.setPropagate(false);
    fileLogger.setLevel(bz::logging::Level::INFO);
    fileLogger.addFileHandler(path, bz::logging::Level::DEBUG);

    fileLogger.debug << "hidden debug line";
    fileLogger.info << "visible info line";
    fileLogger.warning << "visible warning line";
    fileLogger.clearHandlers();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str().find("hidden debug line"), std::string::npos);
    EXPECT_NE(content.str().find("[INFO] [file_test] visible info line"),
              std::string::npos);
    EXPECT_NE(content.str().find("visible warning line"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LoggerTest, FileHandlerThrowsOnUnwritablePath) {
    auto logger = bz::logging::getLogger("bad_file_test");
    EXPECT_THROW(logger.addFileHandler("/nonexistent_dir/sub/x.log"),
                 std::runtime_error);
}

TEST(LoggerTest, HierarchicalLoggerCreatesTree) {
    auto moduleA = bz::logging::getLogger("moduleA");
    auto service1 = bz::logging::getLogger("moduleA.service1");
    auto service2 = bz::logging::getLogger("moduleA.service2");

    auto root = bz::logging::getRootLogger();
    EXPECT_EQ(moduleA.getParent(), root);
    EXPECT_EQ(service1.getParent(), moduleA);
    EXPECT_EQ(service2.getParent(), moduleA);
    EXPECT_EQ(moduleA.getChildren().size(), 2u);
    EXPECT_EQ(service1.getFullName(), "moduleA.service1");
}

TEST(LoggerTest, ParentsAreCreatedOnDemand) {
    auto deep = bz::logging::getLogger("ondemand.middle.leaf");
    EXPECT_EQ(deep.getName(), "leaf");
    EXPECT_EQ(deep.getParent().getFullName(), "ondemand.middle");
    EXPECT_EQ(deep.getParent().getParent().getFullName(), "ondemand");
}

TEST(LoggerTest, RedirectMovesLoggerAndChildren) {
    auto root = bz::logging::getRootLogger();
    auto moduleA = bz::logging::getLogger("moveA");
    auto service1 = bz::logging::getLogger("moveA.service1");
    auto moduleB = bz::logging::getLogger("moveB");

    moduleA.redirectTo(moduleB);

    EXPECT_EQ(moduleA.getParent(), moduleB);
    EXPECT_EQ(service1.getParent(), moduleA);
    EXPECT_EQ(moduleB.getParent(), root);
    EXPECT_EQ(moduleB.getChildren().size(), 1u);
    EXPECT_EQ(service1.getFullName(), "moveB.moveA.service1");
}

TEST(LoggerTest, RedirectToMissingLoggerCreatesIt) {
    auto loggerA = bz::logging::getLogger("rename.A");

    loggerA.redirectTo("rename.C");

    EXPECT_EQ(loggerA.getName(), "A");
    EXPECT_EQ(loggerA.getFullName(), "rename.C.A");
    auto loggerC = bz::logging::getLogger("rename.C");
    EXPECT_EQ(loggerC, loggerA.getParent());
}

TEST(LoggerTest, PreventCircularRedirection) {
    auto loggerA = bz::logging::getLogger("loggerA");
    auto loggerB = bz::logging::getLogger("loggerB");
    auto loggerC = bz::logging::getLogger("loggerC");

    loggerA.redirectTo(loggerB);
    loggerB.redirectTo(loggerC);

    EXPECT_THROW(loggerC.redirectTo(loggerA), std::invalid_argument);
    EXPECT_THROW(loggerA.redirectTo(loggerA), std::invalid_argument);
}

TEST(LoggerTest, PropagationReachesParentHandlers) {
    const std::string path = "bazaar_logger_propagation.log";
    std::remove(path.c_str());

    auto parent = bz::logging::getLogger("prop");
    auto child = bz::logging::getLogger("prop.child");
    parent.setPropagate(false);
    parent.addFileHandler(path);

    EXPECT_TRUE(child.getPropagate());
    child.info << "from child";
    child.setPropagate(false);
    child.info << "not propagated";
    parent.clearHandlers();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[prop.child] from child"), std::string::npos);
    EXPECT_EQ(content.str().find("not propagated"), std::string::npos);
    std::remove(path.c_str());
}
