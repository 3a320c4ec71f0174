#include <gtest/gtest.h>
#include "../../src/browser/launcher/browser_launcher.hpp"
#include "../../src/core/logger/logger.hpp"

using namespace Trawl::Browser::Launcher;

TEST(LauncherTest, FindBrowser) {
    std::string path = BrowserLauncher::find_browser();
#ifdef __APPLE__
    if (!path.empty()) {
        EXPECT_TRUE(path.find("Contents/MacOS") != std::string::npos || path.find("/usr/local/bin") != std::string::npos);
    }
#else
    if (!path.empty()) {
        EXPECT_EQ(path.front(), '/');
    }
#endif
}

TEST(LauncherTest, LaunchSmoke) {
    Trawl::Core::Logger::set_level(Trawl::Core::LOG_NONE);
    bool success = BrowserLauncher::launch("/non/existent/path", 9999, true);
    EXPECT_FALSE(success);
    EXPECT_FALSE(BrowserLauncher::is_running());
    BrowserLauncher::cleanup();
    Trawl::Core::Logger::set_level(Trawl::Core::LOG_ALL);
}
