#include "browser_launcher.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <vector>
#include "../../core/logger/logger.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Trawl {
namespace Browser {
namespace Launcher {

using namespace Trawl::Core;

static pid_t browser_pid = -1;

std::vector<std::string> BrowserLauncher::get_search_paths() {
#ifdef __APPLE__
    return {"/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
            "/Applications/Chromium.app/Contents/MacOS/Chromium",
            "/opt/homebrew/bin/chromium",
            "/usr/local/bin/chromium"};
#else
    return {"/usr/bin/google-chrome",
            "/usr/bin/google-chrome-stable",
            "/usr/bin/chromium-browser",
            "/usr/bin/chromium",
            "/snap/bin/chromium"};
#endif
}

std::string BrowserLauncher::find_browser() {
    for (const auto& path : get_search_paths()) {
        if (std::filesystem::exists(path))
            return path;
    }
    return "";
}

bool BrowserLauncher::is_running() {
    return browser_pid > 0;
}

bool BrowserLauncher::launch(const std::string& path, int port, bool headless) {
    if (browser_pid != -1)
        return true;

    if (path.empty() || !std::filesystem::exists(path)) {
        Logger::error("Browser path does not exist: " + path);
        return false;
    }

    std::string user_data_path = "/tmp/trawl_browser_" + std::to_string(getpid());
    std::error_code ec;
    std::filesystem::create_directories(user_data_path, ec);
    if (ec) {
        Logger::error("Cannot create browser profile dir " + user_data_path + ": " + ec.message());
        return false;
    }

    std::vector<std::string> arg_strings = {path,
                                            "--headless=new",
                                            "--disable-gpu",
                                            "--disable-extensions",
                                            "--disable-dev-shm-usage",
                                            "--disable-renderer-backgrounding",
                                            "--window-size=1920,1080",
                                            "--hide-scrollbars",
                                            "--disable-notifications",
                                            "--no-sandbox",
                                            "--remote-debugging-port=" + std::to_string(port),
                                            "--user-data-dir=" + user_data_path,
                                            "--remote-allow-origins=*"};

    if (!headless) {
        auto it = std::find(arg_strings.begin(), arg_strings.end(), "--headless=new");
        if (it != arg_strings.end())
            arg_strings.erase(it);
    }

    browser_pid = fork();
    if (browser_pid < 0) {
        Logger::error("fork() failed while launching browser");
        browser_pid = -1;
        return false;
    }

    if (browser_pid == 0) {
        std::vector<const char*> args;
        for (const auto& s : arg_strings)
            args.push_back(s.c_str());
        args.push_back(nullptr);

        if (freopen("/dev/null", "w", stdout) == NULL) {
            _exit(1);
        }
        if (freopen("/dev/null", "w", stderr) == NULL) {
            _exit(1);
        }

        execv(path.c_str(), const_cast<char* const*>(args.data()));
        _exit(1);
    }
    Logger::info("Launched browser: " + path + " (PID: " + std::to_string(browser_pid) +
                 ", CDP port " + std::to_string(port) + ")");

    // Give the DevTools endpoint time to come up.
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    return true;
}

void BrowserLauncher::cleanup() {
    if (browser_pid > 0) {
        Logger::info("Closing browser (PID: " + std::to_string(browser_pid) + ")...");
        kill(browser_pid, SIGTERM);
        waitpid(browser_pid, nullptr, 0);
        browser_pid = -1;
    }
}

}  // namespace Launcher
}  // namespace Browser
}  // namespace Trawl
