#pragma once
#include <string>
#include <vector>

namespace Trawl {
namespace Browser {
namespace Launcher {

class BrowserLauncher {
public:
    static std::string find_browser();
    static bool        launch(const std::string& path, int port, bool headless);
    static bool        is_running();
    static void        cleanup();

private:
    static std::vector<std::string> get_search_paths();
};

}  // namespace Launcher
}  // namespace Browser
}  // namespace Trawl
