#pragma once
#include <httplib.h>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "../engine/job/job_registry.hpp"

namespace Trawl {
namespace Api {

struct ApiSettings {
    std::string                        default_model;
    std::string                        version;
    std::map<std::string, std::string> models;  // id -> display name
};

// HTTP transport over the JobRegistry. Each request is answered on one of
// httplib's own threads; job work runs on the shared Runtime.
class ApiServer {
public:
    ApiServer(Engine::JobRegistry& registry, ApiSettings settings);

    ApiServer(const ApiServer&)            = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Binds without serving. Port 0 picks a free port. Returns the bound port or -1.
    int bind(const std::string& host, int port);

    // Blocks until stop().
    bool serve();
    void stop();

    bool is_running() const;

    // Mode-shaped response body for a finished job, without the HTTP status.
    static nlohmann::json mode_payload(const Engine::JobResult& result);

    static int http_status(const Engine::JobResult& result);

private:
    Engine::JobRegistry& registry_;
    ApiSettings          settings_;
    httplib::Server      server_;

    void register_routes();

    void handle_submit(Engine::Mode mode, const httplib::Request& req, httplib::Response& res);
    void handle_stream(const httplib::Request& req, httplib::Response& res);
    void handle_get_job(const std::string& id, const httplib::Request& req, httplib::Response& res);
    void handle_cancel(const std::string& id, httplib::Response& res);
    void handle_purge(const std::string& id, httplib::Response& res);
    void handle_list(httplib::Response& res);
};

}  // namespace Api
}  // namespace Trawl
